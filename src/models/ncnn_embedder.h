#ifndef FACESIFT_NCNN_EMBEDDER_H
#define FACESIFT_NCNN_EMBEDDER_H

#include "embedding_model.h"
#include "backend_chain.h"
#include <ncnn/net.h>
#include <memory>
#include <string>
#include <vector>

namespace facesift {

class Config;

struct NcnnEmbedderOptions {
    // Model base paths without extension (.param/.bin or .ncnn.param/.ncnn.bin).
    // Empty = MODELS_DIR/recognition and MODELS_DIR/detection.
    std::string recognition_model;
    std::string detection_model;

    std::vector<ComputeBackend> backends = {ComputeBackend::cpu()};
    int num_threads = 4;
    float detection_confidence = 0.8f;

    // [recognition] providers, model, detection_model, num_threads, detection_confidence
    static NcnnEmbedderOptions fromConfig(const Config& config);
};

// RetinaFace detection + recognition network (SFace/ArcFace style,
// "in0" -> "out0", 112x112 BGR input) on ncnn.
class NcnnEmbedder : public EmbeddingModel {
public:
    explicit NcnnEmbedder(NcnnEmbedderOptions options);

    NcnnEmbedder(const NcnnEmbedder&) = delete;
    NcnnEmbedder& operator=(const NcnnEmbedder&) = delete;

    // Loads both networks on the first backend that accepts them
    InitReport initialize();

    std::vector<FaceEmbedding> embed(const ImageView& bgr) override;

    bool available() const override { return loaded_; }

    std::string name() const override;

    // Embedding length (0 until known)
    size_t dimension() const { return encoding_dim_; }

    const InitReport& report() const { return report_; }

    // Reads the InnerProduct "out0" width from a .param file; 0 if not found
    static size_t parseModelOutputDim(const std::string& param_path);

private:
    bool loadOn(const ComputeBackend& backend, std::string& error);

    std::vector<Rect> detectFaces(const ImageView& bgr);
    Image alignFace(const ImageView& bgr, const Rect& face_rect);
    bool encodeFace(const Image& aligned, Embedding& encoding);

    NcnnEmbedderOptions options_;
    std::unique_ptr<ncnn::Net> recognition_net_;
    std::unique_ptr<ncnn::Net> detection_net_;
    std::string recognition_param_, recognition_bin_;
    std::string detection_param_, detection_bin_;
    std::string model_name_;
    size_t encoding_dim_ = 0;
    bool loaded_ = false;
    InitReport report_;
};

// Factory producing initialized embedders (one per enrollment thread)
EmbeddingModelFactory ncnnEmbedderFactory(const NcnnEmbedderOptions& options);

} // namespace facesift

#endif // FACESIFT_NCNN_EMBEDDER_H
