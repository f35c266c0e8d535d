#ifndef FACESIFT_FACE_SERVICE_H
#define FACESIFT_FACE_SERVICE_H

#include "detection_pipeline.h"
#include "gallery.h"
#include "identity_matcher.h"
#include "models/embedding_model.h"
#include <string>
#include <vector>

namespace facesift {

class Config;

struct RecognitionOptions {
    float threshold = DEFAULT_MATCH_THRESHOLD;

    // [recognition] threshold
    static RecognitionOptions fromConfig(const Config& config);
};

// Faces reported for one frame
struct FrameFaces {
    MatchStatus status = MatchStatus::NO_GALLERY;
    std::vector<Rect> faces;
    std::string identity;   // set when MATCHED
    float score = 0.0f;     // best match score (MATCHED / NO_MATCH)
};

// Per-frame entry point: every detected face while nobody is enrolled,
// otherwise only the best-matching enrolled face (or nothing).
class FaceService {
public:
    // `model` may be null, which behaves like an empty gallery
    FaceService(DetectionPipeline& pipeline, EmbeddingModel* model,
                GalleryRegistry& registry, RecognitionOptions options = RecognitionOptions());

    // frame: BGRA, BGR or GRAY.
    // Throws ModelUnavailableError when the gallery is non-empty and the
    // model could not be loaded.
    FrameFaces locate(const ImageView& frame, const DetectionOptions& options);

private:
    DetectionPipeline& pipeline_;
    EmbeddingModel* model_;
    GalleryRegistry& registry_;
    RecognitionOptions options_;
};

} // namespace facesift

#endif // FACESIFT_FACE_SERVICE_H
