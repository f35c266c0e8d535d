#ifndef FACESIFT_EMBEDDING_MODEL_H
#define FACESIFT_EMBEDDING_MODEL_H

#include "../embedding.h"
#include "../image.h"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace facesift {

// Raised by any call that needs a model when no compute backend could load it
class ModelUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// External embedding model: finds the faces in a BGR image and returns one
// normalized embedding per face.
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    // Throws ModelUnavailableError when !available()
    virtual std::vector<FaceEmbedding> embed(const ImageView& bgr) = 0;

    virtual bool available() const = 0;

    virtual std::string name() const = 0;
};

// One instance per worker thread (ncnn nets are not shared)
using EmbeddingModelFactory = std::function<std::unique_ptr<EmbeddingModel>()>;

} // namespace facesift

#endif // FACESIFT_EMBEDDING_MODEL_H
