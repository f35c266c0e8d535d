#ifndef FACESIFT_EMBEDDING_H
#define FACESIFT_EMBEDDING_H

#include "image.h"
#include <vector>

namespace facesift {

// Face embeddings are plain float vectors (ncnn output layout)
using Embedding = std::vector<float>;

// One face as returned by the embedding model: its box and its vector
struct FaceEmbedding {
    Rect box;
    Embedding embedding;
};

float l2Norm(const Embedding& v);

// Scales v to unit length in place; a zero vector is left unchanged
void l2Normalize(Embedding& v);

// Copying variant of l2Normalize
Embedding normalized(Embedding v);

// Dot product of two equal-length vectors (cosine similarity when both
// are normalized). Throws std::invalid_argument on a length mismatch.
float dot(const Embedding& a, const Embedding& b);

} // namespace facesift

#endif // FACESIFT_EMBEDDING_H
