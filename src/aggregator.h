#ifndef FACESIFT_AGGREGATOR_H
#define FACESIFT_AGGREGATOR_H

#include "embedding.h"
#include <optional>
#include <vector>

namespace facesift {

constexpr float DEFAULT_OUTLIER_THRESHOLD = 0.3f;
constexpr int DEFAULT_OUTLIER_ITERATIONS = 2;

// Iterative outlier rejection over an enrollment batch.
// Each round takes the normalized mean of the kept samples and drops every
// sample whose dot product with it is below outlier_threshold. Stops when
// a round drops nothing, after max_iterations rounds, or once at most one
// sample is left. A round that would drop everything is discarded.
//
// Samples are normalized on entry; samples whose length differs from the
// first one are skipped.
std::vector<Embedding> filterOutliers(const std::vector<Embedding>& samples,
                                      float outlier_threshold = DEFAULT_OUTLIER_THRESHOLD,
                                      int max_iterations = DEFAULT_OUTLIER_ITERATIONS);

// Normalized mean of the samples that survive filterOutliers().
// std::nullopt when there is nothing to aggregate.
std::optional<Embedding> aggregateEmbeddings(const std::vector<Embedding>& samples,
                                             float outlier_threshold = DEFAULT_OUTLIER_THRESHOLD,
                                             int max_iterations = DEFAULT_OUTLIER_ITERATIONS);

// Normalized element-wise mean; samples must share one length
Embedding meanEmbedding(const std::vector<Embedding>& samples);

} // namespace facesift

#endif // FACESIFT_AGGREGATOR_H
