#ifndef FACESIFT_SUPPRESSION_H
#define FACESIFT_SUPPRESSION_H

#include "image.h"
#include <vector>

namespace facesift {

constexpr float DEFAULT_CONFIDENCE_THRESHOLD = 0.5f;
constexpr float DEFAULT_OVERLAP_THRESHOLD = 0.3f;

// A raw detector rectangle together with its heuristic confidence
struct DetectionCandidate {
    Rect rect;
    float confidence;
};

// Score every rect and keep those with confidence >= confidence_threshold.
// Input order is preserved.
std::vector<DetectionCandidate> scoreCandidates(
    const std::vector<Rect>& rects,
    float confidence_threshold = DEFAULT_CONFIDENCE_THRESHOLD);

// Greedy non-maximum suppression.
// Candidates are ordered by area (largest first, stable for equal areas);
// the largest remaining box is kept and every other box overlapping it by
// >= overlap_threshold is discarded, until nothing is left.
// Output is a subset of the input; confidence is not used for ordering.
std::vector<Rect> suppressOverlaps(
    const std::vector<DetectionCandidate>& candidates,
    float overlap_threshold = DEFAULT_OVERLAP_THRESHOLD);

// scoreCandidates() followed by suppressOverlaps()
std::vector<Rect> postProcessCandidates(
    const std::vector<Rect>& rects,
    float confidence_threshold = DEFAULT_CONFIDENCE_THRESHOLD,
    float overlap_threshold = DEFAULT_OVERLAP_THRESHOLD);

} // namespace facesift

#endif // FACESIFT_SUPPRESSION_H
