#ifndef FACESIFT_CONFIDENCE_H
#define FACESIFT_CONFIDENCE_H

#include "image.h"

namespace facesift {

// Heuristic plausibility score for a raw cascade rectangle, in [0, 1].
// Mean of an aspect-ratio term (near-square upright faces score 1.0)
// and an area term (typical face areas score 1.0, borderline 0.8).
// Not a calibrated probability - only used to prune before suppression.
float scoreCandidate(const Rect& rect);

} // namespace facesift

#endif // FACESIFT_CONFIDENCE_H
