#include "suppression.h"
#include "confidence.h"
#include "geometry.h"
#include <algorithm>

namespace facesift {

std::vector<DetectionCandidate> scoreCandidates(
    const std::vector<Rect>& rects,
    float confidence_threshold) {

    std::vector<DetectionCandidate> candidates;
    candidates.reserve(rects.size());

    for (const auto& rect : rects) {
        float confidence = scoreCandidate(rect);
        if (confidence >= confidence_threshold) {
            candidates.push_back({rect, confidence});
        }
    }

    return candidates;
}

std::vector<Rect> suppressOverlaps(
    const std::vector<DetectionCandidate>& candidates,
    float overlap_threshold) {

    std::vector<Rect> remaining;
    remaining.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        remaining.push_back(candidate.rect);
    }

    // Largest area first; stable so equal areas keep input order
    std::stable_sort(remaining.begin(), remaining.end(),
        [](const Rect& a, const Rect& b) {
            return static_cast<long long>(a.width) * a.height >
                   static_cast<long long>(b.width) * b.height;
        });

    std::vector<Rect> picked;
    while (!remaining.empty()) {
        Rect current = remaining.front();
        picked.push_back(current);

        std::vector<Rect> survivors;
        survivors.reserve(remaining.size() - 1);
        for (size_t i = 1; i < remaining.size(); i++) {
            if (overlap(current, remaining[i]) < overlap_threshold) {
                survivors.push_back(remaining[i]);
            }
        }
        remaining = std::move(survivors);
    }

    return picked;
}

std::vector<Rect> postProcessCandidates(
    const std::vector<Rect>& rects,
    float confidence_threshold,
    float overlap_threshold) {

    if (rects.empty()) {
        return {};
    }
    return suppressOverlaps(scoreCandidates(rects, confidence_threshold), overlap_threshold);
}

} // namespace facesift
