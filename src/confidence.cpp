#include "confidence.h"

namespace facesift {

namespace {

constexpr float kMinFaceRatio = 0.8f;
constexpr float kMaxFaceRatio = 1.3f;

constexpr long long kTypicalAreaMin = 1000;
constexpr long long kTypicalAreaMax = 50000;
constexpr long long kPlausibleAreaMin = 500;
constexpr long long kPlausibleAreaMax = 100000;

float ratioScore(const Rect& rect) {
    float aspect_ratio = rect.height > 0
        ? static_cast<float>(rect.width) / static_cast<float>(rect.height)
        : 0.0f;
    return (aspect_ratio >= kMinFaceRatio && aspect_ratio <= kMaxFaceRatio) ? 1.0f : 0.5f;
}

float areaScore(const Rect& rect) {
    long long area = static_cast<long long>(rect.width) * rect.height;
    if (area >= kTypicalAreaMin && area <= kTypicalAreaMax) {
        return 1.0f;
    }
    if (area >= kPlausibleAreaMin && area <= kPlausibleAreaMax) {
        return 0.8f;
    }
    return 0.3f;
}

} // namespace

float scoreCandidate(const Rect& rect) {
    return (ratioScore(rect) + areaScore(rect)) / 2.0f;
}

} // namespace facesift
