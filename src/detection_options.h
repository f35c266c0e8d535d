#ifndef FACESIFT_DETECTION_OPTIONS_H
#define FACESIFT_DETECTION_OPTIONS_H

#include "suppression.h"
#include <optional>
#include <string>

namespace facesift {

class Config;

// Parameters passed through to the external detector.
// Sizes are in pixels of the working (scaled) frame.
struct DetectorParams {
    double scale_factor = 1.1;
    int min_neighbors = 3;
    int min_size = 30;
    int max_size = 300;
};

struct DetectionOptions {
    // Convert straight to grayscale; skips the intermediate BGR copy
    bool use_gray = false;

    // Downscale factor for the working frame (> 0); results are mapped back by 1/image_scale
    float image_scale = 1.0f;

    int min_face_size = 30;
    int max_face_size = 300;

    // Optional bounds as a fraction of the working frame's shorter side.
    // Take precedence over dynamic_size and the absolute sizes.
    std::optional<float> min_face_ratio;
    std::optional<float> max_face_ratio;

    // Derive bounds from the shorter side: max(15, s/25) .. min(250, s/4)
    bool dynamic_size = false;

    double scale_factor = 1.1;
    int min_neighbors = 3;

    float confidence_threshold = DEFAULT_CONFIDENCE_THRESHOLD;
    float overlap_threshold = DEFAULT_OVERLAP_THRESHOLD;

    bool equalize_histogram = true;

    // Presets
    static DetectionOptions accurate();
    static DetectionOptions fast();

    // "accurate" or "fast"
    static std::optional<DetectionOptions> preset(const std::string& name);

    // [detection] section on top of the configured preset (default "accurate")
    static DetectionOptions fromConfig(const Config& config);

    // Detector parameters for a working frame of the given size
    DetectorParams resolveParams(int working_width, int working_height) const;
};

} // namespace facesift

#endif // FACESIFT_DETECTION_OPTIONS_H
