#include "detection_options.h"
#include "config.h"
#include "logger.h"
#include <algorithm>

namespace facesift {

DetectionOptions DetectionOptions::accurate() {
    DetectionOptions options;
    options.use_gray = false;
    options.image_scale = 1.0f;
    options.min_face_size = 30;
    options.max_face_size = 300;
    options.scale_factor = 1.1;
    options.min_neighbors = 3;
    return options;
}

DetectionOptions DetectionOptions::fast() {
    DetectionOptions options;
    options.use_gray = true;
    options.image_scale = 1.0f;
    options.min_face_size = 20;
    options.max_face_size = 200;
    options.scale_factor = 1.2;
    options.min_neighbors = 2;
    return options;
}

std::optional<DetectionOptions> DetectionOptions::preset(const std::string& name) {
    if (name == "accurate") return accurate();
    if (name == "fast") return fast();
    return std::nullopt;
}

DetectionOptions DetectionOptions::fromConfig(const Config& config) {
    const std::string section = "detection";

    std::string preset_name = config.getString(section, "preset").value_or("accurate");
    auto base = preset(preset_name);
    if (!base.has_value()) {
        Logger::getInstance().warning("Unknown detection preset '" + preset_name + "', using 'accurate'");
        base = accurate();
    }
    DetectionOptions options = *base;

    if (auto v = config.getBool(section, "use_gray")) options.use_gray = *v;
    if (auto v = config.getDouble(section, "image_scale")) {
        if (*v > 0.0) {
            options.image_scale = static_cast<float>(*v);
        }
    }
    if (auto v = config.getInt(section, "min_face_size")) options.min_face_size = *v;
    if (auto v = config.getInt(section, "max_face_size")) options.max_face_size = *v;
    if (auto v = config.getDouble(section, "min_face_ratio")) options.min_face_ratio = static_cast<float>(*v);
    if (auto v = config.getDouble(section, "max_face_ratio")) options.max_face_ratio = static_cast<float>(*v);
    if (auto v = config.getBool(section, "dynamic_size")) options.dynamic_size = *v;
    if (auto v = config.getDouble(section, "scale_factor")) options.scale_factor = *v;
    if (auto v = config.getInt(section, "min_neighbors")) options.min_neighbors = *v;
    if (auto v = config.getDouble(section, "confidence_threshold")) options.confidence_threshold = static_cast<float>(*v);
    if (auto v = config.getDouble(section, "overlap_threshold")) options.overlap_threshold = static_cast<float>(*v);
    if (auto v = config.getBool(section, "equalize_histogram")) options.equalize_histogram = *v;

    return options;
}

DetectorParams DetectionOptions::resolveParams(int working_width, int working_height) const {
    DetectorParams params;
    params.scale_factor = scale_factor;
    params.min_neighbors = min_neighbors;

    int short_side = std::max(1, std::min(working_width, working_height));

    int min_size = min_face_size;
    int max_size = max_face_size;

    if (dynamic_size) {
        min_size = std::max(15, short_side / 25);
        max_size = std::min(250, short_side / 4);
    }
    if (min_face_ratio.has_value()) {
        min_size = static_cast<int>(short_side * *min_face_ratio);
    }
    if (max_face_ratio.has_value()) {
        max_size = static_cast<int>(short_side * *max_face_ratio);
    }

    params.min_size = std::max(1, min_size);
    params.max_size = std::max(params.min_size, max_size);
    return params;
}

} // namespace facesift
