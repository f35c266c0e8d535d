#include "cascade_detector.h"
#include "../logger.h"
#include "config_paths.h"
#include <opencv2/core.hpp>
#include <stdexcept>

namespace facesift {

std::vector<std::string> CascadeDetector::defaultCascadePaths() {
    const std::string dir = CASCADE_DIR;
    return {
        dir + "/haarcascade_frontalface_alt2.xml",
        dir + "/haarcascade_frontalface_default.xml"
    };
}

CascadeDetector::CascadeDetector(const std::vector<std::string>& cascade_paths) {
    for (const auto& path : cascade_paths) {
        try {
            if (classifier_.load(path) && !classifier_.empty()) {
                loaded_path_ = path;
                Logger::getInstance().info("Loaded face cascade: " + path);
                return;
            }
        } catch (const cv::Exception& e) {
            Logger::getInstance().debug("Cascade load threw for " + path + ": " + e.what());
        }
        Logger::getInstance().debug("Cascade not usable, trying next: " + path);
    }

    throw std::runtime_error("No usable face cascade among " +
                             std::to_string(cascade_paths.size()) + " candidate(s)");
}

std::vector<Rect> CascadeDetector::detect(const ImageView& gray, const DetectorParams& params) {
    if (gray.channels() != 1) {
        throw std::invalid_argument("CascadeDetector expects a single-channel frame");
    }

    // Wrap without copying; detectMultiScale only reads the pixels
    cv::Mat mat(gray.height(), gray.width(), CV_8UC1,
                const_cast<uint8_t*>(gray.data()), static_cast<size_t>(gray.stride()));

    std::vector<cv::Rect> found;
    classifier_.detectMultiScale(
        mat,
        found,
        params.scale_factor,
        params.min_neighbors,
        0,
        cv::Size(params.min_size, params.min_size),
        cv::Size(params.max_size, params.max_size)
    );

    std::vector<Rect> rects;
    rects.reserve(found.size());
    for (const auto& r : found) {
        rects.emplace_back(r.x, r.y, r.width, r.height);
    }
    return rects;
}

} // namespace facesift
