#include "detection_pipeline.h"
#include "frame_converter.h"
#include "geometry.h"
#include "suppression.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace facesift {

DetectionPipeline::DetectionPipeline(std::unique_ptr<FaceDetectorBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("DetectionPipeline requires a detector backend");
    }
}

DetectionResult DetectionPipeline::detect(const uint8_t* data, size_t size, int width, int height,
                                          int channels, const DetectionOptions& options) {
    if (data == nullptr) {
        return DetectionResult::failure("null image buffer");
    }
    if (width <= 0 || height <= 0) {
        return DetectionResult::failure("invalid frame size " + std::to_string(width) + "x" +
                                        std::to_string(height));
    }
    if (channels != 1 && channels != 3 && channels != 4) {
        return DetectionResult::failure("unsupported channel count " + std::to_string(channels));
    }

    size_t expected = static_cast<size_t>(width) * height * channels;
    if (size != expected) {
        return DetectionResult::failure("buffer size " + std::to_string(size) +
                                        " does not match " + std::to_string(width) + "x" +
                                        std::to_string(height) + "x" + std::to_string(channels) +
                                        " (" + std::to_string(expected) + " bytes)");
    }

    ImageView frame(data, width, height, channels);
    return detect(frame, options);
}

DetectionResult DetectionPipeline::detect(const ImageView& frame, const DetectionOptions& options) {
    if (frame.empty()) {
        return DetectionResult::failure("empty frame");
    }
    if (frame.channels() != 1 && frame.channels() != 3 && frame.channels() != 4) {
        return DetectionResult::failure("unsupported channel count " + std::to_string(frame.channels()));
    }
    if (!(options.image_scale > 0.0f) || !std::isfinite(options.image_scale)) {
        return DetectionResult::failure("image_scale must be finite and > 0");
    }

    const int width = frame.width();
    const int height = frame.height();
    const double scaled_w = static_cast<double>(width) * options.image_scale;
    const double scaled_h = static_cast<double>(height) * options.image_scale;
    if (scaled_w > std::numeric_limits<int>::max() || scaled_h > std::numeric_limits<int>::max()) {
        return DetectionResult::failure("image_scale " + std::to_string(options.image_scale) +
                                        " overflows the working frame size");
    }
    auto start = std::chrono::steady_clock::now();

    try {
        // (a) working frame: color space, scale, equalization
        Image working = toWorkingImage(frame, options.use_gray);

        const float scale = options.image_scale;
        if (scale != 1.0f) {
            int new_w = std::max(1, static_cast<int>(scaled_w));
            int new_h = std::max(1, static_cast<int>(scaled_h));
            working = resizeImage(working.view(), new_w, new_h);
        }

        Image gray = working.channels() == 1 ? std::move(working) : toGrayscale(working.view());
        if (options.equalize_histogram) {
            equalizeHistogram(gray);
        }

        // (b) external detector, working-frame coordinates
        DetectorParams params = options.resolveParams(gray.width(), gray.height());
        std::vector<Rect> raw = backend_->detect(gray.view(), params);

        // (c)(d) confidence gate + suppression
        std::vector<Rect> kept = postProcessCandidates(raw, options.confidence_threshold,
                                                       options.overlap_threshold);

        // (e)(f) back to source frame, clamped
        const float inv_scale = scale != 1.0f ? 1.0f / scale : 1.0f;
        std::vector<Rect> faces;
        faces.reserve(kept.size());
        for (const auto& rect : kept) {
            faces.push_back(clampToFrame(scaleRect(rect, inv_scale), width, height));
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();
        Logger::getInstance().debug("Detection: " + std::to_string(raw.size()) + " raw, " +
            std::to_string(faces.size()) + " kept (" + backend_->name() + ", gray=" +
            std::to_string(options.use_gray) + ", scale=" + std::to_string(scale) + ") in " +
            std::to_string(elapsed / 1000.0) + "ms");

        return DetectionResult::success(std::move(faces));
    } catch (const std::exception& e) {
        Logger::getInstance().warning(std::string("Face detection failed: ") + e.what());
        return DetectionResult::failure(e.what());
    }
}

std::vector<Rect> DetectionPipeline::detectFaces(const ImageView& frame, const DetectionOptions& options) {
    DetectionResult result = detect(frame, options);
    if (!result.ok) {
        return {};
    }
    return std::move(result.faces);
}

} // namespace facesift
