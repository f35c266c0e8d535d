#ifndef FACESIFT_DETECTION_PIPELINE_H
#define FACESIFT_DETECTION_PIPELINE_H

#include "image.h"
#include "detection_options.h"
#include "detectors/detector_backend.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace facesift {

// Outcome of a single-frame detection: either a (possibly empty) list of
// rectangles in source-frame coordinates, or a failure with its reason.
struct DetectionResult {
    bool ok = false;
    std::vector<Rect> faces;
    std::string error;

    static DetectionResult success(std::vector<Rect> faces) {
        DetectionResult result;
        result.ok = true;
        result.faces = std::move(faces);
        return result;
    }

    static DetectionResult failure(std::string reason) {
        DetectionResult result;
        result.ok = false;
        result.error = std::move(reason);
        return result;
    }
};

// Detector context: owns the external detector and turns a frame into a
// clean face set (working frame -> detect -> score -> suppress -> remap -> clamp).
// Construct once per worker and reuse across frames.
class DetectionPipeline {
public:
    explicit DetectionPipeline(std::unique_ptr<FaceDetectorBackend> backend);

    // Never throws for per-frame problems; they come back as failure()
    DetectionResult detect(const ImageView& frame, const DetectionOptions& options);

    // Raw packed buffer; size must equal width * height * channels
    DetectionResult detect(const uint8_t* data, size_t size, int width, int height,
                           int channels, const DetectionOptions& options);

    // detect() with failures collapsed to an empty list
    std::vector<Rect> detectFaces(const ImageView& frame, const DetectionOptions& options);

    FaceDetectorBackend& backend() { return *backend_; }

private:
    std::unique_ptr<FaceDetectorBackend> backend_;
};

} // namespace facesift

#endif // FACESIFT_DETECTION_PIPELINE_H
