#ifndef FACESIFT_DETECTOR_BACKEND_H
#define FACESIFT_DETECTOR_BACKEND_H

#include "../image.h"
#include "../detection_options.h"
#include <string>
#include <vector>

namespace facesift {

// External face detector.
// Receives a single-channel working frame and returns raw candidate
// rectangles in that frame's coordinate space (possibly empty).
// Implementations may throw; the pipeline treats that as a frame failure.
// Instances are not required to be thread-safe: use one per worker.
class FaceDetectorBackend {
public:
    virtual ~FaceDetectorBackend() = default;

    virtual std::vector<Rect> detect(const ImageView& gray, const DetectorParams& params) = 0;

    virtual std::string name() const = 0;
};

} // namespace facesift

#endif // FACESIFT_DETECTOR_BACKEND_H
