#ifndef FACESIFT_CASCADE_DETECTOR_H
#define FACESIFT_CASCADE_DETECTOR_H

#include "detector_backend.h"
#include <opencv2/objdetect.hpp>
#include <memory>
#include <string>
#include <vector>

namespace facesift {

// Haar cascade detector (OpenCV CascadeClassifier)
class CascadeDetector : public FaceDetectorBackend {
public:
    // Tries each cascade file in order and keeps the first one that loads.
    // Throws std::runtime_error if none loads.
    explicit CascadeDetector(const std::vector<std::string>& cascade_paths);

    // alt2 first, then the default frontal cascade, under CASCADE_DIR
    static std::vector<std::string> defaultCascadePaths();

    std::vector<Rect> detect(const ImageView& gray, const DetectorParams& params) override;

    std::string name() const override { return "cascade:" + loaded_path_; }

    const std::string& loadedPath() const { return loaded_path_; }

private:
    cv::CascadeClassifier classifier_;
    std::string loaded_path_;
};

} // namespace facesift

#endif // FACESIFT_CASCADE_DETECTOR_H
