#ifndef FACESIFT_ENROLLMENT_H
#define FACESIFT_ENROLLMENT_H

#include "gallery.h"
#include "aggregator.h"
#include "models/embedding_model.h"
#include <optional>
#include <string>
#include <vector>

namespace facesift {

class Config;

struct EnrollmentOptions {
    float outlier_threshold = DEFAULT_OUTLIER_THRESHOLD;
    int outlier_iterations = DEFAULT_OUTLIER_ITERATIONS;
    int threads = 4;

    // [enrollment] outlier_threshold, outlier_iterations, threads
    static EnrollmentOptions fromConfig(const Config& config);
};

// One identity directory and the image files found in it
struct EnrollmentSource {
    std::string name;
    std::vector<std::string> images;
};

// Builds galleries from a faces/<name>/<image> tree
class Enrollment {
public:
    Enrollment(EmbeddingModelFactory factory, EnrollmentOptions options = EnrollmentOptions());

    // Identity directories (sorted) with their supported image files (sorted).
    // A missing directory yields an empty list.
    static std::vector<EnrollmentSource> scanSource(const std::string& faces_dir);

    // Largest face of each decodable image, aggregated with outlier rejection.
    // std::nullopt when no image produced a usable sample.
    std::optional<Identity> enrollIdentity(const std::string& name,
                                           const std::vector<std::string>& images,
                                           EmbeddingModel& model) const;

    // All identities of faces_dir, enrolled in parallel.
    // Throws ModelUnavailableError when the model cannot be loaded.
    Gallery buildGallery(const std::string& faces_dir) const;

    // buildGallery() published into the registry; returns the identity count
    size_t rebuild(GalleryRegistry& registry, const std::string& faces_dir) const;

private:
    EmbeddingModelFactory factory_;
    EnrollmentOptions options_;
};

} // namespace facesift

#endif // FACESIFT_ENROLLMENT_H
