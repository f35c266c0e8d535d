#ifndef FACESIFT_GALLERY_H
#define FACESIFT_GALLERY_H

#include "embedding.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace facesift {

// Enrolled person: normalized mean embedding over the kept samples
struct Identity {
    std::string name;
    Embedding mean_embedding;
    size_t sample_count = 0;
};

// name -> identity, iterated in name order
using Gallery = std::map<std::string, Identity>;

// Holds the published gallery. Readers take a snapshot and keep using it
// for the whole frame; enrollment publishes a complete replacement.
class GalleryRegistry {
public:
    GalleryRegistry();
    explicit GalleryRegistry(Gallery initial);

    GalleryRegistry(const GalleryRegistry&) = delete;
    GalleryRegistry& operator=(const GalleryRegistry&) = delete;

    // Never null
    std::shared_ptr<const Gallery> snapshot() const;

    void replace(Gallery gallery);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Gallery> current_;
};

} // namespace facesift

#endif // FACESIFT_GALLERY_H
