#include "gallery.h"
#include "logger.h"

namespace facesift {

GalleryRegistry::GalleryRegistry()
    : current_(std::make_shared<const Gallery>()) {}

GalleryRegistry::GalleryRegistry(Gallery initial)
    : current_(std::make_shared<const Gallery>(std::move(initial))) {}

std::shared_ptr<const Gallery> GalleryRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void GalleryRegistry::replace(Gallery gallery) {
    auto next = std::make_shared<const Gallery>(std::move(gallery));
    size_t count = next->size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(next);
    }
    Logger::getInstance().info("Gallery published: " + std::to_string(count) + " identities");
}

size_t GalleryRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->size();
}

} // namespace facesift
