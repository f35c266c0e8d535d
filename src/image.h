/*
 * Image types for facesift
 *
 * - ImageView: non-owning view over caller pixels (move-only)
 * - Image: owning, 64-byte aligned buffer (move-only, explicit clone)
 * - Rect: integer bounding rectangle in pixel coordinates
 *
 * Pixel layouts follow the capture side: 4 channels = BGRA,
 * 3 channels = BGR, 1 channel = GRAY.
 */

#ifndef FACESIFT_IMAGE_H
#define FACESIFT_IMAGE_H

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace facesift {

class Image;
class ImageView;

// ========== Rect: Bounding Rectangle ==========

struct Rect {
    int x, y, width, height;

    constexpr Rect() noexcept : x(0), y(0), width(0), height(0) {}
    constexpr Rect(int x_, int y_, int w, int h) noexcept
        : x(x_), y(y_), width(w), height(h) {}

    constexpr bool empty() const noexcept {
        return width <= 0 || height <= 0;
    }

    constexpr bool operator==(const Rect& other) const noexcept {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }

    constexpr bool operator!=(const Rect& other) const noexcept {
        return !(*this == other);
    }
};

// ========== ImageView: Non-Owning View ==========

class ImageView {
public:
    ImageView(const uint8_t* data, int width, int height, int channels, int stride = 0) noexcept
        : data_(data), width_(width), height_(height),
          channels_(channels), stride_(stride > 0 ? stride : width * channels) {}

    // Views can't be copied - forces explicit intent
    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;

    ImageView(ImageView&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
    }

    ImageView& operator=(ImageView&& other) noexcept {
        data_ = other.data_;
        width_ = other.width_;
        height_ = other.height_;
        channels_ = other.channels_;
        stride_ = other.stride_;
        other.data_ = nullptr;
        return *this;
    }

    const uint8_t* data() const noexcept { return data_; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ <= 0 || height_ <= 0; }
    constexpr size_t size() const noexcept {
        return static_cast<size_t>(width_) * height_ * channels_;
    }

    // ROI extraction (caller guarantees rect lies inside the view)
    ImageView roi(const Rect& rect) const noexcept {
        const uint8_t* roi_data = data_ + rect.y * stride_ + rect.x * channels_;
        return ImageView(roi_data, rect.width, rect.height, channels_, stride_);
    }

    // Explicit deep copy (returns owning Image)
    Image clone() const;

private:
    const uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

// ========== Image: Owning Image (Move-Only) ==========

class Image {
public:
    Image() noexcept
        : data_(nullptr), width_(0), height_(0), channels_(0), stride_(0) {}

    // Allocating constructor (owns data, 64-byte aligned, zero-filled)
    Image(int width, int height, int channels)
        : width_(width), height_(height), channels_(channels),
          stride_(width * channels) {

        if (width <= 0 || height <= 0 || channels <= 0) {
            throw std::invalid_argument("Image dimensions must be positive");
        }

        size_t size = static_cast<size_t>(stride_) * height_;
        size_t aligned_size = (size + 63) & ~static_cast<size_t>(63);

        if (posix_memalign(reinterpret_cast<void**>(&data_), 64, aligned_size) != 0) {
            throw std::bad_alloc();
        }
        std::memset(data_, 0, aligned_size);
    }

    ~Image() noexcept {
        if (data_) {
            free(data_);
        }
    }

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    Image(Image&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
        other.width_ = 0;
        other.height_ = 0;
    }

    Image& operator=(Image&& other) noexcept {
        if (this != &other) {
            if (data_) {
                free(data_);
            }

            data_ = other.data_;
            width_ = other.width_;
            height_ = other.height_;
            channels_ = other.channels_;
            stride_ = other.stride_;

            other.data_ = nullptr;
            other.width_ = 0;
            other.height_ = 0;
        }
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ == 0 || height_ == 0; }
    constexpr size_t size() const noexcept {
        return static_cast<size_t>(width_) * height_ * channels_;
    }

    // Non-owning view (view lifetime must be shorter than the image)
    ImageView view() const noexcept {
        return ImageView(data_, width_, height_, channels_, stride_);
    }

    Image clone() const {
        return view().clone();
    }

private:
    uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

// ImageView::clone() needs the Image definition
inline Image ImageView::clone() const {
    if (empty()) {
        return Image();
    }

    Image copy(width_, height_, channels_);

    // Row by row (handles stride)
    for (int y = 0; y < height_; y++) {
        std::memcpy(
            copy.data() + y * copy.stride(),
            data_ + y * stride_,
            static_cast<size_t>(width_) * channels_
        );
    }

    return copy;
}

} // namespace facesift

#endif // FACESIFT_IMAGE_H
