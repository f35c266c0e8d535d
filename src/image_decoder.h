#ifndef FACESIFT_IMAGE_DECODER_H
#define FACESIFT_IMAGE_DECODER_H

#include "image.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace facesift {

// Decodes an image file to BGR (3 channels).
// JPEG goes through TurboJPEG, everything else through stb_image.
// Returns false (and logs) when the file cannot be read or decoded.
bool decodeImageFile(const std::string& path, Image& out_bgr);

// In-memory JPEG to BGR
bool decodeJpeg(const uint8_t* data, size_t size, Image& out_bgr);

// Enrollment source extensions: jpg, jpeg, png, webp, bmp (case-insensitive)
bool isSupportedImageFile(const std::string& path);

} // namespace facesift

#endif // FACESIFT_IMAGE_DECODER_H
