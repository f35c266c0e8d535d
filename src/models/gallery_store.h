#ifndef FACESIFT_GALLERY_STORE_H
#define FACESIFT_GALLERY_STORE_H

#include "../gallery.h"
#include <cstdint>
#include <fstream>
#include <string>

namespace facesift {

// Binary gallery file
//
// Header (16 bytes):
//   0x00  char[8]   magic "FSGALLRY"
//   0x08  uint32    format version (1)
//   0x0C  uint32    identity count
// Per identity:
//   char[64]        name, null-padded
//   uint32          sample count
//   uint32          dimension (1..2048)
//   float[dim]      mean embedding
// All integers little-endian.
class GalleryStore {
public:
    static constexpr size_t HEADER_SIZE = 16;
    static constexpr size_t NAME_SIZE = 64;
    static constexpr uint32_t FORMAT_VERSION = 1;
    static constexpr uint32_t MAX_DIMENSION = 2048;
    static constexpr float UNIT_NORM_TOLERANCE = 1e-3f;

    static bool save(const std::string& path, const Gallery& gallery);

    // Replaces `gallery` only when the whole file is valid
    static bool load(const std::string& path, Gallery& gallery);

    static size_t fileSize(const Gallery& gallery);

private:
    static uint32_t readUint32LE(std::ifstream& file);
    static void writeUint32LE(std::ofstream& file, uint32_t value);

    static std::string readNullPaddedString(std::ifstream& file, size_t max_len);
    static void writeNullPaddedString(std::ofstream& file, const std::string& str, size_t max_len);
};

} // namespace facesift

#endif // FACESIFT_GALLERY_STORE_H
