#include "gallery_store.h"
#include "../logger.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace facesift {

namespace {
const char MAGIC[8] = {'F', 'S', 'G', 'A', 'L', 'L', 'R', 'Y'};
}

bool GalleryStore::save(const std::string& path, const Gallery& gallery) {
    for (const auto& entry : gallery) {
        const Identity& identity = entry.second;
        if (identity.name.empty() || identity.name.size() >= NAME_SIZE) {
            Logger::getInstance().error("Identity name must be 1-" + std::to_string(NAME_SIZE - 1) +
                                        " bytes: '" + identity.name + "'");
            return false;
        }
        if (identity.mean_embedding.empty() || identity.mean_embedding.size() > MAX_DIMENSION) {
            Logger::getInstance().error("Invalid embedding dimension for " + identity.name + ": " +
                                        std::to_string(identity.mean_embedding.size()));
            return false;
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        Logger::getInstance().error("Failed to open file for writing: " + path);
        return false;
    }

    file.write(MAGIC, sizeof(MAGIC));
    writeUint32LE(file, FORMAT_VERSION);
    writeUint32LE(file, static_cast<uint32_t>(gallery.size()));

    for (const auto& entry : gallery) {
        const Identity& identity = entry.second;
        writeNullPaddedString(file, identity.name, NAME_SIZE);
        writeUint32LE(file, static_cast<uint32_t>(identity.sample_count));
        writeUint32LE(file, static_cast<uint32_t>(identity.mean_embedding.size()));
        file.write(reinterpret_cast<const char*>(identity.mean_embedding.data()),
                   identity.mean_embedding.size() * sizeof(float));
    }

    if (!file.good()) {
        Logger::getInstance().error("Failed to write gallery: " + path);
        return false;
    }

    Logger::getInstance().info("Saved " + std::to_string(gallery.size()) + " identities to " + path);
    return true;
}

bool GalleryStore::load(const std::string& path, Gallery& gallery) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Logger::getInstance().error("Failed to open gallery file: " + path);
        return false;
    }

    char magic[sizeof(MAGIC)];
    file.read(magic, sizeof(magic));
    if (!file || std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
        Logger::getInstance().error("Not a gallery file: " + path);
        return false;
    }

    uint32_t version = readUint32LE(file);
    uint32_t count = readUint32LE(file);
    if (!file) {
        Logger::getInstance().error("Truncated gallery header: " + path);
        return false;
    }
    if (version != FORMAT_VERSION) {
        Logger::getInstance().error("Unsupported gallery version " + std::to_string(version) + ": " + path);
        return false;
    }

    Gallery loaded;
    for (uint32_t i = 0; i < count; i++) {
        Identity identity;
        identity.name = readNullPaddedString(file, NAME_SIZE);
        identity.sample_count = readUint32LE(file);
        uint32_t dim = readUint32LE(file);
        if (!file) {
            Logger::getInstance().error("Truncated gallery entry #" + std::to_string(i) + ": " + path);
            return false;
        }
        if (identity.name.empty()) {
            Logger::getInstance().error("Empty identity name in entry #" + std::to_string(i) + ": " + path);
            return false;
        }
        if (dim == 0 || dim > MAX_DIMENSION) {
            Logger::getInstance().error("Invalid dimension " + std::to_string(dim) + " for " +
                                        identity.name + ": " + path);
            return false;
        }

        identity.mean_embedding.resize(dim);
        file.read(reinterpret_cast<char*>(identity.mean_embedding.data()), dim * sizeof(float));
        if (!file) {
            Logger::getInstance().error("Truncated embedding for " + identity.name + ": " + path);
            return false;
        }

        float norm = l2Norm(identity.mean_embedding);
        if (!std::isfinite(norm) || norm <= 0.0f) {
            Logger::getInstance().error("Degenerate embedding for " + identity.name + ": " + path);
            return false;
        }
        if (std::fabs(norm - 1.0f) > UNIT_NORM_TOLERANCE) {
            Logger::getInstance().warning("Re-normalized embedding for " + identity.name +
                                          " (norm " + std::to_string(norm) + "): " + path);
            l2Normalize(identity.mean_embedding);
        }

        std::string name = identity.name;
        loaded[name] = std::move(identity);
    }

    if (file.peek() != std::ifstream::traits_type::eof()) {
        Logger::getInstance().warning("Trailing data after " + std::to_string(count) +
                                      " identities ignored: " + path);
    }

    gallery = std::move(loaded);
    return true;
}

size_t GalleryStore::fileSize(const Gallery& gallery) {
    size_t size = HEADER_SIZE;
    for (const auto& entry : gallery) {
        size += NAME_SIZE + 2 * sizeof(uint32_t) + entry.second.mean_embedding.size() * sizeof(float);
    }
    return size;
}

// Little-endian hosts only (x86_64, aarch64)
uint32_t GalleryStore::readUint32LE(std::ifstream& file) {
    uint32_t value = 0;
    file.read(reinterpret_cast<char*>(&value), sizeof(value));
    return value;
}

void GalleryStore::writeUint32LE(std::ofstream& file, uint32_t value) {
    file.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

std::string GalleryStore::readNullPaddedString(std::ifstream& file, size_t max_len) {
    std::vector<char> buffer(max_len);
    file.read(buffer.data(), max_len);
    if (!file) return "";

    auto it = std::find(buffer.begin(), buffer.end(), '\0');
    return std::string(buffer.begin(), it);
}

void GalleryStore::writeNullPaddedString(std::ofstream& file, const std::string& str, size_t max_len) {
    std::vector<char> buffer(max_len, 0);
    size_t copy_len = std::min(str.size(), max_len - 1);
    std::memcpy(buffer.data(), str.c_str(), copy_len);
    file.write(buffer.data(), max_len);
}

} // namespace facesift
