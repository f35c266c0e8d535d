#include "image_decoder.h"
#include "logger.h"
#include <turbojpeg.h>
#include <libyuv.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace facesift {

namespace {

std::string lowerExtension(const std::string& path) {
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool isJpegData(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF;
}

bool decodeWithStb(const std::string& path, const std::vector<uint8_t>& bytes, Image& out_bgr) {
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &width, &height, &channels, 3);
    if (!data) {
        Logger::getInstance().warning("Failed to decode image " + path + ": " + stbi_failure_reason());
        return false;
    }

    Image img(width, height, 3);
    // stb_image yields R,G,B byte order
    int ret = libyuv::RAWToRGB24(data, width * 3, img.data(), img.stride(), width, height);
    stbi_image_free(data);

    if (ret != 0) {
        Logger::getInstance().warning("RGB to BGR conversion failed for " + path);
        return false;
    }

    out_bgr = std::move(img);
    return true;
}

} // namespace

bool isSupportedImageFile(const std::string& path) {
    static const char* const extensions[] = {"jpg", "jpeg", "png", "webp", "bmp"};
    std::string ext = lowerExtension(path);
    for (const char* supported : extensions) {
        if (ext == supported) {
            return true;
        }
    }
    return false;
}

bool decodeJpeg(const uint8_t* data, size_t size, Image& out_bgr) {
    tjhandle handle = tjInitDecompress();
    if (!handle) {
        Logger::getInstance().error("tjInitDecompress failed: " + std::string(tjGetErrorStr()));
        return false;
    }

    int width = 0, height = 0, subsamp = 0, colorspace = 0;
    if (tjDecompressHeader3(handle, const_cast<unsigned char*>(data), static_cast<unsigned long>(size),
                            &width, &height, &subsamp, &colorspace) < 0) {
        Logger::getInstance().debug("tjDecompressHeader3 failed: " + std::string(tjGetErrorStr2(handle)));
        tjDestroy(handle);
        return false;
    }

    Image frame(width, height, 3);
    if (tjDecompress2(handle, const_cast<unsigned char*>(data), static_cast<unsigned long>(size),
                      frame.data(), width, frame.stride(), height, TJPF_BGR, TJFLAG_ACCURATEDCT) < 0) {
        Logger::getInstance().debug("tjDecompress2 failed: " + std::string(tjGetErrorStr2(handle)));
        tjDestroy(handle);
        return false;
    }

    tjDestroy(handle);
    out_bgr = std::move(frame);
    return true;
}

bool decodeImageFile(const std::string& path, Image& out_bgr) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Logger::getInstance().warning("Cannot open image: " + path);
        return false;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        Logger::getInstance().warning("Empty image file: " + path);
        return false;
    }

    if (isJpegData(bytes)) {
        if (decodeJpeg(bytes.data(), bytes.size(), out_bgr)) {
            return true;
        }
        Logger::getInstance().debug("TurboJPEG could not decode " + path + ", trying stb_image");
    }

    return decodeWithStb(path, bytes, out_bgr);
}

} // namespace facesift
