#include "frame_converter.h"
#include <libyuv.h>
#include <array>
#include <cmath>
#include <string>

namespace facesift {

namespace {

void checkConversion(int ret, const char* what) {
    if (ret != 0) {
        throw std::runtime_error(std::string("libyuv ") + what + " failed (ret=" + std::to_string(ret) + ")");
    }
}

} // namespace

Image toGrayscale(const ImageView& src) {
    Image gray(src.width(), src.height(), 1);

    switch (src.channels()) {
        case 4:
            // BGRA in memory is libyuv's ARGB
            checkConversion(libyuv::ARGBToJ400(src.data(), src.stride(),
                                               gray.data(), gray.stride(),
                                               src.width(), src.height()), "ARGBToJ400");
            break;
        case 3:
            // BGR in memory is libyuv's RGB24
            checkConversion(libyuv::RGB24ToJ400(src.data(), src.stride(),
                                                gray.data(), gray.stride(),
                                                src.width(), src.height()), "RGB24ToJ400");
            break;
        case 1:
            for (int y = 0; y < src.height(); y++) {
                std::memcpy(gray.data() + y * gray.stride(), src.data() + y * src.stride(), src.width());
            }
            break;
        default:
            throw std::invalid_argument("Unsupported channel count: " + std::to_string(src.channels()));
    }

    return gray;
}

Image toBGR(const ImageView& src) {
    Image bgr(src.width(), src.height(), 3);

    switch (src.channels()) {
        case 4:
            checkConversion(libyuv::ARGBToRGB24(src.data(), src.stride(),
                                                bgr.data(), bgr.stride(),
                                                src.width(), src.height()), "ARGBToRGB24");
            break;
        case 3:
            return src.clone();
        case 1: {
            Image argb(src.width(), src.height(), 4);
            checkConversion(libyuv::J400ToARGB(src.data(), src.stride(),
                                               argb.data(), argb.stride(),
                                               src.width(), src.height()), "J400ToARGB");
            checkConversion(libyuv::ARGBToRGB24(argb.data(), argb.stride(),
                                                bgr.data(), bgr.stride(),
                                                src.width(), src.height()), "ARGBToRGB24");
            break;
        }
        default:
            throw std::invalid_argument("Unsupported channel count: " + std::to_string(src.channels()));
    }

    return bgr;
}

Image toWorkingImage(const ImageView& src, bool use_gray) {
    return use_gray ? toGrayscale(src) : toBGR(src);
}

Image resizeImage(const ImageView& src, int dst_width, int dst_height) {
    if (src.width() == dst_width && src.height() == dst_height) {
        return src.clone();
    }

    if (src.channels() == 1) {
        Image dst(dst_width, dst_height, 1);
        libyuv::ScalePlane(
            src.data(), src.stride(),
            src.width(), src.height(),
            dst.data(), dst.stride(),
            dst_width, dst_height,
            libyuv::kFilterBilinear
        );
        return dst;
    }

    if (src.channels() != 3) {
        throw std::invalid_argument("resizeImage expects GRAY or BGR, got " +
                                    std::to_string(src.channels()) + " channels");
    }

    // libyuv scales packed pixels as ARGB only
    Image src_argb(src.width(), src.height(), 4);
    checkConversion(libyuv::RGB24ToARGB(src.data(), src.stride(),
                                        src_argb.data(), src_argb.stride(),
                                        src.width(), src.height()), "RGB24ToARGB");

    Image dst_argb(dst_width, dst_height, 4);
    checkConversion(libyuv::ARGBScale(
        src_argb.data(), src_argb.stride(),
        src_argb.width(), src_argb.height(),
        dst_argb.data(), dst_argb.stride(),
        dst_argb.width(), dst_argb.height(),
        libyuv::kFilterBilinear
    ), "ARGBScale");

    Image result(dst_width, dst_height, 3);
    checkConversion(libyuv::ARGBToRGB24(dst_argb.data(), dst_argb.stride(),
                                        result.data(), result.stride(),
                                        dst_width, dst_height), "ARGBToRGB24");
    return result;
}

void equalizeHistogram(Image& gray) {
    if (gray.empty() || gray.channels() != 1) {
        throw std::invalid_argument("equalizeHistogram expects a non-empty GRAY image");
    }

    const int width = gray.width();
    const int height = gray.height();

    std::array<long long, 256> hist{};
    for (int y = 0; y < height; y++) {
        const uint8_t* row = gray.data() + y * gray.stride();
        for (int x = 0; x < width; x++) {
            hist[row[x]]++;
        }
    }

    int first = 0;
    while (first < 255 && hist[first] == 0) {
        first++;
    }

    const long long total = static_cast<long long>(width) * height;

    std::array<uint8_t, 256> lut{};
    if (hist[first] == total) {
        // Flat image
        lut.fill(static_cast<uint8_t>(first));
    } else {
        const double scale = 255.0 / static_cast<double>(total - hist[first]);
        long long sum = 0;
        lut[first] = 0;
        for (int i = first + 1; i < 256; i++) {
            sum += hist[i];
            long v = std::lround(sum * scale);
            lut[i] = static_cast<uint8_t>(std::min(255L, std::max(0L, v)));
        }
    }

    for (int y = 0; y < height; y++) {
        uint8_t* row = gray.data() + y * gray.stride();
        for (int x = 0; x < width; x++) {
            row[x] = lut[row[x]];
        }
    }
}

} // namespace facesift
