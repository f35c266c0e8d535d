#include "geometry.h"
#include <algorithm>

namespace facesift {

float overlap(const Rect& a, const Rect& b) {
    int x_left = std::max(a.x, b.x);
    int y_top = std::max(a.y, b.y);
    int x_right = std::min(a.x + a.width, b.x + b.width);
    int y_bottom = std::min(a.y + a.height, b.y + b.height);

    if (x_right <= x_left || y_bottom <= y_top) {
        return 0.0f;
    }

    long long inter_area = static_cast<long long>(x_right - x_left) * (y_bottom - y_top);
    long long union_area = static_cast<long long>(a.width) * a.height +
                           static_cast<long long>(b.width) * b.height - inter_area;

    if (union_area <= 0) {
        return 0.0f;
    }
    return static_cast<float>(static_cast<double>(inter_area) / static_cast<double>(union_area));
}

Rect scaleRect(const Rect& rect, float inv_scale) {
    return Rect(
        static_cast<int>(rect.x * inv_scale),
        static_cast<int>(rect.y * inv_scale),
        static_cast<int>(rect.width * inv_scale),
        static_cast<int>(rect.height * inv_scale)
    );
}

Rect clampToFrame(const Rect& rect, int width, int height) {
    Rect out;
    out.x = std::max(0, std::min(rect.x, width - 1));
    out.y = std::max(0, std::min(rect.y, height - 1));
    out.width = std::max(1, std::min(rect.width, width - out.x));
    out.height = std::max(1, std::min(rect.height, height - out.y));
    return out;
}

} // namespace facesift
