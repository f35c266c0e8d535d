#ifndef FACESIFT_GEOMETRY_H
#define FACESIFT_GEOMETRY_H

#include "image.h"

namespace facesift {

// Intersection-over-union of two rectangles.
// Returns 0.0 when they don't intersect or the union area is not positive.
float overlap(const Rect& a, const Rect& b);

// Multiply every component by inv_scale, truncating toward zero
// (maps a working-frame rect back to the source frame).
Rect scaleRect(const Rect& rect, float inv_scale);

// Clamp a rect into a width x height frame:
// x,y in [0, size-1], w,h >= 1, x+w <= width, y+h <= height.
// Frame dimensions must be positive.
Rect clampToFrame(const Rect& rect, int width, int height);

} // namespace facesift

#endif // FACESIFT_GEOMETRY_H
