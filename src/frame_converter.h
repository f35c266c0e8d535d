#ifndef FACESIFT_FRAME_CONVERTER_H
#define FACESIFT_FRAME_CONVERTER_H

#include "image.h"

namespace facesift {

// Color conversion and scaling for detector working frames (libyuv).
// Sources may be BGRA (4), BGR (3) or GRAY (1) channels.
// Conversion failures throw std::runtime_error; unsupported layouts
// throw std::invalid_argument.

// GRAY (use_gray) or BGR copy of the source
Image toWorkingImage(const ImageView& src, bool use_gray);

// Single-channel, full-range luma
Image toGrayscale(const ImageView& src);

// BGR copy of a BGRA/BGR/GRAY source
Image toBGR(const ImageView& src);

// Bilinear resize of a GRAY or BGR image
Image resizeImage(const ImageView& src, int dst_width, int dst_height);

// In-place global histogram equalization of a GRAY image
void equalizeHistogram(Image& gray);

} // namespace facesift

#endif // FACESIFT_FRAME_CONVERTER_H
