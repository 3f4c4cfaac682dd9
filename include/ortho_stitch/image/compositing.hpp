#pragma once

#include "ortho_stitch/core/types.hpp"

#include <opencv2/core.hpp>

namespace ortho_stitch::image {

// Fully transparent CV_8UC4 canvas.
Image make_transparent_canvas(int width, int height);

/*
  Straight-alpha "over" for one pixel, 8-bit fixed point with 7 bits of
  coefficient precision. Results are bit-identical to Pillow's
  Image.alpha_composite:
    - src.a == 0   -> dst unchanged
    - src.a == 255 -> src replaces dst
    - dst.a == 0   -> src copied
*/
cv::Vec4b alpha_over(const cv::Vec4b& dst, const cv::Vec4b& src);

// Composite src over dst with src's top-left corner at offset.
// The part of src that falls outside dst is clipped.
void alpha_composite(Image& dst, const Image& src, cv::Point offset);

// Convert a decoded raster (1/3/4 channels, 8/16-bit or float) to CV_8UC4.
Image to_bgra8(const cv::Mat& decoded);

// Nearest-neighbour resample to size x size (no blending).
Image resample_nearest(const Image& img, int size);

} // namespace ortho_stitch::image
