#pragma once

#include "deepzoom/core/types.hpp"

#include <cstdint>
#include <vector>

namespace deepzoom::image {

int to_cv_interpolation(ResizeFilter filter);

// Resamples `src` to `size` with the given kernel. Returns `src` itself
// (shared buffer, no copy) when the size already matches.
cv::Mat resample(const cv::Mat& src, const LevelSize& size, ResizeFilter filter);

// View into `img` covering `bounds`. Throws GeometryError if the box does
// not lie inside the image.
cv::Mat crop(const cv::Mat& img, const TileBounds& bounds);

// round((1 - quality) * 10), in [0, 10]
int png_compression_level(float image_quality);

// round(quality * 100), in [0, 100]
int jpeg_quality(float image_quality);

std::vector<uint8_t> encode_tile(const cv::Mat& tile, TileFormat format, float image_quality);

} // namespace deepzoom::image
