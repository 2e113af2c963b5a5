#pragma once

#include "deepzoom/core/types.hpp"

namespace deepzoom::io {

bool is_supported_image_path(const fs::path& path);

// Wraps a 1, 3 or 4 channel matrix as GRAY, BGR or BGRA. 16-bit and float
// depths are scaled to 8 bits, gray + alpha becomes BGRA. Any other channel
// count throws DecodeError.
SourceImage to_source_image(const cv::Mat& pixels);

// Decodes an image file. Throws DecodeError if the file cannot be read.
SourceImage read_image(const fs::path& path);

} // namespace deepzoom::io
