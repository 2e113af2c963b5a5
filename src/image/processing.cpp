#include "deepzoom/image/processing.hpp"
#include "deepzoom/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace deepzoom::image {

namespace {

// zlib accepts levels 0..9
constexpr int kMaxZlibLevel = 9;

float clamp_unit(float v) {
    return std::min(std::max(v, 0.0f), 1.0f);
}

} // namespace

int to_cv_interpolation(ResizeFilter filter) {
    switch (filter) {
        case ResizeFilter::NEAREST: return cv::INTER_NEAREST;
        case ResizeFilter::BILINEAR: return cv::INTER_LINEAR;
        case ResizeFilter::BICUBIC: return cv::INTER_CUBIC;
        case ResizeFilter::CUBIC: return cv::INTER_CUBIC;
        case ResizeFilter::LANCZOS: return cv::INTER_LANCZOS4;
        // Pixel-area averaging is the antialiasing kernel for decimation.
        case ResizeFilter::ANTIALIAS: return cv::INTER_AREA;
        default: return cv::INTER_AREA;
    }
}

cv::Mat resample(const cv::Mat& src, const LevelSize& size, ResizeFilter filter) {
    if (src.cols == size.width && src.rows == size.height) {
        return src;
    }
    if (size.width <= 0 || size.height <= 0) {
        std::ostringstream oss;
        oss << "cannot resample to " << size.width << "x" << size.height;
        throw GeometryError(GeometryErrorKind::InvalidDimensions, oss.str());
    }
    cv::Mat out;
    cv::resize(src, out, cv::Size(size.width, size.height), 0.0, 0.0,
               to_cv_interpolation(filter));
    return out;
}

cv::Mat crop(const cv::Mat& img, const TileBounds& bounds) {
    if (bounds.x1 < 0 || bounds.y1 < 0 || bounds.x2 > img.cols || bounds.y2 > img.rows ||
        bounds.x1 >= bounds.x2 || bounds.y1 >= bounds.y2) {
        std::ostringstream oss;
        oss << "box (" << bounds.x1 << "," << bounds.y1 << "," << bounds.x2 << ","
            << bounds.y2 << ") outside " << img.cols << "x" << img.rows << " image";
        throw GeometryError(GeometryErrorKind::InvalidTileIndex, oss.str());
    }
    return img(bounds.to_rect());
}

int png_compression_level(float image_quality) {
    return static_cast<int>(std::lround((1.0f - clamp_unit(image_quality)) * 10.0f));
}

int jpeg_quality(float image_quality) {
    return static_cast<int>(std::lround(clamp_unit(image_quality) * 100.0f));
}

std::vector<uint8_t> encode_tile(const cv::Mat& tile, TileFormat format, float image_quality) {
    std::vector<int> params;
    std::string ext;
    cv::Mat pixels = tile;

    if (format == TileFormat::JPG) {
        ext = ".jpg";
        params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality(image_quality)};
        if (pixels.channels() == 4) {
            cv::cvtColor(tile, pixels, cv::COLOR_BGRA2BGR);
        }
    } else {
        ext = ".png";
        params = {cv::IMWRITE_PNG_COMPRESSION,
                  std::min(png_compression_level(image_quality), kMaxZlibLevel)};
    }

    std::vector<uint8_t> buf;
    bool ok = false;
    try {
        ok = cv::imencode(ext, pixels, buf, params);
    } catch (const cv::Exception& e) {
        throw EncodeError(tile_format_to_string(format) + ": " + e.what());
    }
    if (!ok || buf.empty()) {
        throw EncodeError("codec rejected " + std::to_string(tile.cols) + "x" +
                          std::to_string(tile.rows) + " " + tile_format_to_string(format) +
                          " tile");
    }
    return buf;
}

} // namespace deepzoom::image
