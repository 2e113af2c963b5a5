#include "deepzoom/io/image_io.hpp"
#include "deepzoom/core/errors.hpp"
#include "deepzoom/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <vector>

namespace deepzoom::io {

bool is_supported_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".tif" ||
           ext == ".tiff" || ext == ".bmp" || ext == ".webp" || ext == ".ppm" ||
           ext == ".pgm";
}

SourceImage to_source_image(const cv::Mat& pixels) {
    if (pixels.empty()) {
        throw DecodeError("empty bitmap");
    }

    cv::Mat img = pixels;
    if (img.depth() != CV_8U) {
        double scale = 1.0;
        if (img.depth() == CV_16U) {
            scale = 1.0 / 257.0;
        } else if (img.depth() == CV_32F || img.depth() == CV_64F) {
            scale = 255.0;
        }
        cv::Mat converted;
        img.convertTo(converted, CV_8U, scale);
        img = converted;
    }

    if (img.channels() == 2) {
        // Gray + alpha: replicate the gray plane into BGR and keep alpha.
        std::vector<cv::Mat> planes;
        cv::split(img, planes);
        cv::Mat bgra;
        cv::merge(std::vector<cv::Mat>{planes[0], planes[0], planes[0], planes[1]}, bgra);
        img = bgra;
    }

    SourceImage out;
    switch (img.channels()) {
        case 1:
            out.color_mode = ColorMode::GRAY;
            break;
        case 3:
            out.color_mode = ColorMode::BGR;
            break;
        case 4:
            out.color_mode = ColorMode::BGRA;
            break;
        default:
            throw DecodeError("unsupported channel count " + std::to_string(img.channels()));
    }
    out.pixels = img;
    return out;
}

SourceImage read_image(const fs::path& path) {
    if (!fs::exists(path)) {
        throw DecodeError("file not found: " + path.string());
    }

    cv::Mat img;
    try {
        img = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(path.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw DecodeError("cannot decode " + path.string());
    }
    return to_source_image(img);
}

} // namespace deepzoom::io
