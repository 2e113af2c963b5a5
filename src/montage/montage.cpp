#include "deepzoom/montage/montage.hpp"
#include "deepzoom/core/errors.hpp"
#include "deepzoom/io/image_io.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace deepzoom::montage {

namespace {

cv::Mat to_bgr(const cv::Mat& img) {
    cv::Mat out;
    switch (img.channels()) {
        case 1:
            cv::cvtColor(img, out, cv::COLOR_GRAY2BGR);
            return out;
        case 4:
            cv::cvtColor(img, out, cv::COLOR_BGRA2BGR);
            return out;
        default:
            return img;
    }
}

} // namespace

LevelSize canvas_size(const config::MontageConfig& cfg) {
    return LevelSize{
        cfg.image_width * cfg.grid_cols + cfg.padding * (cfg.grid_cols - 1),
        cfg.image_height * cfg.grid_rows + cfg.padding * (cfg.grid_rows - 1)};
}

cv::Point cell_origin(const config::MontageConfig& cfg, int col, int row) {
    return cv::Point(col * (cfg.image_width + cfg.padding),
                     row * (cfg.image_height + cfg.padding));
}

MontageResult compose_grid(const std::vector<fs::path>& paths,
                           const config::MontageConfig& cfg,
                           WarningFn warn) {
    if (cfg.grid_cols < 1 || cfg.grid_rows < 1 || cfg.image_width < 1 ||
        cfg.image_height < 1 || cfg.padding < 0) {
        throw ValidationError("montage grid and image dimensions must be positive");
    }

    const LevelSize size = canvas_size(cfg);
    const int capacity = cfg.grid_cols * cfg.grid_rows;

    MontageResult result;
    result.image.pixels = cv::Mat(size.height, size.width, CV_8UC3,
                                  cv::Scalar::all(cfg.background));
    result.image.color_mode = ColorMode::BGR;

    if (static_cast<int>(paths.size()) > capacity) {
        result.ignored = static_cast<int>(paths.size()) - capacity;
        if (warn) {
            warn("grid " + std::to_string(cfg.grid_cols) + "x" +
                 std::to_string(cfg.grid_rows) + " holds fewer cells than the " +
                 std::to_string(paths.size()) + " input images");
        }
    }

    const int n = std::min(capacity, static_cast<int>(paths.size()));
    for (int i = 0; i < n; ++i) {
        const int col = i % cfg.grid_cols;
        const int row = i / cfg.grid_cols;

        SourceImage src;
        try {
            src = io::read_image(paths[static_cast<size_t>(i)]);
        } catch (const DecodeError& e) {
            ++result.skipped;
            if (warn) warn("Corrupted file: " + paths[static_cast<size_t>(i)].string() +
                           " (" + e.what() + ")");
            continue;
        }

        cv::Mat tile = to_bgr(src.pixels);
        if (tile.cols != cfg.image_width || tile.rows != cfg.image_height) {
            if (warn) {
                warn(paths[static_cast<size_t>(i)].string() + " is " +
                     std::to_string(tile.cols) + "x" + std::to_string(tile.rows) +
                     ", resizing into " + std::to_string(cfg.image_width) + "x" +
                     std::to_string(cfg.image_height) + " box");
            }
            cv::Mat resized;
            cv::resize(tile, resized, cv::Size(cfg.image_width, cfg.image_height), 0.0, 0.0,
                       cv::INTER_AREA);
            tile = resized;
        }

        const cv::Point origin = cell_origin(cfg, col, row);
        tile.copyTo(result.image.pixels(
            cv::Rect(origin.x, origin.y, cfg.image_width, cfg.image_height)));
        ++result.placed;
    }

    return result;
}

} // namespace deepzoom::montage
