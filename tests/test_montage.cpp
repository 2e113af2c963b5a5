#include "deepzoom/core/errors.hpp"
#include "deepzoom/core/utils.hpp"
#include "deepzoom/montage/montage.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using deepzoom::config::MontageConfig;
using deepzoom::testing::TempDir;

namespace {

MontageConfig small_grid() {
    MontageConfig cfg;
    cfg.grid_cols = 2;
    cfg.grid_rows = 2;
    cfg.image_width = 8;
    cfg.image_height = 6;
    cfg.padding = 5;
    cfg.background = 10;
    cfg.extension = "png";
    return cfg;
}

fs::path write_solid(const fs::path& dir, const std::string& name, int w, int h, int value) {
    cv::Mat img(h, w, CV_8UC3, cv::Scalar::all(value));
    const fs::path path = dir / name;
    REQUIRE(cv::imwrite(path.string(), img));
    return path;
}

} // namespace

TEST_CASE("montage_canvas_geometry") {
    MontageConfig cfg = small_grid();
    auto size = deepzoom::montage::canvas_size(cfg);
    REQUIRE(size.width == 8 * 2 + 5);
    REQUIRE(size.height == 6 * 2 + 5);
    REQUIRE(deepzoom::montage::cell_origin(cfg, 1, 1) == cv::Point(13, 11));
}

TEST_CASE("montage_places_images_row_major_on_background") {
    TempDir tmp("montage");
    std::vector<fs::path> paths = {
        write_solid(tmp.path(), "a.png", 8, 6, 50),
        write_solid(tmp.path(), "b.png", 8, 6, 100),
        write_solid(tmp.path(), "c.png", 8, 6, 150),
    };

    auto result = deepzoom::montage::compose_grid(paths, small_grid());
    const cv::Mat& img = result.image.pixels;

    REQUIRE(result.placed == 3);
    REQUIRE(result.skipped == 0);
    REQUIRE(result.ignored == 0);
    REQUIRE(img.cols == 21);
    REQUIRE(img.rows == 17);
    REQUIRE(img.type() == CV_8UC3);

    REQUIRE(img.at<cv::Vec3b>(0, 0)[0] == 50);
    REQUIRE(img.at<cv::Vec3b>(0, 13)[0] == 100);
    REQUIRE(img.at<cv::Vec3b>(11, 0)[0] == 150);
    // Padding and the empty fourth cell keep the background.
    REQUIRE(img.at<cv::Vec3b>(0, 10)[0] == 10);
    REQUIRE(img.at<cv::Vec3b>(8, 0)[0] == 10);
    REQUIRE(img.at<cv::Vec3b>(16, 20)[0] == 10);
}

TEST_CASE("montage_skips_corrupted_inputs") {
    TempDir tmp("montage_bad");
    const fs::path bad = tmp.path() / "broken.png";
    {
        std::ofstream out(bad, std::ios::binary);
        out << "not an image";
    }
    std::vector<fs::path> paths = {bad, write_solid(tmp.path(), "ok.png", 8, 6, 200)};

    std::vector<std::string> warnings;
    auto result = deepzoom::montage::compose_grid(
        paths, small_grid(), [&](const std::string& w) { warnings.push_back(w); });

    REQUIRE(result.placed == 1);
    REQUIRE(result.skipped == 1);
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].find("Corrupted file") != std::string::npos);
    REQUIRE(result.image.pixels.at<cv::Vec3b>(0, 0)[0] == 10);
    REQUIRE(result.image.pixels.at<cv::Vec3b>(0, 13)[0] == 200);
}

TEST_CASE("montage_ignores_inputs_beyond_capacity") {
    TempDir tmp("montage_extra");
    std::vector<fs::path> paths;
    for (int i = 0; i < 6; ++i) {
        paths.push_back(write_solid(tmp.path(), "img" + std::to_string(i) + ".png", 8, 6, 20 + i));
    }

    std::vector<std::string> warnings;
    auto result = deepzoom::montage::compose_grid(
        paths, small_grid(), [&](const std::string& w) { warnings.push_back(w); });

    REQUIRE(result.placed == 4);
    REQUIRE(result.ignored == 2);
    REQUIRE(warnings.size() == 1);
    REQUIRE(result.image.pixels.at<cv::Vec3b>(11, 13)[0] == 23);
}

TEST_CASE("montage_resizes_mismatched_inputs_into_their_box") {
    TempDir tmp("montage_resize");
    std::vector<fs::path> paths = {write_solid(tmp.path(), "big.png", 16, 12, 90)};

    std::vector<std::string> warnings;
    auto result = deepzoom::montage::compose_grid(
        paths, small_grid(), [&](const std::string& w) { warnings.push_back(w); });

    REQUIRE(result.placed == 1);
    REQUIRE(warnings.size() == 1);
    REQUIRE(result.image.pixels.at<cv::Vec3b>(5, 7)[0] == 90);
    REQUIRE(result.image.pixels.at<cv::Vec3b>(6, 7)[0] == 10);
}

TEST_CASE("montage_rejects_empty_grid") {
    MontageConfig cfg = small_grid();
    cfg.grid_cols = 0;
    REQUIRE_THROWS_AS(deepzoom::montage::compose_grid({}, cfg), deepzoom::ValidationError);
}
