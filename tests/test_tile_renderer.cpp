#include "deepzoom/core/errors.hpp"
#include "deepzoom/core/utils.hpp"
#include "deepzoom/image/processing.hpp"
#include "deepzoom/pipeline/tile_renderer.hpp"
#include "deepzoom/pyramid/layout.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using deepzoom::SourceImage;
using deepzoom::TileBounds;
using deepzoom::TileFormat;
using deepzoom::TileGrid;
using deepzoom::config::TilingConfig;
using deepzoom::pipeline::TileRenderer;
using deepzoom::pyramid::PyramidDescriptor;
using deepzoom::testing::TempDir;
using deepzoom::testing::make_pattern_image;

namespace {

TilingConfig small_tiles(int tile_size, int overlap, const std::string& format = "png") {
    TilingConfig t;
    t.tile_size = tile_size;
    t.tile_overlap = overlap;
    t.tile_format = format;
    return t;
}

std::set<std::string> list_names(const fs::path& dir) {
    std::set<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.insert(entry.path().filename().string());
    }
    return names;
}

bool same_pixels(const cv::Mat& a, const cv::Mat& b) {
    if (a.size() != b.size() || a.type() != b.type()) return false;
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    return cv::countNonZero(diff.reshape(1)) == 0;
}

// Reassembles a level from its tile files, dropping each tile's overlap border.
cv::Mat stitch_level(const PyramidDescriptor& d, int level, const fs::path& level_dir,
                     int type) {
    const auto size = d.dimensions(level);
    const TileGrid grid = d.tile_grid(level);
    const int ts = d.tile_size();
    cv::Mat canvas(size.height, size.width, type, cv::Scalar::all(0));

    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.columns; ++col) {
            const fs::path p =
                level_dir / deepzoom::pyramid::tile_filename(col, row, d.tile_format());
            cv::Mat tile = cv::imread(p.string(), cv::IMREAD_UNCHANGED);
            REQUIRE_FALSE(tile.empty());

            const TileBounds b = d.tile_bounds(level, col, row);
            REQUIRE(tile.cols == b.width());
            REQUIRE(tile.rows == b.height());

            const int left = col * ts - b.x1;
            const int top = row * ts - b.y1;
            const int core_w = std::min(ts, size.width - col * ts);
            const int core_h = std::min(ts, size.height - row * ts);
            tile(cv::Rect(left, top, core_w, core_h))
                .copyTo(canvas(cv::Rect(col * ts, row * ts, core_w, core_h)));
        }
    }
    return canvas;
}

} // namespace

TEST_CASE("create_writes_every_tile_of_every_level_and_descriptor") {
    TempDir tmp("render_layout");
    const SourceImage src = make_pattern_image(300, 200);
    TileRenderer renderer(small_tiles(64, 1));
    const fs::path dest = tmp.path() / "pyr.dzi";

    const auto summary = renderer.create(src, dest);

    const PyramidDescriptor d = renderer.make_descriptor(src);
    REQUIRE(d.num_levels() == 10);
    REQUIRE(summary.num_levels == 10);
    REQUIRE(summary.descriptor_path == dest);
    REQUIRE(summary.files_root == tmp.path() / "pyr_files");
    REQUIRE(fs::exists(dest));
    REQUIRE(deepzoom::testing::read_text(dest) == d.to_xml());

    int expected_tiles = 0;
    for (int level = 0; level < d.num_levels(); ++level) {
        const fs::path level_dir = summary.files_root / std::to_string(level);
        REQUIRE(fs::is_directory(level_dir));
        const TileGrid grid = d.tile_grid(level);
        std::set<std::string> expected;
        for (int row = 0; row < grid.rows; ++row) {
            for (int col = 0; col < grid.columns; ++col) {
                expected.insert(std::to_string(col) + "_" + std::to_string(row) + ".png");
            }
        }
        REQUIRE(list_names(level_dir) == expected);
        expected_tiles += grid.count();
    }
    REQUIRE(summary.tiles_written == expected_tiles);
    REQUIRE(list_names(summary.files_root).size() == 10);
}

TEST_CASE("stitched_tiles_reproduce_each_level_exactly") {
    TempDir tmp("render_stitch");
    const SourceImage src = make_pattern_image(300, 200);
    TileRenderer renderer(small_tiles(64, 2));
    const fs::path dest = tmp.path() / "pyr.dzi";
    const auto summary = renderer.create(src, dest);
    const PyramidDescriptor d = renderer.make_descriptor(src);

    const int top = d.num_levels() - 1;
    for (int level : {top, top - 1, top - 3}) {
        INFO("level " << level);
        const cv::Mat expected = renderer.level_image(src, d, level);
        const cv::Mat stitched =
            stitch_level(d, level, summary.files_root / std::to_string(level), expected.type());
        REQUIRE(same_pixels(stitched, expected));
    }
}

TEST_CASE("overlap_wider_than_tile_still_stitches") {
    TempDir tmp("render_wide_overlap");
    const SourceImage src = make_pattern_image(40, 30);
    TileRenderer renderer(small_tiles(4, 5));
    REQUIRE(renderer.settings().tile_overlap == 5);

    const auto summary = renderer.create(src, tmp.path() / "wide.dzi");
    REQUIRE(fs::exists(summary.descriptor_path));

    const PyramidDescriptor d = renderer.make_descriptor(src);
    for (int level = 0; level < d.num_levels(); ++level) {
        INFO("level " << level);
        const cv::Mat expected = renderer.level_image(src, d, level);
        const cv::Mat stitched =
            stitch_level(d, level, summary.files_root / std::to_string(level), expected.type());
        REQUIRE(same_pixels(stitched, expected));
    }
}

TEST_CASE("full_resolution_level_reuses_source_buffer") {
    const SourceImage src = make_pattern_image(120, 90);
    TileRenderer renderer(small_tiles(32, 1));
    const PyramidDescriptor d = renderer.make_descriptor(src);

    const cv::Mat top = renderer.level_image(src, d, d.num_levels() - 1);
    REQUIRE(top.data == src.pixels.data);

    const cv::Mat lower = renderer.level_image(src, d, d.num_levels() - 3);
    REQUIRE(lower.cols == 30);
    REQUIRE(lower.rows == 23);
    REQUIRE(lower.data != src.pixels.data);
}

TEST_CASE("each_level_is_resampled_from_the_original") {
    const SourceImage src = make_pattern_image(257, 131);
    TilingConfig t = small_tiles(64, 1);
    t.resize_filter = "bilinear";
    TileRenderer renderer(t);
    const PyramidDescriptor d = renderer.make_descriptor(src);

    for (int level = 0; level < d.num_levels() - 1; ++level) {
        const auto size = d.dimensions(level);
        const cv::Mat direct =
            deepzoom::image::resample(src.pixels, size, deepzoom::ResizeFilter::BILINEAR);
        REQUIRE(same_pixels(renderer.level_image(src, d, level), direct));
    }
}

TEST_CASE("two_destinations_get_identical_descriptors_and_tile_counts") {
    TempDir tmp("render_idem");
    const SourceImage src = make_pattern_image(150, 97);
    TileRenderer renderer(small_tiles(40, 1));

    const auto a = renderer.create(src, tmp.path() / "a" / "one.dzi");
    const auto b = renderer.create(src, tmp.path() / "b" / "two.dzi");

    REQUIRE(deepzoom::testing::read_bytes(a.descriptor_path) ==
            deepzoom::testing::read_bytes(b.descriptor_path));
    REQUIRE(a.tiles_written == b.tiles_written);
    for (int level = 0; level < a.num_levels; ++level) {
        REQUIRE(list_names(a.files_root / std::to_string(level)) ==
                list_names(b.files_root / std::to_string(level)));
    }
}

TEST_CASE("parallel_workers_produce_the_same_tiles_as_serial") {
    TempDir tmp("render_parallel");
    const SourceImage src = make_pattern_image(333, 211);

    TileRenderer serial(small_tiles(50, 1), 1);
    TileRenderer parallel(small_tiles(50, 1), 4);
    const auto s = serial.create(src, tmp.path() / "serial.dzi");
    const auto p = parallel.create(src, tmp.path() / "parallel.dzi");

    REQUIRE(s.tiles_written == p.tiles_written);
    for (int level = 0; level < s.num_levels; ++level) {
        const fs::path sd = s.files_root / std::to_string(level);
        const fs::path pd = p.files_root / std::to_string(level);
        const auto names = list_names(sd);
        REQUIRE(names == list_names(pd));
        for (const auto& name : names) {
            REQUIRE(deepzoom::testing::read_bytes(sd / name) ==
                    deepzoom::testing::read_bytes(pd / name));
        }
    }
}

TEST_CASE("progress_reports_every_tile_of_every_level") {
    TempDir tmp("render_progress");
    const SourceImage src = make_pattern_image(100, 60);
    TileRenderer renderer(small_tiles(32, 1), 3);
    const PyramidDescriptor d = renderer.make_descriptor(src);

    // The callback runs on worker threads (serialized); assert afterwards.
    std::vector<deepzoom::pipeline::RenderProgress> seen;
    renderer.create(src, tmp.path() / "p.dzi", nullptr,
                    [&](const deepzoom::pipeline::RenderProgress& p) { seen.push_back(p); });

    std::map<int, int> max_done;
    std::map<int, int> calls;
    for (const auto& p : seen) {
        REQUIRE(p.num_levels == d.num_levels());
        REQUIRE(p.tiles_total == d.tile_grid(p.level).count());
        max_done[p.level] = std::max(max_done[p.level], p.tiles_done);
        ++calls[p.level];
    }

    REQUIRE(static_cast<int>(max_done.size()) == d.num_levels());
    for (int level = 0; level < d.num_levels(); ++level) {
        REQUIRE(max_done[level] == d.tile_grid(level).count());
        REQUIRE(calls[level] == d.tile_grid(level).count());
    }
}

TEST_CASE("raised_stop_flag_aborts_before_any_level") {
    TempDir tmp("render_stop_early");
    const SourceImage src = make_pattern_image(80, 80);
    TileRenderer renderer(small_tiles(32, 1));
    std::atomic<bool> stop{true};

    const fs::path dest = tmp.path() / "stopped.dzi";
    REQUIRE_THROWS_AS(renderer.create(src, dest, &stop), deepzoom::StopRequested);
    REQUIRE_FALSE(fs::exists(dest));
}

TEST_CASE("stop_during_render_leaves_partial_levels_without_descriptor") {
    for (int workers : {1, 4}) {
        INFO("workers " << workers);
        TempDir tmp("render_stop_mid");
        const SourceImage src = make_pattern_image(400, 300);
        TileRenderer renderer(small_tiles(32, 1), workers);
        std::atomic<bool> stop{false};
        const fs::path dest = tmp.path() / "partial.dzi";

        auto raise_at_level_5 = [&](const deepzoom::pipeline::RenderProgress& p) {
            if (p.level == 5) stop.store(true);
        };
        REQUIRE_THROWS_AS(renderer.create(src, dest, &stop, raise_at_level_5),
                          deepzoom::StopRequested);

        REQUIRE_FALSE(fs::exists(dest));
        const fs::path root = tmp.path() / "partial_files";
        REQUIRE(fs::is_directory(root / "0"));
        REQUIRE(fs::exists(root / "0" / "0_0.png"));
        REQUIRE_FALSE(fs::exists(root / "8"));
    }
}

TEST_CASE("unwritable_destination_fails_without_descriptor") {
    TempDir tmp("render_fail");
    const SourceImage src = make_pattern_image(40, 40);
    TileRenderer renderer(small_tiles(16, 1));

    // A regular file where the tile directory root has to go.
    std::ofstream(tmp.path() / "blocked_files") << "not a directory";
    const fs::path dest = tmp.path() / "blocked.dzi";

    REQUIRE_THROWS_AS(renderer.create(src, dest), deepzoom::WriteError);
    REQUIRE_FALSE(fs::exists(dest));
}

TEST_CASE("empty_source_is_rejected") {
    TempDir tmp("render_empty");
    TileRenderer renderer(small_tiles(16, 1));
    REQUIRE_THROWS_AS(renderer.create(SourceImage{}, tmp.path() / "e.dzi"),
                      deepzoom::DecodeError);
    REQUIRE_FALSE(fs::exists(tmp.path() / "e.dzi"));
}

TEST_CASE("jpg_tiles_from_bgra_source") {
    TempDir tmp("render_jpg");
    SourceImage src;
    src.pixels = cv::Mat(70, 90, CV_8UC4, cv::Scalar(40, 80, 120, 255));
    src.color_mode = deepzoom::ColorMode::BGRA;
    TilingConfig t = small_tiles(32, 1, "jpg");
    t.image_quality = 0.9f;
    TileRenderer renderer(t);

    const auto summary = renderer.create(src, tmp.path() / "photo.dzi");
    const PyramidDescriptor d = renderer.make_descriptor(src);

    REQUIRE(d.tile_format() == TileFormat::JPG);
    const int top = d.num_levels() - 1;
    const fs::path tile = summary.files_root / std::to_string(top) / "2_2.jpg";
    REQUIRE(fs::exists(tile));
    cv::Mat decoded = cv::imread(tile.string(), cv::IMREAD_UNCHANGED);
    REQUIRE(decoded.channels() == 3);
    REQUIRE(decoded.cols == d.tile_bounds(top, 2, 2).width());
    REQUIRE(deepzoom::testing::read_text(summary.descriptor_path).find("Format=\"jpg\"") !=
            std::string::npos);
}

TEST_CASE("one_pixel_source_yields_single_level") {
    TempDir tmp("render_tiny");
    SourceImage src;
    src.pixels = cv::Mat(1, 1, CV_8UC1, cv::Scalar(200));
    src.color_mode = deepzoom::ColorMode::GRAY;
    TileRenderer renderer(small_tiles(254, 1));

    const auto summary = renderer.create(src, tmp.path() / "dot.dzi");

    REQUIRE(summary.num_levels == 1);
    REQUIRE(summary.tiles_written == 1);
    cv::Mat tile = cv::imread((summary.files_root / "0" / "0_0.png").string(),
                              cv::IMREAD_UNCHANGED);
    REQUIRE(tile.cols == 1);
    REQUIRE(tile.rows == 1);
    REQUIRE(tile.at<uchar>(0, 0) == 200);
}
