#include "deepzoom/pipeline/tile_renderer.hpp"

#include "deepzoom/core/errors.hpp"
#include "deepzoom/core/utils.hpp"
#include "deepzoom/image/processing.hpp"
#include "deepzoom/pyramid/layout.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>

namespace deepzoom::pipeline {

namespace {

// Everything one tile write needs. Shared read-only by all workers of a level.
struct LevelContext {
    const pyramid::PyramidDescriptor& descriptor;
    const RenderSettings& settings;
    int level;
    cv::Mat image;
    fs::path dir;
};

// Row-major work item `index` of the level's tile grid.
TileCoordinate tile_at(const LevelContext& ctx, const TileGrid& grid, int index) {
    return TileCoordinate{ctx.level, index % grid.columns, index / grid.columns};
}

void write_tile(const LevelContext& ctx, const TileCoordinate& tc) {
    const TileBounds bounds = ctx.descriptor.tile_bounds(tc.level, tc.column, tc.row);
    const cv::Mat tile = image::crop(ctx.image, bounds);
    const std::vector<uint8_t> bytes =
        image::encode_tile(tile, ctx.settings.tile_format, ctx.settings.image_quality);
    core::write_bytes(
        ctx.dir / pyramid::tile_filename(tc.column, tc.row, ctx.settings.tile_format), bytes);
}

bool stop_requested(const std::atomic<bool>* stop_flag) {
    return stop_flag && stop_flag->load();
}

// Writes all tiles of one level, row-major, on up to `workers` threads.
int render_level(const LevelContext& ctx, int workers, int num_levels,
                 const std::atomic<bool>* stop_flag, const ProgressFn& progress) {
    const TileGrid grid = ctx.descriptor.tile_grid(ctx.level);
    const int total = grid.count();

    std::mutex progress_mutex;
    std::atomic<int> tiles_done{0};
    auto report = [&]() {
        const int done = ++tiles_done;
        if (progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            progress(RenderProgress{ctx.level, num_levels, done, total});
        }
    };

    if (workers <= 1 || total <= 1) {
        for (int ti = 0; ti < total; ++ti) {
            if (stop_requested(stop_flag)) {
                throw StopRequested();
            }
            write_tile(ctx, tile_at(ctx, grid, ti));
            report();
        }
        return tiles_done.load();
    }

    std::atomic<int> next_tile{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (!failed.load()) {
            const int ti = next_tile.fetch_add(1);
            if (ti >= total) {
                break;
            }
            try {
                if (stop_requested(stop_flag)) {
                    throw StopRequested();
                }
                write_tile(ctx, tile_at(ctx, grid, ti));
                report();
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true);
            }
        }
    };

    const int n_threads = std::min(workers, total);
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(n_threads));
    for (int w = 0; w < n_threads; ++w) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return tiles_done.load();
}

} // namespace

RenderSettings resolve_render_settings(const config::TilingConfig& tiling,
                                       int parallel_workers,
                                       std::vector<std::string>* adjustments) {
    auto note = [&](const std::string& msg) {
        if (adjustments) adjustments->push_back(msg);
    };

    if (tiling.tile_size < 1) {
        throw ValidationError("tile_size must be >= 1, got " + std::to_string(tiling.tile_size));
    }

    RenderSettings s;
    s.tile_size = tiling.tile_size;
    s.copy_metadata = tiling.copy_metadata;

    s.tile_overlap = std::min(std::max(tiling.tile_overlap, 0), kMaxTileOverlap);
    if (s.tile_overlap != tiling.tile_overlap) {
        note("tile_overlap " + std::to_string(tiling.tile_overlap) + " clamped to " +
             std::to_string(s.tile_overlap));
    }

    if (std::isnan(tiling.image_quality)) {
        note("image_quality is not a number, using " + std::to_string(s.image_quality));
    } else {
        s.image_quality = std::min(std::max(tiling.image_quality, 0.0f), 1.0f);
        if (s.image_quality != tiling.image_quality) {
            std::ostringstream oss;
            oss << "image_quality " << tiling.image_quality << " clamped to " << s.image_quality;
            note(oss.str());
        }
    }

    if (auto format = lookup_tile_format(tiling.tile_format)) {
        s.tile_format = *format;
    } else {
        s.tile_format = kDefaultTileFormat;
        note("unsupported tile_format '" + tiling.tile_format + "', using " +
             tile_format_to_string(s.tile_format));
    }

    if (auto filter = lookup_resize_filter(tiling.resize_filter)) {
        s.resize_filter = *filter;
    } else {
        s.resize_filter = kDefaultResizeFilter;
        note("unknown resize_filter '" + tiling.resize_filter + "', using " +
             resize_filter_to_string(s.resize_filter));
    }

    s.parallel_workers = std::max(parallel_workers, 1);
    if (s.parallel_workers != parallel_workers) {
        note("parallel_workers " + std::to_string(parallel_workers) + " raised to 1");
    }

    return s;
}

TileRenderer::TileRenderer(const config::TilingConfig& tiling, int parallel_workers)
    : settings_(resolve_render_settings(tiling, parallel_workers, &adjustments_)) {}

TileRenderer::TileRenderer(const RenderSettings& settings) {
    config::TilingConfig tiling;
    tiling.tile_size = settings.tile_size;
    tiling.tile_overlap = settings.tile_overlap;
    tiling.tile_format = tile_format_to_string(settings.tile_format);
    tiling.image_quality = settings.image_quality;
    tiling.resize_filter = resize_filter_to_string(settings.resize_filter);
    tiling.copy_metadata = settings.copy_metadata;
    settings_ = resolve_render_settings(tiling, settings.parallel_workers, &adjustments_);
}

pyramid::PyramidDescriptor TileRenderer::make_descriptor(const SourceImage& source) const {
    return pyramid::PyramidDescriptor(source.width(), source.height(), settings_.tile_size,
                                      settings_.tile_overlap, settings_.tile_format);
}

cv::Mat TileRenderer::level_image(const SourceImage& source,
                                  const pyramid::PyramidDescriptor& descriptor,
                                  int level) const {
    const LevelSize size = descriptor.dimensions(level);
    if (size.width == source.width() && size.height == source.height()) {
        return source.pixels;
    }
    return image::resample(source.pixels, size, settings_.resize_filter);
}

RenderSummary TileRenderer::create(const SourceImage& source,
                                   const fs::path& destination,
                                   const std::atomic<bool>* stop_flag,
                                   ProgressFn progress) const {
    const auto t0 = std::chrono::steady_clock::now();

    if (source.empty()) {
        throw DecodeError("source bitmap is empty");
    }

    const pyramid::PyramidDescriptor descriptor = make_descriptor(source);

    RenderSummary summary;
    summary.descriptor_path = pyramid::descriptor_path(destination);
    summary.files_root = core::ensure_directory(pyramid::files_root(destination));
    summary.num_levels = descriptor.num_levels();

    for (int level = 0; level < descriptor.num_levels(); ++level) {
        if (stop_requested(stop_flag)) {
            throw StopRequested();
        }

        const LevelContext ctx{
            descriptor,
            settings_,
            level,
            level_image(source, descriptor, level),
            core::ensure_directory(pyramid::level_directory(summary.files_root, level))};

        summary.tiles_written += render_level(ctx, settings_.parallel_workers,
                                              descriptor.num_levels(), stop_flag, progress);
    }

    if (stop_requested(stop_flag)) {
        throw StopRequested();
    }
    descriptor.save(destination);

    summary.elapsed_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t0).count();
    return summary;
}

} // namespace deepzoom::pipeline
