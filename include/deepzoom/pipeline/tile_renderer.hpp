#pragma once

#include "deepzoom/config/configuration.hpp"
#include "deepzoom/core/types.hpp"
#include "deepzoom/pyramid/descriptor.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace deepzoom::pipeline {

constexpr int kMaxTileOverlap = 10;

// Tiling parameters after clamping and name lookup. Immutable once built.
struct RenderSettings {
    int tile_size = 254;
    int tile_overlap = 1;
    TileFormat tile_format = kDefaultTileFormat;
    float image_quality = 0.8f;
    ResizeFilter resize_filter = kDefaultResizeFilter;
    bool copy_metadata = false;
    int parallel_workers = 1;
};

// Clamps tile_overlap to [0, 10] and image_quality to [0, 1], maps unknown
// format / filter names to png / antialias. Each adjustment is described in
// `adjustments` when given. Throws ValidationError only for tile_size < 1.
RenderSettings resolve_render_settings(const config::TilingConfig& tiling,
                                       int parallel_workers = 1,
                                       std::vector<std::string>* adjustments = nullptr);

struct RenderProgress {
    int level = 0;
    int num_levels = 0;
    int tiles_done = 0;   // within `level`
    int tiles_total = 0;  // within `level`
};

using ProgressFn = std::function<void(const RenderProgress&)>;

struct RenderSummary {
    fs::path descriptor_path;
    fs::path files_root;
    int num_levels = 0;
    int tiles_written = 0;
    double elapsed_s = 0.0;
};

class TileRenderer {
public:
    explicit TileRenderer(const config::TilingConfig& tiling, int parallel_workers = 1);
    explicit TileRenderer(const RenderSettings& settings);

    const RenderSettings& settings() const { return settings_; }

    // Human-readable notes about clamped or substituted parameters.
    const std::vector<std::string>& adjustments() const { return adjustments_; }

    pyramid::PyramidDescriptor make_descriptor(const SourceImage& source) const;

    // Bitmap of `level`: the source buffer itself at full resolution,
    // otherwise a resample of the original source.
    cv::Mat level_image(const SourceImage& source,
                        const pyramid::PyramidDescriptor& descriptor,
                        int level) const;

    // Writes every tile of every level below {B}_files/, then {B}.dzi.
    // Throws on any decode, encode or write failure and StopRequested when
    // `stop_flag` is raised; in both cases the descriptor is not written.
    RenderSummary create(const SourceImage& source,
                         const fs::path& destination,
                         const std::atomic<bool>* stop_flag = nullptr,
                         ProgressFn progress = nullptr) const;

private:
    // Declared first: the constructors fill it while resolving settings_.
    std::vector<std::string> adjustments_;
    RenderSettings settings_;
};

} // namespace deepzoom::pipeline
