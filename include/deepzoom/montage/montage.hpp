#pragma once

#include "deepzoom/config/configuration.hpp"
#include "deepzoom/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace deepzoom::montage {

struct MontageResult {
    SourceImage image;
    int placed = 0;
    int skipped = 0;   // unreadable inputs; their boxes stay background
    int ignored = 0;   // inputs beyond the grid capacity
};

using WarningFn = std::function<void(const std::string&)>;

// Canvas size for a cols x rows grid of w x h images separated by padding.
LevelSize canvas_size(const config::MontageConfig& cfg);

// Origin of grid cell (col, row) on the canvas.
cv::Point cell_origin(const config::MontageConfig& cfg, int col, int row);

// Pastes `paths` row-major into a 3-channel canvas. Image i lands in column
// i % grid_cols, row i / grid_cols. Inputs with a different size are
// resized into their box.
MontageResult compose_grid(const std::vector<fs::path>& paths,
                           const config::MontageConfig& cfg,
                           WarningFn warn = nullptr);

} // namespace deepzoom::montage
