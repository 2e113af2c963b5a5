#include "deepzoom/pyramid/descriptor.hpp"
#include "deepzoom/pyramid/layout.hpp"
#include "deepzoom/core/errors.hpp"
#include "deepzoom/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>

namespace deepzoom::pyramid {

const char* const kDeepZoomNamespace = "http://schemas.microsoft.com/deepzoom/2008";

namespace {

int compute_num_levels(int width, int height) {
    const int64_t max_dim = std::max(width, height);
    // Smallest n with 2^n >= max_dim, i.e. ceil(log2(max_dim)), without
    // floating point rounding.
    int n = 0;
    while ((int64_t{1} << n) < max_dim) {
        ++n;
    }
    return n + 1;
}

int ceil_div(int64_t value, int64_t divisor) {
    return static_cast<int>((value + divisor - 1) / divisor);
}

} // namespace

PyramidDescriptor::PyramidDescriptor(int width, int height, int tile_size,
                                     int tile_overlap, TileFormat tile_format)
    : width_(width),
      height_(height),
      tile_size_(tile_size),
      tile_overlap_(tile_overlap),
      tile_format_(tile_format),
      num_levels_(0) {
    if (width <= 0 || height <= 0) {
        std::ostringstream oss;
        oss << "image size " << width << "x" << height << " must be positive";
        throw GeometryError(GeometryErrorKind::InvalidDimensions, oss.str());
    }
    if (tile_size < 1) {
        throw ValidationError("tile_size must be >= 1");
    }
    if (tile_overlap < 0) {
        throw ValidationError("tile_overlap must be >= 0");
    }
    num_levels_ = compute_num_levels(width, height);
}

void PyramidDescriptor::check_level(int level) const {
    if (level < 0 || level >= num_levels_) {
        std::ostringstream oss;
        oss << "level " << level << " outside [0, " << num_levels_ << ")";
        throw GeometryError(GeometryErrorKind::InvalidLevel, oss.str());
    }
}

double PyramidDescriptor::scale(int level) const {
    check_level(level);
    return std::ldexp(1.0, -level_shift(level));
}

LevelSize PyramidDescriptor::dimensions(int level) const {
    check_level(level);
    const int64_t divisor = int64_t{1} << level_shift(level);
    return LevelSize{ceil_div(width_, divisor), ceil_div(height_, divisor)};
}

TileGrid PyramidDescriptor::tile_grid(int level) const {
    const LevelSize size = dimensions(level);
    return TileGrid{ceil_div(size.width, tile_size_), ceil_div(size.height, tile_size_)};
}

TileBounds PyramidDescriptor::tile_bounds(int level, int column, int row) const {
    const TileGrid grid = tile_grid(level);
    if (column < 0 || column >= grid.columns || row < 0 || row >= grid.rows) {
        std::ostringstream oss;
        oss << "tile (" << column << ", " << row << ") outside " << grid.columns
            << "x" << grid.rows << " grid of level " << level;
        throw GeometryError(GeometryErrorKind::InvalidTileIndex, oss.str());
    }

    const LevelSize size = dimensions(level);

    // Overlap extends each tile on its interior sides only. Both ends are
    // clamped to the level so an overlap wider than the tile never leaves it.
    const int core_x = column * tile_size_;
    const int core_y = row * tile_size_;
    const int x1 = std::max(0, core_x - tile_overlap_);
    const int y1 = std::max(0, core_y - tile_overlap_);
    const int x2 = std::min(core_x + tile_size_ + tile_overlap_, size.width);
    const int y2 = std::min(core_y + tile_size_ + tile_overlap_, size.height);
    return TileBounds{x1, y1, x2, y2};
}

std::string PyramidDescriptor::to_xml() const {
    std::ostringstream oss;
    oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        << "<Image TileSize=\"" << tile_size_ << "\""
        << " Overlap=\"" << tile_overlap_ << "\""
        << " Format=\"" << tile_format_to_string(tile_format_) << "\""
        << " xmlns=\"" << kDeepZoomNamespace << "\">"
        << "<Size Width=\"" << width_ << "\" Height=\"" << height_ << "\"/>"
        << "</Image>";
    return oss.str();
}

void PyramidDescriptor::save(const fs::path& destination) const {
    const std::string xml = to_xml();
    const fs::path path = descriptor_path(destination);
    if (!path.parent_path().empty()) {
        core::ensure_directory(path.parent_path());
    }
    core::write_bytes_atomic(path, std::vector<uint8_t>(xml.begin(), xml.end()));
}

void PyramidDescriptor::remove(const fs::path& destination) {
    std::error_code ec;
    const fs::path dzi = descriptor_path(destination);
    fs::remove(dzi, ec);
    if (ec) {
        throw IOError("Cannot remove " + dzi.string() + ": " + ec.message());
    }

    const fs::path root = files_root(destination);
    fs::remove_all(root, ec);
    if (ec) {
        throw IOError("Cannot remove " + root.string() + ": " + ec.message());
    }
}

} // namespace deepzoom::pyramid
