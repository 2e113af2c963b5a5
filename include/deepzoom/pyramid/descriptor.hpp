#pragma once

#include "deepzoom/core/types.hpp"

#include <filesystem>
#include <string>

namespace deepzoom::pyramid {

namespace fs = std::filesystem;

extern const char* const kDeepZoomNamespace;

/**
 * Geometry of a Deep Zoom pyramid.
 *
 * Level numLevels-1 is the full-resolution image, level 0 the coarsest
 * (1x1 pixel for any source). Level sizes are derived from the full size by
 * ceiling division with a power of two, never by halving the previous level.
 * Every query checks its arguments and throws GeometryError on a bad level
 * or tile index.
 */
class PyramidDescriptor {
public:
    PyramidDescriptor(int width, int height, int tile_size, int tile_overlap,
                      TileFormat tile_format);

    int width() const { return width_; }
    int height() const { return height_; }
    int tile_size() const { return tile_size_; }
    int tile_overlap() const { return tile_overlap_; }
    TileFormat tile_format() const { return tile_format_; }

    // ceil(log2(max(width, height))) + 1
    int num_levels() const { return num_levels_; }

    // 0.5^((num_levels - 1) - level)
    double scale(int level) const;

    LevelSize dimensions(int level) const;

    TileGrid tile_grid(int level) const;

    // Pixel box of tile (column, row). Interior edges carry tile_overlap
    // extra pixels; the box is clipped to the level size.
    TileBounds tile_bounds(int level, int column, int row) const;

    // DZI document text. Identical geometry yields identical bytes.
    std::string to_xml() const;

    // Writes {B}.dzi next to `destination` via temp file + rename.
    void save(const fs::path& destination) const;

    // Deletes {B}.dzi and {B}_files/. Absent files are ignored.
    static void remove(const fs::path& destination);

private:
    void check_level(int level) const;
    int level_shift(int level) const { return num_levels_ - 1 - level; }

    int width_;
    int height_;
    int tile_size_;
    int tile_overlap_;
    TileFormat tile_format_;
    int num_levels_;
};

} // namespace deepzoom::pyramid
