#pragma once

#include "deepzoom/core/types.hpp"

#include <filesystem>
#include <string>

namespace deepzoom::pyramid {

namespace fs = std::filesystem;

// On-disk layout of a pyramid rooted at destination P with base name B:
//   {dir(P)}/{B}.dzi
//   {dir(P)}/{B}_files/{level}/{column}_{row}.{format}

fs::path descriptor_path(const fs::path& destination);

fs::path files_root(const fs::path& destination);

fs::path level_directory(const fs::path& root, int level);

std::string tile_filename(int column, int row, TileFormat format);

} // namespace deepzoom::pyramid
