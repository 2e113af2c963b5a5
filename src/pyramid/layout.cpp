#include "deepzoom/pyramid/layout.hpp"

namespace deepzoom::pyramid {

fs::path descriptor_path(const fs::path& destination) {
    fs::path p = destination;
    p.replace_extension(".dzi");
    return p;
}

fs::path files_root(const fs::path& destination) {
    return destination.parent_path() / (destination.stem().string() + "_files");
}

fs::path level_directory(const fs::path& root, int level) {
    return root / std::to_string(level);
}

std::string tile_filename(int column, int row, TileFormat format) {
    return std::to_string(column) + "_" + std::to_string(row) + "." +
           tile_format_to_string(format);
}

} // namespace deepzoom::pyramid
