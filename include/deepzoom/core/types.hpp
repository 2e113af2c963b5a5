#pragma once

#include <opencv2/core.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace deepzoom {

namespace fs = std::filesystem;

// Tile encoding
enum class TileFormat {
    PNG,
    JPG
};

constexpr TileFormat kDefaultTileFormat = TileFormat::PNG;

inline std::string tile_format_to_string(TileFormat format) {
    switch (format) {
        case TileFormat::PNG: return "png";
        case TileFormat::JPG: return "jpg";
        default: return "png";
    }
}

inline std::string normalize_name(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

// Returns std::nullopt for names outside the table; callers decide the fallback.
inline std::optional<TileFormat> lookup_tile_format(const std::string& name) {
    static const std::map<std::string, TileFormat> kTable = {
        {"png", TileFormat::PNG},
        {"jpg", TileFormat::JPG},
        {"jpeg", TileFormat::JPG},
    };
    auto it = kTable.find(normalize_name(name));
    if (it == kTable.end()) return std::nullopt;
    return it->second;
}

// Resampling kernel used to build the lower pyramid levels
enum class ResizeFilter {
    NEAREST,
    BILINEAR,
    BICUBIC,
    CUBIC,
    LANCZOS,
    ANTIALIAS
};

constexpr ResizeFilter kDefaultResizeFilter = ResizeFilter::ANTIALIAS;

inline std::string resize_filter_to_string(ResizeFilter filter) {
    switch (filter) {
        case ResizeFilter::NEAREST: return "nearest";
        case ResizeFilter::BILINEAR: return "bilinear";
        case ResizeFilter::BICUBIC: return "bicubic";
        case ResizeFilter::CUBIC: return "cubic";
        case ResizeFilter::LANCZOS: return "lanczos";
        case ResizeFilter::ANTIALIAS: return "antialias";
        default: return "antialias";
    }
}

inline std::optional<ResizeFilter> lookup_resize_filter(const std::string& name) {
    static const std::map<std::string, ResizeFilter> kTable = {
        {"nearest", ResizeFilter::NEAREST},
        {"bilinear", ResizeFilter::BILINEAR},
        {"bicubic", ResizeFilter::BICUBIC},
        {"cubic", ResizeFilter::CUBIC},
        {"lanczos", ResizeFilter::LANCZOS},
        {"antialias", ResizeFilter::ANTIALIAS},
    };
    auto it = kTable.find(normalize_name(name));
    if (it == kTable.end()) return std::nullopt;
    return it->second;
}

// Color mode of a decoded bitmap (OpenCV channel order)
enum class ColorMode {
    GRAY,
    BGR,
    BGRA
};

inline std::string color_mode_to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::GRAY: return "GRAY";
        case ColorMode::BGR: return "BGR";
        case ColorMode::BGRA: return "BGRA";
        default: return "UNKNOWN";
    }
}

// Decoded source bitmap. Owned by the caller and only read while a
// pyramid is generated.
struct SourceImage {
    cv::Mat pixels;  // CV_8UC1, CV_8UC3 or CV_8UC4
    ColorMode color_mode = ColorMode::BGR;

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }
    bool empty() const { return pixels.empty(); }
};

// Pixel size of one pyramid level
struct LevelSize {
    int width = 0;
    int height = 0;

    bool operator==(const LevelSize& o) const {
        return width == o.width && height == o.height;
    }
    bool operator!=(const LevelSize& o) const { return !(*this == o); }
};

// Tile grid shape of one pyramid level
struct TileGrid {
    int columns = 0;
    int rows = 0;

    int count() const { return columns * rows; }

    bool operator==(const TileGrid& o) const {
        return columns == o.columns && rows == o.rows;
    }
    bool operator!=(const TileGrid& o) const { return !(*this == o); }
};

struct TileCoordinate {
    int level = 0;
    int column = 0;
    int row = 0;
};

// Half-open pixel box [x1, x2) x [y1, y2) in the level's pixel space
struct TileBounds {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    cv::Rect to_rect() const { return cv::Rect(x1, y1, x2 - x1, y2 - y1); }

    bool operator==(const TileBounds& o) const {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
    bool operator!=(const TileBounds& o) const { return !(*this == o); }
};

// Run phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    MONTAGE = 1,
    PYRAMID = 2,
    DESCRIPTOR = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::MONTAGE: return "MONTAGE";
        case Phase::PYRAMID: return "PYRAMID";
        case Phase::DESCRIPTOR: return "DESCRIPTOR";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace deepzoom
