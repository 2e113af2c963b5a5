#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace deepzoom::config {

namespace fs = std::filesystem;

// Raw tiling knobs as written by the user. Out-of-range values and unknown
// names are accepted here; the renderer clamps them when it resolves its
// settings.
struct TilingConfig {
  int tile_size = 254;
  int tile_overlap = 1;
  std::string tile_format = "png";    // png | jpg
  float image_quality = 0.8f;         // jpg quality or png compression effort
  std::string resize_filter = "antialias"; // nearest | bilinear | bicubic |
                                           // cubic | lanczos | antialias
  bool copy_metadata = false;
};

struct MontageConfig {
  int grid_cols = 3;
  int grid_rows = 3;
  int image_width = 1024;
  int image_height = 1024;
  int padding = 10;     // pixels between neighbouring images
  int background = 10;  // gray level of the empty canvas
  std::string extension = "png";
};

struct RuntimeConfig {
  int parallel_workers = 1;
};

struct OutputConfig {
  std::string dir = "dzi";
  std::string name = "dzi";
};

struct Config {
  TilingConfig tiling;
  MontageConfig montage;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace deepzoom::config
