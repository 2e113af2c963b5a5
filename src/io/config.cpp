#include "deepzoom/config/configuration.hpp"
#include "deepzoom/core/errors.hpp"

#include <fstream>

namespace deepzoom::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["tiling"]) {
            auto t = node["tiling"];
            if (t["tile_size"]) cfg.tiling.tile_size = t["tile_size"].as<int>();
            if (t["tile_overlap"]) cfg.tiling.tile_overlap = t["tile_overlap"].as<int>();
            if (t["tile_format"]) cfg.tiling.tile_format = t["tile_format"].as<std::string>();
            if (t["image_quality"]) cfg.tiling.image_quality = t["image_quality"].as<float>();
            if (t["resize_filter"]) cfg.tiling.resize_filter = t["resize_filter"].as<std::string>();
            if (t["copy_metadata"]) cfg.tiling.copy_metadata = t["copy_metadata"].as<bool>();
        }

        if (node["montage"]) {
            auto m = node["montage"];
            if (m["grid_cols"]) cfg.montage.grid_cols = m["grid_cols"].as<int>();
            if (m["grid_rows"]) cfg.montage.grid_rows = m["grid_rows"].as<int>();
            if (m["image_width"]) cfg.montage.image_width = m["image_width"].as<int>();
            if (m["image_height"]) cfg.montage.image_height = m["image_height"].as<int>();
            if (m["padding"]) cfg.montage.padding = m["padding"].as<int>();
            if (m["background"]) cfg.montage.background = m["background"].as<int>();
            if (m["extension"]) cfg.montage.extension = m["extension"].as<std::string>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["dir"]) cfg.output.dir = o["dir"].as<std::string>();
            if (o["name"]) cfg.output.name = o["name"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["tiling"]["tile_size"] = tiling.tile_size;
    node["tiling"]["tile_overlap"] = tiling.tile_overlap;
    node["tiling"]["tile_format"] = tiling.tile_format;
    node["tiling"]["image_quality"] = tiling.image_quality;
    node["tiling"]["resize_filter"] = tiling.resize_filter;
    node["tiling"]["copy_metadata"] = tiling.copy_metadata;

    node["montage"]["grid_cols"] = montage.grid_cols;
    node["montage"]["grid_rows"] = montage.grid_rows;
    node["montage"]["image_width"] = montage.image_width;
    node["montage"]["image_height"] = montage.image_height;
    node["montage"]["padding"] = montage.padding;
    node["montage"]["background"] = montage.background;
    node["montage"]["extension"] = montage.extension;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    node["output"]["dir"] = output.dir;
    node["output"]["name"] = output.name;

    return node;
}

void Config::validate() const {
    if (tiling.tile_size < 1) {
        throw ValidationError("tiling.tile_size must be >= 1");
    }

    if (montage.grid_cols < 1 || montage.grid_rows < 1) {
        throw ValidationError("montage.grid_cols and montage.grid_rows must be >= 1");
    }
    if (montage.image_width < 1 || montage.image_height < 1) {
        throw ValidationError("montage.image_width and montage.image_height must be >= 1");
    }
    if (montage.padding < 0) {
        throw ValidationError("montage.padding must be >= 0");
    }
    if (montage.background < 0 || montage.background > 255) {
        throw ValidationError("montage.background must be in [0,255]");
    }
    if (montage.extension.empty()) {
        throw ValidationError("montage.extension must not be empty");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }

    if (output.name.empty()) {
        throw ValidationError("output.name must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "tiling": {
      "type": "object",
      "properties": {
        "tile_size": {"type": "integer", "minimum": 1},
        "tile_overlap": {"type": "integer", "minimum": 0, "maximum": 10},
        "tile_format": {"type": "string", "enum": ["png", "jpg"]},
        "image_quality": {"type": "number", "minimum": 0, "maximum": 1},
        "resize_filter": {"type": "string", "enum": ["nearest", "bilinear", "bicubic", "cubic", "lanczos", "antialias"]},
        "copy_metadata": {"type": "boolean"}
      }
    },
    "montage": {
      "type": "object",
      "properties": {
        "grid_cols": {"type": "integer", "minimum": 1},
        "grid_rows": {"type": "integer", "minimum": 1},
        "image_width": {"type": "integer", "minimum": 1},
        "image_height": {"type": "integer", "minimum": 1},
        "padding": {"type": "integer", "minimum": 0},
        "background": {"type": "integer", "minimum": 0, "maximum": 255},
        "extension": {"type": "string"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "dir": {"type": "string"},
        "name": {"type": "string"}
      }
    }
  }
})";
}

} // namespace deepzoom::config
