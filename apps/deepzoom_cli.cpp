#include "deepzoom/config/configuration.hpp"
#include "deepzoom/core/errors.hpp"
#include "deepzoom/core/events.hpp"
#include "deepzoom/core/types.hpp"
#include "deepzoom/core/utils.hpp"
#include "deepzoom/io/image_io.hpp"
#include "deepzoom/montage/montage.hpp"
#include "deepzoom/pipeline/tile_renderer.hpp"
#include "deepzoom/pyramid/layout.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using deepzoom::Phase;
using deepzoom::SourceImage;
using json = nlohmann::json;

namespace config = deepzoom::config;
namespace core = deepzoom::core;
namespace pipeline = deepzoom::pipeline;
namespace pyramid = deepzoom::pyramid;

std::atomic<bool> g_stop{false};

void handle_stop_signal(int) { g_stop.store(true); }

struct TilingFlags {
  int tile_size = 0;
  int overlap = 0;
  std::string format;
  float quality = 0.0f;
  std::string filter;
  int workers = 0;

  CLI::Option *tile_size_opt = nullptr;
  CLI::Option *overlap_opt = nullptr;
  CLI::Option *format_opt = nullptr;
  CLI::Option *quality_opt = nullptr;
  CLI::Option *filter_opt = nullptr;
  CLI::Option *workers_opt = nullptr;
};

struct CommonFlags {
  std::string config_path;
  std::string out_dir;
  std::string name;
  std::string events_path;
  bool verbose = false;

  CLI::Option *out_dir_opt = nullptr;
  CLI::Option *name_opt = nullptr;
};

void add_tiling_flags(CLI::App *cmd, TilingFlags &t, CommonFlags &c) {
  cmd->add_option("--config", c.config_path, "Path to config.yaml");
  c.out_dir_opt = cmd->add_option("-o,--out-dir", c.out_dir,
                                  "Output folder for the DZI tiling");
  c.name_opt = cmd->add_option("-f,--name", c.name, "Base name of the .dzi file");
  cmd->add_option("--events", c.events_path,
                  "Write JSON-lines events to FILE ('-' for stdout)");
  cmd->add_flag("-v,--verbose", c.verbose, "Verbose, more output");

  t.tile_size_opt = cmd->add_option("-t,--tile-size", t.tile_size, "Tile size (default 254)");
  t.overlap_opt = cmd->add_option("--overlap", t.overlap, "Tile overlap, 0..10 (default 1)");
  t.format_opt = cmd->add_option("--format", t.format, "Tile format: png|jpg (default png)");
  t.quality_opt = cmd->add_option(
      "-q,--quality", t.quality,
      "Image quality 0..1: jpg quality or png compression level (default 0.8)");
  t.filter_opt = cmd->add_option(
      "--filter", t.filter,
      "Resize filter: nearest|bilinear|bicubic|cubic|lanczos|antialias");
  t.workers_opt = cmd->add_option("-r,--workers", t.workers,
                                  "Worker threads for tile encoding (default 1)");
}

config::Config load_config(const TilingFlags &t, const CommonFlags &c) {
  config::Config cfg;
  if (!c.config_path.empty()) {
    cfg = config::Config::load(c.config_path);
  }

  if (*t.tile_size_opt) cfg.tiling.tile_size = t.tile_size;
  if (*t.overlap_opt) cfg.tiling.tile_overlap = t.overlap;
  if (*t.format_opt) cfg.tiling.tile_format = t.format;
  if (*t.quality_opt) cfg.tiling.image_quality = t.quality;
  if (*t.filter_opt) cfg.tiling.resize_filter = t.filter;
  if (*t.workers_opt) cfg.runtime.parallel_workers = t.workers;
  if (*c.out_dir_opt) cfg.output.dir = c.out_dir;
  if (*c.name_opt) cfg.output.name = c.name;

  cfg.validate();
  return cfg;
}

// Owns the optional events file; writes go nowhere without --events.
class EventSink {
public:
  explicit EventSink(const std::string &path) : null_(nullptr) {
    if (path == "-") {
      out_ = &std::cout;
    } else if (!path.empty()) {
      file_.open(path, std::ios::out | std::ios::app);
      if (!file_) {
        throw deepzoom::WriteError("Cannot open events file: " + path);
      }
      out_ = &file_;
    } else {
      out_ = &null_;
    }
  }

  std::ostream &stream() { return *out_; }

private:
  std::ofstream file_;
  std::ostream null_;
  std::ostream *out_ = nullptr;
};

fs::path destination_for(const config::Config &cfg) {
  return fs::path(cfg.output.dir) / (cfg.output.name + ".dzi");
}

// Shared tail of `create` and `montage`: tiles the bitmap and writes the
// descriptor, reporting on stdout and the event stream.
bool render_pyramid(const std::string &run_id, const config::Config &cfg,
                    const SourceImage &source, const fs::path &destination,
                    core::EventEmitter &emitter, std::ostream &events, bool verbose) {
  pipeline::TileRenderer renderer(cfg.tiling, cfg.runtime.parallel_workers);
  for (const auto &msg : renderer.adjustments()) {
    std::cerr << "Warning: " << msg << std::endl;
    emitter.warning(run_id, msg, events);
  }

  const auto &s = renderer.settings();
  const auto descriptor = renderer.make_descriptor(source);

  std::cout << "[pyramid] " << source.width() << "x" << source.height() << " "
            << deepzoom::color_mode_to_string(source.color_mode) << " -> "
            << destination.string() << std::endl;
  std::cout << "[pyramid] " << descriptor.num_levels() << " levels, tile "
            << s.tile_size << " overlap " << s.tile_overlap << " "
            << deepzoom::tile_format_to_string(s.tile_format) << " filter "
            << deepzoom::resize_filter_to_string(s.resize_filter) << ", "
            << s.parallel_workers << " worker(s)" << std::endl;

  emitter.phase_start(run_id, Phase::PYRAMID, events);

  auto progress = [&](const pipeline::RenderProgress &p) {
    if (p.tiles_done % 20 == 0 || p.tiles_done == p.tiles_total) {
      emitter.phase_progress(run_id, Phase::PYRAMID, p.tiles_done, p.tiles_total,
                             "level " + std::to_string(p.level), events);
    }
    if (p.tiles_done != p.tiles_total) {
      return;
    }
    const auto size = descriptor.dimensions(p.level);
    emitter.level_done(run_id, p.level, p.num_levels, size, descriptor.tile_grid(p.level),
                       events);
    if (verbose) {
      std::cout << "  level " << p.level << "/" << (p.num_levels - 1) << ": "
                << size.width << "x" << size.height << ", " << p.tiles_total
                << " tile(s)" << std::endl;
    }
  };

  try {
    const auto summary = renderer.create(source, destination, &g_stop, progress);
    emitter.phase_end(run_id, Phase::PYRAMID, "ok",
                      {{"levels", summary.num_levels},
                       {"tiles", summary.tiles_written},
                       {"files_root", summary.files_root.string()}},
                      events);
    emitter.phase_start(run_id, Phase::DESCRIPTOR, events);
    emitter.phase_end(run_id, Phase::DESCRIPTOR, "ok",
                      {{"path", summary.descriptor_path.string()},
                       {"xml", descriptor.to_xml()}},
                      events);

    std::cout << "[pyramid] wrote " << summary.tiles_written << " tiles in "
              << std::fixed << std::setprecision(2) << summary.elapsed_s << " s"
              << std::endl;
    std::cout << "[pyramid] descriptor " << summary.descriptor_path.string() << std::endl;
    return true;
  } catch (const deepzoom::StopRequested &e) {
    std::cerr << "Stopped: descriptor not written, pyramid is incomplete" << std::endl;
    emitter.phase_end(run_id, Phase::PYRAMID, "aborted", {{"error", e.what()}}, events);
    return false;
  }
}

int create_command(const std::string &image_path, const TilingFlags &t,
                   const CommonFlags &c) {
  const config::Config cfg = load_config(t, c);
  EventSink sink(c.events_path);
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();
  auto &events = sink.stream();

  emitter.run_start(run_id, {{"command", "create"}, {"input", image_path}}, events);
  if (!deepzoom::io::is_supported_image_path(image_path)) {
    const std::string msg = "unrecognised image extension, trying to decode " + image_path;
    std::cerr << "Warning: " << msg << std::endl;
    emitter.warning(run_id, msg, events);
  }
  try {
    emitter.phase_start(run_id, Phase::SCAN_INPUT, events);
    const SourceImage source = deepzoom::io::read_image(image_path);
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                      {{"width", source.width()}, {"height", source.height()}}, events);

    const bool ok = render_pyramid(run_id, cfg, source, destination_for(cfg), emitter,
                                   events, c.verbose);
    emitter.run_end(run_id, ok, ok ? "ok" : "aborted", events);
    return ok ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), events);
    emitter.run_end(run_id, false, "error", events);
    return 1;
  }
}

int montage_command(const std::string &input_dir, const std::vector<int> &grid,
                    const std::vector<int> &imdim, const std::string &ext,
                    const TilingFlags &t, const CommonFlags &c) {
  config::Config cfg = load_config(t, c);
  if (grid.size() == 2) {
    cfg.montage.grid_cols = grid[0];
    cfg.montage.grid_rows = grid[1];
  }
  if (imdim.size() == 2) {
    cfg.montage.image_width = imdim[0];
    cfg.montage.image_height = imdim[1];
  }
  if (!ext.empty()) cfg.montage.extension = ext;
  cfg.validate();

  EventSink sink(c.events_path);
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();
  auto &events = sink.stream();

  emitter.run_start(run_id, {{"command", "montage"}, {"input_dir", input_dir}}, events);
  try {
    emitter.phase_start(run_id, Phase::SCAN_INPUT, events);
    const auto files = core::discover_files(input_dir, cfg.montage.extension);
    json scan_out;
    scan_out["n_files"] = static_cast<int>(files.size());
    scan_out["files"] = json::array();
    for (const auto &p : files) {
      scan_out["files"].push_back(p.string());
    }
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok", scan_out, events);
    std::cout << "[montage] " << files.size() << " file(s) found in " << input_dir
              << std::endl;
    if (files.empty()) {
      throw deepzoom::ValidationError("no *." + cfg.montage.extension + " images in " +
                                      input_dir);
    }

    emitter.phase_start(run_id, Phase::MONTAGE, events);
    auto warn = [&](const std::string &msg) {
      std::cerr << "Warning: " << msg << std::endl;
      emitter.warning(run_id, msg, events);
    };
    const auto canvas = deepzoom::montage::canvas_size(cfg.montage);
    std::cout << "[montage] " << cfg.montage.grid_cols << "x" << cfg.montage.grid_rows
              << " grid, " << canvas.width << "x" << canvas.height << " pixels"
              << std::endl;
    const auto result = deepzoom::montage::compose_grid(files, cfg.montage, warn);
    emitter.phase_end(run_id, Phase::MONTAGE, "ok",
                      {{"placed", result.placed},
                       {"skipped", result.skipped},
                       {"ignored", result.ignored}},
                      events);

    const bool ok = render_pyramid(run_id, cfg, result.image, destination_for(cfg), emitter,
                                   events, c.verbose);
    emitter.run_end(run_id, ok, ok ? "ok" : "aborted", events);
    return ok ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), events);
    emitter.run_end(run_id, false, "error", events);
    return 1;
  }
}

int remove_command(const std::string &dzi_path) {
  try {
    pyramid::PyramidDescriptor::remove(dzi_path);
    std::cout << "Removed " << pyramid::descriptor_path(dzi_path).string() << " and "
              << pyramid::files_root(dzi_path).string() << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  CLI::App app{"Deep Zoom pyramid generator"};
  app.require_subcommand(1);

  TilingFlags create_tiling;
  CommonFlags create_common;
  std::string image_path;
  auto create_cmd = app.add_subcommand("create", "Tile a single image into a DZI pyramid");
  create_cmd->add_option("image", image_path, "Source image")->required();
  add_tiling_flags(create_cmd, create_tiling, create_common);

  TilingFlags montage_tiling;
  CommonFlags montage_common;
  std::string input_dir;
  std::vector<int> grid;
  std::vector<int> imdim;
  std::string ext;
  auto montage_cmd = app.add_subcommand(
      "montage", "Combine a folder of images on a grid and tile the result");
  montage_cmd->add_option("indir", input_dir, "Input folder with images")->required();
  montage_cmd->add_option("-g,--griddim", grid, "Grid dimensions: COLS ROWS")
      ->expected(2);
  montage_cmd->add_option("-m,--imdim", imdim, "Image dimensions: WIDTH HEIGHT")
      ->expected(2);
  montage_cmd->add_option("-x,--imext", ext, "File extension of the input images");
  add_tiling_flags(montage_cmd, montage_tiling, montage_common);

  std::string remove_path;
  auto remove_cmd = app.add_subcommand("remove", "Delete a .dzi file and its tiles");
  remove_cmd->add_option("dzi", remove_path, "Path to the .dzi file")->required();

  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  CLI11_PARSE(app, argc, argv);

  try {
    if (create_cmd->parsed()) {
      return create_command(image_path, create_tiling, create_common);
    }
    if (montage_cmd->parsed()) {
      return montage_command(input_dir, grid, imdim, ext, montage_tiling, montage_common);
    }
  } catch (const deepzoom::DeepZoomError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  if (remove_cmd->parsed()) {
    return remove_command(remove_path);
  }
  if (schema_cmd->parsed()) {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
  }

  std::cout << app.help() << std::endl;
  return 1;
}
