#include "ortho_stitch/config/configuration.hpp"
#include "ortho_stitch/core/errors.hpp"
#include "ortho_stitch/core/events.hpp"
#include "ortho_stitch/core/utils.hpp"
#include "ortho_stitch/pipeline/stitcher.hpp"
#include "ortho_stitch/tiling/block_assembler.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void print_json(const json &j) { std::cout << j.dump(2) << std::endl; }

struct RunOverrides {
  std::string config_path;
  std::string tile_dir;
  std::string out_path;
  std::string event_log;
  int scene_id = -1;
  int tile_size = 0;
  int grid_size = 0;
  int sub_base = 0;
  int stride_x = 0;
  int stride_y = 0;
  bool dense = false;
  bool no_dense = false;
  bool events_to_stdout = false;
};

// ============================================================================
// run <tile_dir> --scene N --out PATH [...]
// ============================================================================
int run_command(const RunOverrides &args, const CLI::App &run_cmd) {
  using namespace ortho_stitch;

  config::Config cfg;
  try {
    if (!args.config_path.empty()) {
      cfg = config::Config::load(args.config_path);
    }
  } catch (const OrthoStitchError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (run_cmd.count("tile_dir")) cfg.input.tile_dir = args.tile_dir;
  if (run_cmd.count("--scene")) cfg.input.scene_id = args.scene_id;
  if (run_cmd.count("--out")) cfg.output.path = args.out_path;
  if (run_cmd.count("--tile")) cfg.grid.tile_size = args.tile_size;
  if (run_cmd.count("--grid")) cfg.grid.grid_size = args.grid_size;
  if (run_cmd.count("--sub-base")) cfg.grid.sub_base_index = args.sub_base;
  if (run_cmd.count("--stride-x")) cfg.mosaic.stride_x = args.stride_x;
  if (run_cmd.count("--stride-y")) cfg.mosaic.stride_y = args.stride_y;
  if (run_cmd.count("--event-log")) cfg.output.event_log = args.event_log;
  if (args.dense) cfg.mosaic.compact_gaps = true;
  if (args.no_dense) cfg.mosaic.compact_gaps = false;

  try {
    cfg.validate_for_run();
  } catch (const ValidationError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file;
  if (!cfg.output.event_log.empty()) {
    const fs::path log_path(cfg.output.event_log);
    if (log_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(log_path.parent_path(), ec);
    }
    event_log_file.open(log_path);
    if (!event_log_file) {
      std::cerr << "Error: Cannot create event log: " << cfg.output.event_log
                << std::endl;
      return 1;
    }
  }

  runner::TeeBuf tee_buf(args.events_to_stdout ? std::cout.rdbuf() : nullptr,
                         event_log_file.is_open() ? event_log_file.rdbuf()
                                                  : nullptr);
  std::ostream events(&tee_buf);

  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"tile_dir", cfg.input.tile_dir},
                     {"scene_id", cfg.input.scene_id},
                     {"tile_size", cfg.grid.tile_size},
                     {"grid_size", cfg.grid.grid_size},
                     {"sub_base_index", cfg.grid.sub_base_index},
                     {"compact_gaps", cfg.mosaic.compact_gaps},
                     {"stride_x", cfg.effective_stride_x()},
                     {"stride_y", cfg.effective_stride_y()},
                     {"output_path", cfg.output.path}},
                    events);

  pipeline::StitchResult result;
  try {
    result = pipeline::stitch_scene(cfg, run_id, emitter, events);
  } catch (const std::exception &e) {
    emitter.run_end(run_id, false, "error", events);
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const std::string scene_label = core::format_scene_id(cfg.input.scene_id);
  if (!result.written) {
    std::cout << "no tiles found for scene " << scene_label << std::endl;
    emitter.run_end(run_id, true, "no_tiles", events);
    return 0;
  }

  std::cout << "[scene " << scene_label << "] saved to "
            << result.output_path.string() << ", size=(" << result.size.width
            << ", " << result.size.height << ")" << std::endl;
  emitter.run_end(run_id, true, "ok", events);
  return 0;
}

// ============================================================================
// scan <tile_dir> [--scene N]
// ============================================================================
int scan_command(const std::string &tile_dir, int scene_filter) {
  using namespace ortho_stitch;

  json result;
  result["ok"] = false;
  result["tile_dir"] = tile_dir;
  result["files_seen"] = 0;
  result["files_matched"] = 0;
  result["files_ignored"] = 0;
  result["scenes"] = json::array();
  result["errors"] = json::array();

  tiling::DirectoryScan scan;
  try {
    scan = tiling::scan_tile_directory(tile_dir);
  } catch (const IOError &e) {
    json err;
    err["severity"] = "error";
    err["code"] = "tile_dir_unreadable";
    err["message"] = e.what();
    result["errors"].push_back(err);
    print_json(result);
    return 0;
  }

  result["files_seen"] = scan.tiles.size() + scan.ignored;
  result["files_matched"] = scan.tiles.size();
  result["files_ignored"] = scan.ignored;

  std::set<int> scene_ids;
  for (const auto &[path, pos] : scan.tiles) {
    if (scene_filter < 0 || pos.scene_id == scene_filter) {
      scene_ids.insert(pos.scene_id);
    }
  }

  for (int scene_id : scene_ids) {
    const tiling::SceneTiles tiles = tiling::group_scene_tiles(scan, scene_id);
    std::set<int> cols, rows;
    for (const auto &[key, subs] : tiles) {
      cols.insert(key.col);
      rows.insert(key.row);
    }
    json s;
    s["scene_id"] = scene_id;
    s["tiles"] = tiling::count_tiles(tiles);
    s["blocks"] = tiles.size();
    s["cols"] = cols;
    s["rows"] = rows;
    result["scenes"].push_back(s);
  }

  result["ok"] = true;
  print_json(result);
  return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml>
// ============================================================================
int validate_config_command(const std::string &path, const std::string &yaml_arg,
                            bool strict_exit) {
  json result;
  result["valid"] = false;
  result["errors"] = json::array();
  if (!path.empty()) result["path"] = path;

  try {
    const std::string yaml_text =
        path.empty() ? yaml_arg : ortho_stitch::core::read_text(path);
    YAML::Node node = YAML::Load(yaml_text);
    ortho_stitch::config::Config cfg =
        ortho_stitch::config::Config::from_yaml(node);
    cfg.validate();
    result["valid"] = true;
  } catch (const std::exception &e) {
    result["errors"].push_back(std::string(e.what()));
  }

  print_json(result);
  if (strict_exit) {
    return result["valid"].get<bool>() ? 0 : 1;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Ortho tile stitcher"};
  app.require_subcommand(1);

  RunOverrides run_args;
  auto run_cmd = app.add_subcommand("run", "Stitch one scene into a mosaic");
  run_cmd->add_option("tile_dir", run_args.tile_dir,
                      "Directory of <scene>_<col>_<row>_<sub>.<ext> tiles");
  run_cmd->add_option("--config", run_args.config_path, "Path to config.yaml");
  run_cmd->add_option("--scene", run_args.scene_id, "Scene id to stitch");
  run_cmd->add_option("--out", run_args.out_path,
                      "Output raster (format from extension)");
  run_cmd->add_option("--tile", run_args.tile_size, "Tile size in pixels (256)");
  run_cmd->add_option("--grid", run_args.grid_size,
                      "Sub-tiles per block side (4)");
  run_cmd->add_option("--sub-base", run_args.sub_base,
                      "Sub-index of cell (0,0) (1)");
  auto dense = run_cmd->add_flag("--dense", run_args.dense,
                                 "Compact gaps in block ids (default)");
  auto no_dense = run_cmd->add_flag("--no-dense", run_args.no_dense,
                                    "Place blocks at raw ids");
  dense->excludes(no_dense);
  run_cmd->add_option("--stride-x", run_args.stride_x,
                      "Horizontal block stride (default grid*tile)");
  run_cmd->add_option("--stride-y", run_args.stride_y,
                      "Vertical block stride (default grid*tile)");
  run_cmd->add_flag("--events", run_args.events_to_stdout,
                    "Print JSON run events to stdout");
  run_cmd->add_option("--event-log", run_args.event_log,
                      "Write JSON run events to this file");

  std::string scan_dir;
  int scan_scene = -1;
  auto scan_cmd = app.add_subcommand("scan", "Summarise a tile directory");
  scan_cmd->add_option("tile_dir", scan_dir, "Tile directory")->required();
  scan_cmd->add_option("--scene", scan_scene, "Only report this scene");

  std::string validate_path, validate_yaml;
  bool strict_exit = false;
  auto validate_cmd =
      app.add_subcommand("validate-config", "Validate a config file");
  auto path_opt = validate_cmd->add_option("--path", validate_path, "Config file");
  auto yaml_opt = validate_cmd->add_option("--yaml", validate_yaml, "Config YAML text");
  path_opt->excludes(yaml_opt);
  validate_cmd->add_flag("--strict-exit-codes", strict_exit,
                         "Exit 1 when the config is invalid");

  auto schema_cmd = app.add_subcommand("get-schema", "Print JSON schema for config");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(run_args, *run_cmd);
  }
  if (scan_cmd->parsed()) {
    return scan_command(scan_dir, scan_scene);
  }
  if (validate_cmd->parsed()) {
    if (validate_path.empty() && validate_yaml.empty()) {
      std::cerr << "validate-config requires --path or --yaml\n";
      return 2;
    }
    return validate_config_command(validate_path, validate_yaml, strict_exit);
  }
  if (schema_cmd->parsed()) {
    std::cout << ortho_stitch::config::get_schema_json() << std::endl;
    return 0;
  }

  std::cout << app.help() << std::endl;
  return 1;
}
