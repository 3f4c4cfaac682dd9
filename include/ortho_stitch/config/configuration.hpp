#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace ortho_stitch::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string tile_dir;
  int scene_id = -1; // required for a run
};

struct GridConfig {
  int tile_size = 256;
  int grid_size = 4;      // sub-tiles per block side
  int sub_base_index = 1; // sub-id that maps to cell (0,0)
};

struct MosaicConfig {
  bool compact_gaps = true;
  std::optional<int> stride_x; // unset = grid_size * tile_size
  std::optional<int> stride_y;
};

struct OutputConfig {
  std::string path;
  std::string event_log; // optional JSONL file
};

struct Config {
  InputConfig input;
  GridConfig grid;
  MosaicConfig mosaic;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  // Range checks on every value that is set.
  void validate() const;
  // validate() plus the options a stitching run cannot do without.
  void validate_for_run() const;

  int block_size_px() const { return grid.grid_size * grid.tile_size; }
  int effective_stride_x() const;
  int effective_stride_y() const;
};

std::string get_schema_json();

} // namespace ortho_stitch::config
