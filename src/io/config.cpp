#include "ortho_stitch/config/configuration.hpp"
#include "ortho_stitch/core/errors.hpp"

#include <fstream>
#include <limits>

namespace ortho_stitch::config {

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
        if (node["input"]) {
            auto in = node["input"];
            if (in["tile_dir"]) cfg.input.tile_dir = in["tile_dir"].as<std::string>();
            if (in["scene_id"]) cfg.input.scene_id = in["scene_id"].as<int>();
        }

        if (node["grid"]) {
            auto g = node["grid"];
            if (g["tile_size"]) cfg.grid.tile_size = g["tile_size"].as<int>();
            if (g["grid_size"]) cfg.grid.grid_size = g["grid_size"].as<int>();
            if (g["sub_base_index"]) cfg.grid.sub_base_index = g["sub_base_index"].as<int>();
        }

        if (node["mosaic"]) {
            auto m = node["mosaic"];
            if (m["compact_gaps"]) cfg.mosaic.compact_gaps = m["compact_gaps"].as<bool>();
            if (m["stride_x"] && !m["stride_x"].IsNull()) cfg.mosaic.stride_x = m["stride_x"].as<int>();
            if (m["stride_y"] && !m["stride_y"].IsNull()) cfg.mosaic.stride_y = m["stride_y"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["path"]) cfg.output.path = o["path"].as<std::string>();
            if (o["event_log"]) cfg.output.event_log = o["event_log"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    out << to_yaml();
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["tile_dir"] = input.tile_dir;
    node["input"]["scene_id"] = input.scene_id;

    node["grid"]["tile_size"] = grid.tile_size;
    node["grid"]["grid_size"] = grid.grid_size;
    node["grid"]["sub_base_index"] = grid.sub_base_index;

    node["mosaic"]["compact_gaps"] = mosaic.compact_gaps;
    if (mosaic.stride_x) node["mosaic"]["stride_x"] = *mosaic.stride_x;
    if (mosaic.stride_y) node["mosaic"]["stride_y"] = *mosaic.stride_y;

    node["output"]["path"] = output.path;
    node["output"]["event_log"] = output.event_log;

    return node;
}

void Config::validate() const {
    if (grid.tile_size < 1) {
        throw ValidationError("grid.tile_size must be >= 1");
    }
    if (grid.grid_size < 1) {
        throw ValidationError("grid.grid_size must be >= 1");
    }
    {
        const long long block_px = static_cast<long long>(grid.grid_size) * grid.tile_size;
        if (block_px > std::numeric_limits<int>::max()) {
            throw ValidationError("grid.grid_size * grid.tile_size overflows");
        }
    }
    if (mosaic.stride_x && *mosaic.stride_x < 0) {
        throw ValidationError("mosaic.stride_x must be >= 0");
    }
    if (mosaic.stride_y && *mosaic.stride_y < 0) {
        throw ValidationError("mosaic.stride_y must be >= 0");
    }
    if (input.scene_id < -1) {
        throw ValidationError("input.scene_id must be >= 0");
    }
}

void Config::validate_for_run() const {
    validate();

    if (input.tile_dir.empty()) {
        throw ValidationError("input.tile_dir is required");
    }
    if (input.scene_id < 0) {
        throw ValidationError("input.scene_id is required");
    }
    if (output.path.empty()) {
        throw ValidationError("output.path is required");
    }
}

int Config::effective_stride_x() const {
    return mosaic.stride_x.value_or(block_size_px());
}

int Config::effective_stride_y() const {
    return mosaic.stride_y.value_or(block_size_px());
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "input": {
      "type": "object",
      "properties": {
        "tile_dir": {"type": "string"},
        "scene_id": {"type": "integer", "minimum": 0}
      }
    },
    "grid": {
      "type": "object",
      "properties": {
        "tile_size": {"type": "integer", "minimum": 1},
        "grid_size": {"type": "integer", "minimum": 1},
        "sub_base_index": {"type": "integer"}
      }
    },
    "mosaic": {
      "type": "object",
      "properties": {
        "compact_gaps": {"type": "boolean"},
        "stride_x": {"type": "integer", "minimum": 0},
        "stride_y": {"type": "integer", "minimum": 0}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "path": {"type": "string"},
        "event_log": {"type": "string"}
      }
    }
  }
})";
}

} // namespace ortho_stitch::config
