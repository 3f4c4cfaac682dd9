#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>

namespace ortho_stitch::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);

// Zero-padded scene label as used in console output ("004").
std::string format_scene_id(int scene_id);

} // namespace ortho_stitch::core
