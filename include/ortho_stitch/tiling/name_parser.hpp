#pragma once

#include "ortho_stitch/core/types.hpp"

#include <optional>
#include <string>

namespace ortho_stitch::tiling {

// Parse a bare filename of the form <scene>_<col>_<row>_<sub>.<ext>.
// Returns std::nullopt for anything else; such files are skipped, not errors.
std::optional<TilePosition> parse_tile_name(const std::string& filename);

} // namespace ortho_stitch::tiling
