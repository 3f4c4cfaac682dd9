#pragma once

#include "ortho_stitch/core/types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace ortho_stitch::tiling {

// Result of a non-recursive scan of a tile directory.
struct DirectoryScan {
    std::vector<std::pair<fs::path, TilePosition>> tiles; // sorted by filename
    std::size_t ignored = 0;                              // entries that did not parse
};

using SubTileFiles = std::map<int, fs::path>;      // sub_id -> file
using SceneTiles = std::map<BlockKey, SubTileFiles>; // (col,row) -> sub-tiles

struct BlockAssemblyOptions {
    int grid_size = 4;
    int tile_size = 256;
    int sub_base_index = 1;
};

// Throws IOError if tile_dir is missing, not a directory or cannot be listed.
DirectoryScan scan_tile_directory(const fs::path& tile_dir);

// Tiles of one scene grouped by block and sub-index. When several files map
// to the same (col,row,sub) the lexicographically last filename wins.
SceneTiles group_scene_tiles(const DirectoryScan& scan, int scene_id);
SceneTiles scan_scene_tiles(const fs::path& tile_dir, int scene_id);

std::size_t count_tiles(const SceneTiles& tiles);

// Build one block: transparent (grid_size*tile_size)^2 canvas with every
// sub-tile composited into its cell. Missing cells stay transparent.
Block assemble_block(const BlockKey& key, const SubTileFiles& files,
                     const BlockAssemblyOptions& opt);

using BlockProgressCallback = std::function<void(int done, int total, const BlockKey& key)>;

BlockMap assemble_blocks(const SceneTiles& tiles, const BlockAssemblyOptions& opt,
                         const BlockProgressCallback& progress_cb = nullptr);

BlockMap assemble_blocks(const fs::path& tile_dir, int scene_id,
                         const BlockAssemblyOptions& opt,
                         const BlockProgressCallback& progress_cb = nullptr);

} // namespace ortho_stitch::tiling
