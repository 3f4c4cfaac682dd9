#include "ortho_stitch/tiling/block_assembler.hpp"
#include "ortho_stitch/tiling/grid_layout.hpp"
#include "ortho_stitch/tiling/name_parser.hpp"
#include "ortho_stitch/image/compositing.hpp"
#include "ortho_stitch/io/image_io.hpp"
#include "ortho_stitch/core/errors.hpp"

#include <algorithm>

namespace ortho_stitch::tiling {

DirectoryScan scan_tile_directory(const fs::path& tile_dir) {
    std::vector<fs::path> entries;
    try {
        if (!fs::exists(tile_dir)) {
            throw IOError("Tile directory not found: " + tile_dir.string());
        }
        if (!fs::is_directory(tile_dir)) {
            throw IOError("Not a directory: " + tile_dir.string());
        }
        for (const auto& entry : fs::directory_iterator(tile_dir)) {
            if (entry.is_regular_file()) {
                entries.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError("Cannot list " + tile_dir.string() + ": " + e.code().message());
    }
    std::sort(entries.begin(), entries.end());

    DirectoryScan scan;
    for (const auto& p : entries) {
        auto pos = parse_tile_name(p.filename().string());
        if (!pos) {
            ++scan.ignored;
            continue;
        }
        scan.tiles.emplace_back(p, *pos);
    }
    return scan;
}

SceneTiles group_scene_tiles(const DirectoryScan& scan, int scene_id) {
    SceneTiles grouped;
    for (const auto& [path, pos] : scan.tiles) {
        if (pos.scene_id != scene_id) continue;
        grouped[BlockKey{pos.col_id, pos.row_id}][pos.sub_id] = path;
    }
    return grouped;
}

SceneTiles scan_scene_tiles(const fs::path& tile_dir, int scene_id) {
    return group_scene_tiles(scan_tile_directory(tile_dir), scene_id);
}

std::size_t count_tiles(const SceneTiles& tiles) {
    std::size_t n = 0;
    for (const auto& [key, subs] : tiles) {
        n += subs.size();
    }
    return n;
}

Block assemble_block(const BlockKey& key, const SubTileFiles& files,
                     const BlockAssemblyOptions& opt) {
    const int block_px = opt.grid_size * opt.tile_size;

    std::vector<GridKey> cells;
    cells.reserve(files.size());
    for (const auto& [sub_id, path] : files) {
        const CellIndex cell = sub_to_cell(sub_id, opt.grid_size, opt.sub_base_index);
        cells.push_back(GridKey{cell.col, cell.row});
    }
    const GridPlacement placement =
        place_on_grid(cells, cv::Size(opt.tile_size, opt.tile_size),
                      opt.tile_size, opt.tile_size, false);

    Block block;
    block.key = key;
    block.pixels = image::make_transparent_canvas(block_px, block_px);

    // Ascending sub_id; clamped duplicates overlap and the later one wins.
    std::size_t i = 0;
    for (const auto& [sub_id, path] : files) {
        const Image tile = io::load_tile(path, opt.tile_size);
        image::alpha_composite(block.pixels, tile, placement.offsets.at(cells[i]));
        ++block.tiles_placed;
        ++i;
    }
    return block;
}

BlockMap assemble_blocks(const SceneTiles& tiles, const BlockAssemblyOptions& opt,
                         const BlockProgressCallback& progress_cb) {
    BlockMap blocks;
    const int total = static_cast<int>(tiles.size());
    int done = 0;
    for (const auto& [key, files] : tiles) {
        blocks.emplace(key, assemble_block(key, files, opt));
        ++done;
        if (progress_cb) {
            progress_cb(done, total, key);
        }
    }
    return blocks;
}

BlockMap assemble_blocks(const fs::path& tile_dir, int scene_id,
                         const BlockAssemblyOptions& opt,
                         const BlockProgressCallback& progress_cb) {
    return assemble_blocks(scan_scene_tiles(tile_dir, scene_id), opt, progress_cb);
}

} // namespace ortho_stitch::tiling
