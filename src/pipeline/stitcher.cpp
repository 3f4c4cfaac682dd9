#include "ortho_stitch/pipeline/stitcher.hpp"
#include "ortho_stitch/io/image_io.hpp"
#include "ortho_stitch/tiling/block_assembler.hpp"
#include "ortho_stitch/tiling/mosaic_assembler.hpp"
#include "ortho_stitch/core/utils.hpp"

#include <exception>

namespace ortho_stitch::pipeline {

namespace {

[[noreturn]] void fail_phase(const std::string& run_id, Phase phase, const std::exception& e,
                             core::EventEmitter& emitter, std::ostream& events) {
    emitter.phase_end(run_id, phase, "error", {{"error", e.what()}}, events);
    emitter.error(run_id, e.what(), events);
    throw;
}

} // namespace

StitchResult stitch_scene(const config::Config& cfg, const std::string& run_id,
                          core::EventEmitter& emitter, std::ostream& events) {
    cfg.validate_for_run();

    StitchResult result;
    const int scene_id = cfg.input.scene_id;
    const fs::path tile_dir(cfg.input.tile_dir);

    // Phase 0: SCAN_TILES
    emitter.phase_start(run_id, Phase::SCAN_TILES, events);
    tiling::SceneTiles scene_tiles;
    try {
        const tiling::DirectoryScan scan = tiling::scan_tile_directory(tile_dir);
        scene_tiles = tiling::group_scene_tiles(scan, scene_id);
        result.files_ignored = scan.ignored;
    } catch (const std::exception& e) {
        fail_phase(run_id, Phase::SCAN_TILES, e, emitter, events);
    }
    result.tiles_found = tiling::count_tiles(scene_tiles);
    result.blocks = scene_tiles.size();
    emitter.phase_end(run_id, Phase::SCAN_TILES, "ok",
                      {{"scene_id", scene_id},
                       {"tiles_found", result.tiles_found},
                       {"blocks", result.blocks},
                       {"files_ignored", result.files_ignored}},
                      events);

    if (scene_tiles.empty()) {
        emitter.warning(run_id, "no tiles found for scene " + core::format_scene_id(scene_id), events);
        return result;
    }

    // Phase 1: BUILD_BLOCKS
    emitter.phase_start(run_id, Phase::BUILD_BLOCKS, events);
    tiling::BlockAssemblyOptions block_opt;
    block_opt.grid_size = cfg.grid.grid_size;
    block_opt.tile_size = cfg.grid.tile_size;
    block_opt.sub_base_index = cfg.grid.sub_base_index;

    BlockMap blocks;
    try {
        blocks = tiling::assemble_blocks(
            scene_tiles, block_opt,
            [&](int done, int total, const BlockKey& key) {
                emitter.phase_progress(run_id, Phase::BUILD_BLOCKS, done, total,
                                       "block " + std::to_string(key.col) + "_" +
                                           std::to_string(key.row),
                                       events);
            });
    } catch (const std::exception& e) {
        fail_phase(run_id, Phase::BUILD_BLOCKS, e, emitter, events);
    }
    emitter.phase_end(run_id, Phase::BUILD_BLOCKS, "ok",
                      {{"blocks", blocks.size()}, {"block_size_px", cfg.block_size_px()}},
                      events);

    // Phase 2: STITCH_MOSAIC
    emitter.phase_start(run_id, Phase::STITCH_MOSAIC, events);
    tiling::MosaicOptions mosaic_opt;
    mosaic_opt.stride_x = cfg.effective_stride_x();
    mosaic_opt.stride_y = cfg.effective_stride_y();
    mosaic_opt.compact_gaps = cfg.mosaic.compact_gaps;
    if (mosaic_opt.stride_x < cfg.block_size_px() || mosaic_opt.stride_y < cfg.block_size_px()) {
        emitter.warning(run_id, "stride smaller than block size: overlapping blocks, last composited wins",
                        events);
    }

    tiling::Mosaic mosaic;
    try {
        mosaic = tiling::assemble_mosaic(blocks, mosaic_opt);
    } catch (const std::exception& e) {
        fail_phase(run_id, Phase::STITCH_MOSAIC, e, emitter, events);
    }
    blocks.clear();

    core::json placements = core::json::array();
    for (const auto& [key, offset] : mosaic.placements) {
        placements.push_back({{"col", key.col}, {"row", key.row}, {"x", offset.x}, {"y", offset.y}});
    }
    emitter.phase_end(run_id, Phase::STITCH_MOSAIC, "ok",
                      {{"width", mosaic.image.cols},
                       {"height", mosaic.image.rows},
                       {"compact_gaps", mosaic_opt.compact_gaps},
                       {"stride_x", mosaic_opt.stride_x},
                       {"stride_y", mosaic_opt.stride_y},
                       {"placements", placements}},
                      events);

    // Phase 3: WRITE_OUTPUT
    emitter.phase_start(run_id, Phase::WRITE_OUTPUT, events);
    const fs::path out_path(cfg.output.path);
    try {
        io::write_mosaic(mosaic.image, out_path);
    } catch (const std::exception& e) {
        fail_phase(run_id, Phase::WRITE_OUTPUT, e, emitter, events);
    }
    emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "ok", {{"output_path", out_path.string()}}, events);

    result.written = true;
    result.output_path = out_path;
    result.size = mosaic.image.size();
    return result;
}

} // namespace ortho_stitch::pipeline
