#include "ortho_stitch/tiling/mosaic_assembler.hpp"
#include "ortho_stitch/tiling/grid_layout.hpp"
#include "ortho_stitch/image/compositing.hpp"
#include "ortho_stitch/core/errors.hpp"

#include <utility>
#include <vector>

namespace ortho_stitch::tiling {

Mosaic assemble_mosaic(const BlockMap& blocks, const MosaicOptions& opt) {
    if (blocks.empty()) {
        throw EmptyInputError("no blocks found to stitch");
    }

    // All blocks share one size by construction.
    const cv::Size block_size = blocks.begin()->second.pixels.size();

    std::vector<GridKey> keys;
    keys.reserve(blocks.size());
    for (const auto& [key, block] : blocks) {
        keys.push_back(key);
    }

    GridPlacement placement =
        place_on_grid(keys, block_size, opt.stride_x, opt.stride_y, opt.compact_gaps);

    Mosaic out;
    out.block_size = block_size;
    out.image = image::make_transparent_canvas(placement.canvas.width, placement.canvas.height);
    for (const auto& [key, block] : blocks) {
        image::alpha_composite(out.image, block.pixels, placement.offsets.at(key));
    }
    out.placements = std::move(placement.offsets);
    return out;
}

} // namespace ortho_stitch::tiling
