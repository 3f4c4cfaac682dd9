#pragma once

#include "ortho_stitch/core/types.hpp"

#include <opencv2/core.hpp>
#include <map>

namespace ortho_stitch::tiling {

struct MosaicOptions {
    int stride_x = 1024;
    int stride_y = 1024;
    bool compact_gaps = true;
};

struct Mosaic {
    Image image;                                // composited canvas
    std::map<BlockKey, cv::Point> placements;   // top-left of each block
    cv::Size block_size;
};

/*
  Place every block at its coarse-grid offset and composite onto a canvas
  that is exactly max offset + block size on each axis.

  Blocks are composited in ascending (col,row) order. Placement only
  avoids overlap when stride >= block size; otherwise the later block wins.

  Throws EmptyInputError if blocks is empty.
*/
Mosaic assemble_mosaic(const BlockMap& blocks, const MosaicOptions& opt);

} // namespace ortho_stitch::tiling
