#pragma once

#include "ortho_stitch/core/types.hpp"

#include <opencv2/core.hpp>
#include <map>
#include <vector>

namespace ortho_stitch::tiling {

/*
  Map a sub-tile index to its cell inside a grid_size x grid_size block.
  idx = sub_id - sub_base is clamped into [0, grid_size^2 - 1], so
  malformed indices land on the first or last cell instead of failing.
  Layout is row-major: idx increases across columns first, then rows.
*/
CellIndex sub_to_cell(int sub_id, int grid_size, int sub_base);

// Rank of each distinct value in ascending order (0-based).
std::map<int, int> compact_indices(const std::vector<int>& values);

struct GridPlacement {
    std::map<GridKey, cv::Point> offsets; // top-left pixel per cell
    cv::Size canvas;                      // max offset + item size
};

/*
  Place items of equal size on a regular grid: cell (col,row) goes to
  (col*stride_x, row*stride_y). With compact set, col and row are first
  replaced by their dense rank on each axis so that unused ids leave no
  empty space. Shared by the sub-tile and block levels.

  Items do not overlap when stride >= item size. With a smaller stride
  they do, and whatever is composited last wins. Stride 0 stacks every
  item at the origin of that axis. Negative strides throw ValidationError.
*/
GridPlacement place_on_grid(const std::vector<GridKey>& cells, cv::Size item_size,
                            int stride_x, int stride_y, bool compact);

} // namespace ortho_stitch::tiling
