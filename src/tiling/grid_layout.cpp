#include "ortho_stitch/tiling/grid_layout.hpp"
#include "ortho_stitch/core/errors.hpp"

#include <algorithm>
#include <limits>
#include <set>

namespace ortho_stitch::tiling {

CellIndex sub_to_cell(int sub_id, int grid_size, int sub_base) {
    if (grid_size < 1) {
        throw ValidationError("grid_size must be >= 1");
    }
    const long long max_idx = static_cast<long long>(grid_size) * grid_size - 1;
    long long idx = static_cast<long long>(sub_id) - sub_base;
    idx = std::clamp(idx, 0LL, max_idx);
    return {static_cast<int>(idx / grid_size), static_cast<int>(idx % grid_size)};
}

std::map<int, int> compact_indices(const std::vector<int>& values) {
    const std::set<int> uniq(values.begin(), values.end());
    std::map<int, int> dense;
    int rank = 0;
    for (int v : uniq) {
        dense[v] = rank++;
    }
    return dense;
}

GridPlacement place_on_grid(const std::vector<GridKey>& cells, cv::Size item_size,
                            int stride_x, int stride_y, bool compact) {
    if (stride_x < 0 || stride_y < 0) {
        throw ValidationError("grid stride must be >= 0");
    }

    std::map<int, int> col_rank;
    std::map<int, int> row_rank;
    if (compact) {
        std::vector<int> cols, rows;
        cols.reserve(cells.size());
        rows.reserve(cells.size());
        for (const auto& c : cells) {
            cols.push_back(c.col);
            rows.push_back(c.row);
        }
        col_rank = compact_indices(cols);
        row_rank = compact_indices(rows);
    }

    GridPlacement out;
    long long max_x = 0;
    long long max_y = 0;
    for (const auto& c : cells) {
        const int col = compact ? col_rank.at(c.col) : c.col;
        const int row = compact ? row_rank.at(c.row) : c.row;
        const long long x = static_cast<long long>(col) * stride_x;
        const long long y = static_cast<long long>(row) * stride_y;
        if (x + item_size.width > std::numeric_limits<int>::max() ||
            y + item_size.height > std::numeric_limits<int>::max()) {
            throw ValidationError("grid placement exceeds addressable canvas size");
        }
        out.offsets[c] = cv::Point(static_cast<int>(x), static_cast<int>(y));
        max_x = std::max(max_x, x);
        max_y = std::max(max_y, y);
    }

    if (!cells.empty()) {
        out.canvas = cv::Size(static_cast<int>(max_x) + item_size.width,
                              static_cast<int>(max_y) + item_size.height);
    }
    return out;
}

} // namespace ortho_stitch::tiling
