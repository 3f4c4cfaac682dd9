#include "ortho_stitch/tiling/grid_layout.hpp"
#include "ortho_stitch/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <climits>
#include <set>
#include <vector>

using ortho_stitch::GridKey;
using ortho_stitch::tiling::compact_indices;
using ortho_stitch::tiling::place_on_grid;
using ortho_stitch::tiling::sub_to_cell;

TEST_CASE("sub_to_cell_is_row_major_from_the_base_index") {
    auto first = sub_to_cell(1, 4, 1);
    REQUIRE(first.row == 0);
    REQUIRE(first.col == 0);

    auto second = sub_to_cell(2, 4, 1);
    REQUIRE(second.row == 0);
    REQUIRE(second.col == 1);

    auto fifth = sub_to_cell(5, 4, 1);
    REQUIRE(fifth.row == 1);
    REQUIRE(fifth.col == 0);

    auto last = sub_to_cell(16, 4, 1);
    REQUIRE(last.row == 3);
    REQUIRE(last.col == 3);
}

TEST_CASE("sub_to_cell_clamps_out_of_range_indices") {
    auto below = sub_to_cell(0, 4, 1);
    REQUIRE(below.row == 0);
    REQUIRE(below.col == 0);

    auto above = sub_to_cell(99, 4, 1);
    REQUIRE(above.row == 3);
    REQUIRE(above.col == 3);

    auto zero_base = sub_to_cell(16, 4, 0);
    REQUIRE(zero_base.row == 3);
    REQUIRE(zero_base.col == 3);
}

TEST_CASE("sub_to_cell_stays_inside_grid_for_any_sub_id") {
    for (int grid = 1; grid <= 6; ++grid) {
        for (int sub : {INT_MIN, -1000, -1, 0, 1, 7, 35, 36, 1000, INT_MAX}) {
            for (int base : {0, 1, 5}) {
                auto c = sub_to_cell(sub, grid, base);
                REQUIRE(c.row >= 0);
                REQUIRE(c.row < grid);
                REQUIRE(c.col >= 0);
                REQUIRE(c.col < grid);
            }
        }
    }
}

TEST_CASE("sub_to_cell_rejects_empty_grid") {
    REQUIRE_THROWS_AS(sub_to_cell(1, 0, 1), ortho_stitch::ValidationError);
}

TEST_CASE("compact_indices_ranks_distinct_values") {
    auto dense = compact_indices({5, 1, 9, 5, 1});
    REQUIRE(dense.size() == 3);
    REQUIRE(dense.at(1) == 0);
    REQUIRE(dense.at(5) == 1);
    REQUIRE(dense.at(9) == 2);
}

TEST_CASE("compact_indices_yields_contiguous_order_preserving_ranks") {
    const std::vector<int> values = {40, -3, 7, 7, 1000, 0, 12, -3};
    auto dense = compact_indices(values);

    std::set<int> ranks;
    for (const auto& [raw, rank] : dense) ranks.insert(rank);
    REQUIRE(ranks.size() == 6);
    REQUIRE(*ranks.begin() == 0);
    REQUIRE(*ranks.rbegin() == 5);

    for (int a : values) {
        for (int b : values) {
            if (a < b) REQUIRE(dense.at(a) < dense.at(b));
        }
    }
}

TEST_CASE("compact_indices_of_empty_input_is_empty") {
    REQUIRE(compact_indices({}).empty());
}

TEST_CASE("place_on_grid_uses_raw_ids_without_compaction") {
    auto p = place_on_grid({GridKey{1, 0}, GridKey{5, 0}}, cv::Size(10, 10), 10, 10, false);
    REQUIRE(p.offsets.at(GridKey{1, 0}) == cv::Point(10, 0));
    REQUIRE(p.offsets.at(GridKey{5, 0}) == cv::Point(50, 0));
    REQUIRE(p.canvas == cv::Size(60, 10));
}

TEST_CASE("place_on_grid_compacts_each_axis_independently") {
    auto p = place_on_grid({GridKey{1, 3}, GridKey{5, 3}, GridKey{5, 8}}, cv::Size(10, 10), 10, 10, true);
    REQUIRE(p.offsets.at(GridKey{1, 3}) == cv::Point(0, 0));
    REQUIRE(p.offsets.at(GridKey{5, 3}) == cv::Point(10, 0));
    REQUIRE(p.offsets.at(GridKey{5, 8}) == cv::Point(10, 10));
    REQUIRE(p.canvas == cv::Size(20, 20));
}

TEST_CASE("place_on_grid_canvas_is_tight_for_custom_strides") {
    auto p = place_on_grid({GridKey{0, 0}, GridKey{2, 1}}, cv::Size(8, 6), 12, 7, false);
    REQUIRE(p.offsets.at(GridKey{2, 1}) == cv::Point(24, 7));
    REQUIRE(p.canvas == cv::Size(24 + 8, 7 + 6));
}

TEST_CASE("place_on_grid_zero_stride_stacks_items_at_origin") {
    auto p = place_on_grid({GridKey{0, 0}, GridKey{3, 1}}, cv::Size(8, 6), 0, 6, false);
    REQUIRE(p.offsets.at(GridKey{3, 1}) == cv::Point(0, 6));
    REQUIRE(p.canvas == cv::Size(8, 12));
}

TEST_CASE("place_on_grid_rejects_negative_stride") {
    REQUIRE_THROWS_AS(place_on_grid({GridKey{0, 0}}, cv::Size(4, 4), -1, 4, false),
                      ortho_stitch::ValidationError);
    REQUIRE_THROWS_AS(place_on_grid({GridKey{0, 0}}, cv::Size(4, 4), 4, -4, false),
                      ortho_stitch::ValidationError);
}
