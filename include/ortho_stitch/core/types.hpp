#pragma once

#include <opencv2/core.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <tuple>

namespace ortho_stitch {

namespace fs = std::filesystem;

// Pixel grids are CV_8UC4 in OpenCV channel order (B, G, R, A), straight alpha.
using Image = cv::Mat;

// Position encoded in a tile filename: <scene>_<col>_<row>_<sub>.<ext>
struct TilePosition {
    int scene_id;
    int col_id;
    int row_id;
    int sub_id;
};

inline bool operator==(const TilePosition& a, const TilePosition& b) {
    return a.scene_id == b.scene_id && a.col_id == b.col_id &&
           a.row_id == b.row_id && a.sub_id == b.sub_id;
}

// Column/row address on a regular grid. Used for coarse block keys
// and for sub-tile cells inside a block.
struct GridKey {
    int col;
    int row;
};

inline bool operator<(const GridKey& a, const GridKey& b) {
    return std::tie(a.col, a.row) < std::tie(b.col, b.row);
}

inline bool operator==(const GridKey& a, const GridKey& b) {
    return a.col == b.col && a.row == b.row;
}

using BlockKey = GridKey;

// Cell inside a block, row-major.
struct CellIndex {
    int row;
    int col;
};

// One gridSize x gridSize assembly of tiles.
struct Block {
    BlockKey key{0, 0};
    Image pixels;
    int tiles_placed = 0;
};

using BlockMap = std::map<BlockKey, Block>;

// Pipeline phase enumeration
enum class Phase {
    SCAN_TILES = 0,
    BUILD_BLOCKS = 1,
    STITCH_MOSAIC = 2,
    WRITE_OUTPUT = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_TILES: return "SCAN_TILES";
        case Phase::BUILD_BLOCKS: return "BUILD_BLOCKS";
        case Phase::STITCH_MOSAIC: return "STITCH_MOSAIC";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace ortho_stitch
