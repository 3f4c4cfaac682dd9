#pragma once

#include "ortho_stitch/core/types.hpp"

#include <string>

namespace ortho_stitch::io {

// Raster formats accepted as tile input (lower case, without dot).
bool is_tile_extension(const std::string& ext);

// Decode a tile to CV_8UC4 and bring it to tile_size x tile_size.
// Throws TileDecodeError if the file cannot be decoded.
Image load_tile(const fs::path& path, int tile_size);

// False for output formats that have no alpha channel (JPEG).
bool stores_alpha(const std::string& ext);

// Encode the mosaic, format from the extension of output_path.
// Parent directories are created. Throws OutputWriteError on failure,
// and before touching the filesystem when the format cannot store alpha.
void write_mosaic(const Image& mosaic, const fs::path& output_path);

} // namespace ortho_stitch::io
