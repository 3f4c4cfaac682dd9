#pragma once

#include "ortho_stitch/config/configuration.hpp"
#include "ortho_stitch/core/events.hpp"
#include "ortho_stitch/core/types.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace ortho_stitch::pipeline {

struct StitchResult {
    std::size_t tiles_found = 0;   // matched tiles of the requested scene
    std::size_t files_ignored = 0; // directory entries that did not parse
    std::size_t blocks = 0;
    bool written = false;          // false when the scene had no tiles
    fs::path output_path;
    cv::Size size;
};

/*
  Scan -> build blocks -> stitch -> write for one scene.

  Emits phase events to `events`. A scene without tiles is not an error:
  the result has written == false and no file is created. Fatal errors
  (TileDecodeError, EmptyInputError, OutputWriteError, IOError) are
  reported as phase_end/error events and rethrown; the output file is only
  written after the whole mosaic has been composited.

  cfg must pass Config::validate_for_run().
*/
StitchResult stitch_scene(const config::Config& cfg, const std::string& run_id,
                          core::EventEmitter& emitter, std::ostream& events);

} // namespace ortho_stitch::pipeline
