#include "ortho_stitch/tiling/name_parser.hpp"
#include "ortho_stitch/io/image_io.hpp"

#include <regex>
#include <stdexcept>

namespace ortho_stitch::tiling {

std::optional<TilePosition> parse_tile_name(const std::string& filename) {
    static const std::regex kPattern(R"(^([0-9]+)_([0-9]+)_([0-9]+)_([0-9]+)\.([A-Za-z]+)$)");

    std::smatch m;
    if (!std::regex_match(filename, m, kPattern)) {
        return std::nullopt;
    }
    if (!io::is_tile_extension(m[5].str())) {
        return std::nullopt;
    }

    try {
        return TilePosition{std::stoi(m[1].str()), std::stoi(m[2].str()),
                            std::stoi(m[3].str()), std::stoi(m[4].str())};
    } catch (const std::out_of_range&) {
        // digit group does not fit in an int
        return std::nullopt;
    }
}

} // namespace ortho_stitch::tiling
