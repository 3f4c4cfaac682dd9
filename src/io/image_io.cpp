#include "ortho_stitch/io/image_io.hpp"
#include "ortho_stitch/core/errors.hpp"
#include "ortho_stitch/core/utils.hpp"
#include "ortho_stitch/image/compositing.hpp"

#include <opencv2/imgcodecs.hpp>
#include <array>

namespace ortho_stitch::io {

bool is_tile_extension(const std::string& ext) {
    static const std::array<const char*, 5> kExtensions = {"png", "jpg", "jpeg", "tif", "tiff"};
    const std::string lower = core::to_lower(ext);
    for (const char* e : kExtensions) {
        if (lower == e) return true;
    }
    return false;
}

Image load_tile(const fs::path& path, int tile_size) {
    cv::Mat decoded;
    try {
        decoded = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw TileDecodeError(path.string() + ": " + e.what());
    }
    if (decoded.empty()) {
        throw TileDecodeError("cannot decode " + path.string());
    }

    Image rgba;
    try {
        rgba = image::to_bgra8(decoded);
    } catch (const ValidationError& e) {
        throw TileDecodeError(path.string() + ": " + e.what());
    }
    return image::resample_nearest(rgba, tile_size);
}

bool stores_alpha(const std::string& ext) {
    static const std::array<const char*, 3> kNoAlpha = {"jpg", "jpeg", "jpe"};
    const std::string lower = core::to_lower(ext);
    for (const char* e : kNoAlpha) {
        if (lower == e) return false;
    }
    return true;
}

void write_mosaic(const Image& mosaic, const fs::path& output_path) {
    std::string ext = output_path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    if (!stores_alpha(ext)) {
        // the encoder would drop the alpha channel and fill gaps with black
        throw OutputWriteError(output_path.string() + ": format cannot store an alpha channel");
    }

    const fs::path parent = output_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw OutputWriteError("cannot create " + parent.string() + ": " + ec.message());
        }
    }

    bool ok = false;
    try {
        ok = cv::imwrite(output_path.string(), mosaic);
    } catch (const cv::Exception& e) {
        throw OutputWriteError(output_path.string() + ": " + e.what());
    }
    if (!ok) {
        throw OutputWriteError("encoder failed for " + output_path.string());
    }
}

} // namespace ortho_stitch::io
