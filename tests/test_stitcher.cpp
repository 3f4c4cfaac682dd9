#include "ortho_stitch/pipeline/stitcher.hpp"
#include "ortho_stitch/core/errors.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <sstream>
#include <string>

using ortho_stitch::config::Config;
using ortho_stitch::core::EventEmitter;
using ortho_stitch::pipeline::stitch_scene;
using ortho_stitch::testing::TempDir;
using ortho_stitch::testing::count_transparent;
using ortho_stitch::testing::write_solid_tile;

namespace {

Config small_config(const TempDir& dir, int scene_id, const std::string& out_name) {
    Config cfg;
    cfg.input.tile_dir = (dir.path() / "tiles").string();
    cfg.input.scene_id = scene_id;
    cfg.grid.tile_size = 8;
    cfg.grid.grid_size = 2;
    cfg.grid.sub_base_index = 1;
    cfg.output.path = (dir.path() / out_name).string();
    return cfg;
}

} // namespace

TEST_CASE("full_scene_of_sixteen_tiles_writes_opaque_1024_mosaic") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "tiles");
    for (int sub = 1; sub <= 16; ++sub) {
        write_solid_tile(dir.path() / "tiles", "004_1_2_" + std::to_string(sub) + ".png", 256,
                         cv::Scalar(sub, 2 * sub, 3 * sub, 255));
    }

    Config cfg;
    cfg.input.tile_dir = (dir.path() / "tiles").string();
    cfg.input.scene_id = 4;
    cfg.output.path = (dir.path() / "out" / "scene_004.png").string();

    EventEmitter emitter;
    std::ostringstream events;
    auto result = stitch_scene(cfg, "test", emitter, events);

    REQUIRE(result.written);
    REQUIRE(result.tiles_found == 16);
    REQUIRE(result.blocks == 1);
    REQUIRE(result.size == cv::Size(1024, 1024));

    cv::Mat written = cv::imread(cfg.output.path, cv::IMREAD_UNCHANGED);
    REQUIRE(written.type() == CV_8UC4);
    REQUIRE(written.size() == cv::Size(1024, 1024));
    REQUIRE(count_transparent(written) == 0);
}

TEST_CASE("scene_without_tiles_reports_zero_and_writes_nothing") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "tiles");

    Config cfg = small_config(dir, 7, "empty.png");
    EventEmitter emitter;
    std::ostringstream events;

    auto result = stitch_scene(cfg, "test", emitter, events);
    REQUIRE_FALSE(result.written);
    REQUIRE(result.tiles_found == 0);
    REQUIRE_FALSE(std::filesystem::exists(cfg.output.path));

    write_solid_tile(dir.path() / "tiles", "004_0_0_1.png", 8, cv::Scalar(1, 1, 1, 255));
    result = stitch_scene(cfg, "test", emitter, events);
    REQUIRE_FALSE(result.written);
    REQUIRE(result.tiles_found == 0);
    REQUIRE(result.files_ignored == 0);
    REQUIRE_FALSE(std::filesystem::exists(cfg.output.path));
    REQUIRE(events.str().find("no tiles found for scene 007") != std::string::npos);
}

TEST_CASE("column_gap_shapes_the_written_canvas") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "tiles");
    write_solid_tile(dir.path() / "tiles", "9_1_0_1.png", 8, cv::Scalar(1, 1, 1, 255));
    write_solid_tile(dir.path() / "tiles", "9_5_0_1.png", 8, cv::Scalar(2, 2, 2, 255));

    EventEmitter emitter;
    std::ostringstream events;

    Config dense = small_config(dir, 9, "dense.png");
    auto r1 = stitch_scene(dense, "test", emitter, events);
    REQUIRE(r1.size == cv::Size(32, 16));

    Config sparse = small_config(dir, 9, "sparse.png");
    sparse.mosaic.compact_gaps = false;
    auto r2 = stitch_scene(sparse, "test", emitter, events);
    REQUIRE(r2.size == cv::Size(96, 16));
}

TEST_CASE("stitching_twice_is_pixel_identical") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "tiles");
    write_solid_tile(dir.path() / "tiles", "1_0_0_1.png", 8, cv::Scalar(10, 20, 30, 255));
    write_solid_tile(dir.path() / "tiles", "1_0_0_4.png", 6, cv::Scalar(40, 50, 60, 128));
    write_solid_tile(dir.path() / "tiles", "1_3_2_2.png", 8, cv::Scalar(70, 80, 90, 255));

    EventEmitter emitter;
    std::ostringstream events;
    Config a = small_config(dir, 1, "a.png");
    Config b = small_config(dir, 1, "b.png");
    stitch_scene(a, "test", emitter, events);
    stitch_scene(b, "test", emitter, events);

    cv::Mat img_a = cv::imread(a.output.path, cv::IMREAD_UNCHANGED);
    cv::Mat img_b = cv::imread(b.output.path, cv::IMREAD_UNCHANGED);
    REQUIRE(img_a.size() == img_b.size());
    REQUIRE(cv::norm(img_a, img_b, cv::NORM_INF) == 0.0);
}

TEST_CASE("decode_failure_aborts_without_output") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "tiles");
    write_solid_tile(dir.path() / "tiles", "2_0_0_1.png", 8, cv::Scalar(1, 1, 1, 255));
    std::ofstream(dir.path() / "tiles" / "2_0_0_2.png") << "broken";

    Config cfg = small_config(dir, 2, "broken.png");
    EventEmitter emitter;
    std::ostringstream events;

    REQUIRE_THROWS_AS(stitch_scene(cfg, "test", emitter, events), ortho_stitch::TileDecodeError);
    REQUIRE_FALSE(std::filesystem::exists(cfg.output.path));
    REQUIRE(events.str().find("\"type\":\"error\"") != std::string::npos);
}

TEST_CASE("unknown_output_extension_is_an_output_write_error") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "tiles");
    write_solid_tile(dir.path() / "tiles", "3_0_0_1.png", 8, cv::Scalar(1, 1, 1, 255));

    Config cfg = small_config(dir, 3, "mosaic.notaformat");
    EventEmitter emitter;
    std::ostringstream events;

    REQUIRE_THROWS_AS(stitch_scene(cfg, "test", emitter, events), ortho_stitch::OutputWriteError);

    for (const char* name : {"out/mosaic.jpg", "out/mosaic.JPEG"}) {
        Config jpeg = small_config(dir, 3, name);
        REQUIRE_THROWS_AS(stitch_scene(jpeg, "test", emitter, events),
                          ortho_stitch::OutputWriteError);
        REQUIRE_FALSE(std::filesystem::exists(jpeg.output.path));
    }
}

TEST_CASE("zero_stride_stacks_blocks_into_one_block_wide_canvas") {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "tiles");
    write_solid_tile(dir.path() / "tiles", "5_1_0_1.png", 8, cv::Scalar(1, 1, 1, 255));
    write_solid_tile(dir.path() / "tiles", "5_4_0_1.png", 8, cv::Scalar(2, 2, 2, 255));

    Config cfg = small_config(dir, 5, "stacked.png");
    cfg.mosaic.compact_gaps = false;
    cfg.mosaic.stride_x = 0;
    EventEmitter emitter;
    std::ostringstream events;

    auto result = stitch_scene(cfg, "test", emitter, events);
    REQUIRE(result.size == cv::Size(16, 16));
    cv::Mat written = cv::imread(cfg.output.path, cv::IMREAD_UNCHANGED);
    REQUIRE(written.at<cv::Vec4b>(0, 0) == cv::Vec4b(2, 2, 2, 255));
}

TEST_CASE("missing_tile_directory_is_fatal") {
    TempDir dir;
    Config cfg = small_config(dir, 1, "x.png");
    EventEmitter emitter;
    std::ostringstream events;

    REQUIRE_THROWS_AS(stitch_scene(cfg, "test", emitter, events), ortho_stitch::IOError);
}
