#include <catch2/catch.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include "ncaplay/frame_io.hpp"

using namespace ncaplay;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

std::string read_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

}

TEST_CASE("RGB8 Conversion", "[FrameIo]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    CellGrid grid(2, 2);
    grid.at(0, 0) = Cell{0.0f, 1.0f, nan, 1.0f};
    grid.at(1, 0) = Cell{0.5f, -3.0f, 7.0f, 0.0f};
    grid.at(0, 1) = Cell{1.0f, 1.0f, 1.0f, 1.0f};

    const auto px = to_rgb8(grid);
    REQUIRE(px.size() == 12);
    // top row first, left to right
    REQUIRE(px[0] == 0);
    REQUIRE(px[1] == 255);
    REQUIRE(px[2] == 0);
    REQUIRE(px[3] == 128);
    REQUIRE(px[4] == 0);
    REQUIRE(px[5] == 255);
    REQUIRE(px[6] == 255);
    REQUIRE(px[7] == 255);
    REQUIRE(px[8] == 255);
    REQUIRE(px[9] == 0);
    REQUIRE(px[10] == 0);
    REQUIRE(px[11] == 0);
}

TEST_CASE("Write PPM", "[FrameIo]") {
    SECTION("Header And Pixels") {
        CellGrid grid(3, 2);
        grid.at(0, 0) = Cell{1.0f, 0.0f, 0.0f, 1.0f};
        grid.at(2, 1) = Cell{0.0f, 0.0f, 1.0f, 1.0f};

        const std::string path = temp_path("ncaplay_frame_io_test.ppm");
        write_ppm(path, grid);
        const std::string data = read_file(path);
        std::remove(path.c_str());

        const std::string header = "P6\n3 2\n255\n";
        REQUIRE(data.size() == header.size() + 3 * 2 * 3);
        REQUIRE(data.compare(0, header.size(), header) == 0);

        const auto* px = reinterpret_cast<const unsigned char*>(data.data() + header.size());
        REQUIRE(px[0] == 255);
        REQUIRE(px[1] == 0);
        REQUIRE(px[2] == 0);
        // last pixel is the bottom-right cell
        REQUIRE(px[15] == 0);
        REQUIRE(px[16] == 0);
        REQUIRE(px[17] == 255);
    }

    SECTION("Unwritable Path Throws") {
        CellGrid grid(2, 2);
        const std::string path = temp_path("ncaplay_missing_dir/sub/frame.ppm");
        REQUIRE_THROWS_AS(write_ppm(path, grid), std::runtime_error);
    }
}
