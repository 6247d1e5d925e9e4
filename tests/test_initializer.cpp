#include <catch2/catch.hpp>
#include <set>
#include "ncaplay/initializer.hpp"

using namespace ncaplay;

TEST_CASE("Seed", "[Initializer]") {
    SECTION("Deterministic Across Runs") {
        CellGrid a(17, 9);
        CellGrid b(17, 9);
        seed(a);
        seed(b);
        REQUIRE(a == b);
    }

    SECTION("Values In Unit Range With Opaque Alpha") {
        CellGrid grid(40, 40);
        seed(grid);
        for (const auto& cell : grid.raw()) {
            for (int c = 0; c < 3; ++c) {
                REQUIRE(cell[c] >= 0.0f);
                REQUIRE(cell[c] <= 1.0f);
            }
            REQUIRE(cell[3] == 1.0f);
        }
    }

    SECTION("Cell Matches Hash Of Its Inputs") {
        CellGrid grid(6, 5);
        seed(grid);
        const auto inputs = seed_inputs(4, 3, 6, 5);
        REQUIRE(inputs[0] == 3u * 6u + 4u);
        REQUIRE(inputs[1] == 30u + 22u);
        REQUIRE(inputs[2] == 60u + 22u);
        REQUIRE(grid.at(4, 3)[0] == random_unit(inputs[0]));
        REQUIRE(grid.at(4, 3)[1] == random_unit(inputs[1]));
        REQUIRE(grid.at(4, 3)[2] == random_unit(inputs[2]));
    }

    SECTION("Channels Not Identical") {
        CellGrid grid(8, 8);
        seed(grid);
        int equal = 0;
        for (const auto& cell : grid.raw()) {
            if (cell[0] == cell[1] && cell[1] == cell[2]) ++equal;
        }
        REQUIRE(equal == 0);
    }

    SECTION("Tile Boundaries Leave No Gaps") {
        // 13 is not a multiple of the tile size
        CellGrid grid(13, 13);
        grid.fill(Cell{-1.0f, -1.0f, -1.0f, 0.0f});
        seed(grid);
        for (const auto& cell : grid.raw()) REQUIRE(cell[3] == 1.0f);
    }
}

TEST_CASE("Seed Inputs Disjoint", "[Initializer]") {
    const int sizes[][2] = {{1, 1}, {1, 7}, {5, 3}, {16, 16}};
    for (const auto& wh : sizes) {
        std::set<std::uint32_t> seen;
        for (int y = 0; y < wh[1]; ++y) {
            for (int x = 0; x < wh[0]; ++x) {
                const auto in = seed_inputs(x, y, wh[0], wh[1]);
                REQUIRE(in[0] != in[1]);
                REQUIRE(in[1] != in[2]);
                REQUIRE(in[0] != in[2]);
                for (auto v : in) REQUIRE(seen.insert(v).second);
            }
        }
    }
}

TEST_CASE("Hash Avalanche", "[Initializer]") {
    REQUIRE(hash_u32(0) != hash_u32(1));
    REQUIRE(hash_u32(12345) == hash_u32(12345));
    // neighbouring inputs should differ in many bits
    int total_bits = 0;
    for (std::uint32_t v = 0; v < 64; ++v) {
        std::uint32_t diff = hash_u32(v) ^ hash_u32(v + 1);
        while (diff) {
            total_bits += diff & 1u;
            diff >>= 1;
        }
    }
    REQUIRE(total_bits > 64 * 8);
    REQUIRE(random_unit(0) >= 0.0f);
    REQUIRE(random_unit(0xFFFFFFFFu) <= 1.0f);
}
