#include <catch2/catch.hpp>
#include <stdexcept>
#include "ncaplay/cell_grid.hpp"

using namespace ncaplay;

TEST_CASE("CellGrid", "[CellGrid]") {
    SECTION("Rejects Degenerate Dimensions") {
        REQUIRE_THROWS_AS(CellGrid(0, 4), std::invalid_argument);
        REQUIRE_THROWS_AS(CellGrid(4, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(CellGrid(-3, 4), std::invalid_argument);
    }

    SECTION("Starts Black With Opaque Alpha") {
        CellGrid grid(3, 2);
        REQUIRE(grid.size() == 6);
        for (const auto& cell : grid.raw()) {
            REQUIRE(cell == Cell{0.0f, 0.0f, 0.0f, 1.0f});
        }
    }

    SECTION("Bounds Checked Access") {
        CellGrid grid(4, 3);
        grid.at(3, 2) = Cell{0.5f, 0.25f, 0.125f, 1.0f};
        REQUIRE(grid.raw()[2 * 4 + 3][0] == 0.5f);
        REQUIRE_THROWS_AS(grid.at(4, 0), std::out_of_range);
        REQUIRE_THROWS_AS(grid.at(0, 3), std::out_of_range);
        REQUIRE_THROWS_AS(grid.at(-1, 0), std::out_of_range);

        const CellGrid& view = grid;
        REQUIRE(view.at(3, 2)[0] == 0.5f);
        REQUIRE_THROWS_AS(view.at(4, 2), std::out_of_range);
        REQUIRE_THROWS_AS(view.at(0, -1), std::out_of_range);
    }

    SECTION("Toroidal Wrap") {
        CellGrid grid(5, 4);
        for (int y = 0; y < 4; ++y)
            for (int x = 0; x < 5; ++x)
                grid.at(x, y) = Cell{static_cast<float>(x), static_cast<float>(y), 0.0f, 1.0f};

        for (int y = 0; y < 4; ++y) {
            REQUIRE(grid.get_wrapped(-1, y) == grid.get_wrapped(4, y));
            REQUIRE(grid.get_wrapped(5, y) == grid.get_wrapped(0, y));
        }
        for (int x = 0; x < 5; ++x) {
            REQUIRE(grid.get_wrapped(x, -1) == grid.at(x, 3));
            REQUIRE(grid.get_wrapped(x, 4) == grid.at(x, 0));
        }
        REQUIRE(grid.get_wrapped(-1, -1) == grid.at(4, 3));
        REQUIRE(grid.get_wrapped(-11, 13) == grid.at(4, 1));
    }
}

TEST_CASE("GridPair", "[CellGrid]") {
    GridPair pair(3, 3);
    pair.current_mut().at(1, 1) = Cell{1.0f, 0.0f, 0.0f, 1.0f};
    pair.back().fill(Cell{0.0f, 1.0f, 0.0f, 1.0f});
    REQUIRE(pair.current().at(1, 1)[0] == 1.0f);

    pair.swap();
    REQUIRE(pair.current().at(1, 1)[1] == 1.0f);
    REQUIRE(pair.back().at(1, 1)[0] == 1.0f);

    pair.swap();
    REQUIRE(pair.current().at(1, 1)[0] == 1.0f);
    REQUIRE(&pair.current() != &pair.back());
}
