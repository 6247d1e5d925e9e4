#pragma once
#include <cstddef>
#include "ncaplay/cell_grid.hpp"
#include "ncaplay/parameters.hpp"

namespace ncaplay {

// Clamp to [0, 1]. NaN maps to 0, +inf to 1, -inf to 0.
float clamp_unit(float v);

constexpr std::size_t kParallelCellThreshold = 1024;

// Grids above kParallelCellThreshold cells are stepped and seeded in parallel.
bool run_parallel(int width, int height);

// Next state of cell (x, y), neighbors sampled toroidally. Activation outputs that were
// NaN are added to *nan_count when it is given.
Cell nca_cell(const CellGrid& src, int x, int y, const Parameters& params, std::size_t* nan_count = nullptr);

// Writes the next state of every cell of src into dst. src and dst must be distinct
// grids of equal size. Returns the number of channel values that came out of an
// activation as NaN and were clamped to 0.
std::size_t nca_step(const CellGrid& src, CellGrid& dst, const Parameters& params);

}
