#pragma once
#include <cstdint>
#include "ncaplay/cell_grid.hpp"

namespace ncaplay {

std::uint32_t hash_u32(std::uint32_t value);
float random_unit(std::uint32_t value);

// Hash inputs of the three channels of cell (x, y). Pairwise distinct for any grid.
std::array<std::uint32_t, 3> seed_inputs(int x, int y, int width, int height);

// Deterministic per-channel noise, alpha = 1.
void seed(CellGrid& grid);

}
