#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "ncaplay/cell_grid.hpp"

namespace ncaplay {

// RGB bytes, row-major from the top row, channels scaled from [0, 1].
std::vector<std::uint8_t> to_rgb8(const CellGrid& grid);

// Binary P6 image. Throws std::runtime_error when the file cannot be written.
void write_ppm(const std::string& filename, const CellGrid& grid);

}
