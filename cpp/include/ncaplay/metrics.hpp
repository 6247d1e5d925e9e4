#pragma once
#include <vector>
#include "ncaplay/cell_grid.hpp"

namespace ncaplay {

float entropy(const std::vector<float>& data);

float channel_entropy(const CellGrid& grid, int channel);
float channel_mean(const CellGrid& grid, int channel);

}
