#include "ncaplay/initializer.hpp"
#include "ncaplay/nca_stepper.hpp"
#include <algorithm>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace ncaplay {

namespace {
constexpr int kTile = 8;
}

std::uint32_t hash_u32(std::uint32_t value) {
    std::uint32_t state = value;
    state ^= 0xA3C59AC3u;
    state *= 0x9E3779B9u;
    state ^= state >> 16;
    state *= 0x9E3779B9u;
    state ^= state >> 16;
    state *= 0x9E3779B9u;
    return state;
}

float random_unit(std::uint32_t value) {
    return static_cast<float>(static_cast<double>(hash_u32(value)) / 4294967295.0);
}

std::array<std::uint32_t, 3> seed_inputs(int x, int y, int width, int height) {
    const std::uint32_t total = static_cast<std::uint32_t>(width) * static_cast<std::uint32_t>(height);
    const std::uint32_t index = static_cast<std::uint32_t>(y) * static_cast<std::uint32_t>(width) + static_cast<std::uint32_t>(x);
    return {index, total + index, 2u * total + index};
}

void seed(CellGrid& grid) {
    const int width = grid.width();
    const int height = grid.height();
    const int tiles_x = (width + kTile - 1) / kTile;
    const int tiles_y = (height + kTile - 1) / kTile;
    auto& cells = grid.raw();

    #pragma omp parallel for collapse(2) if(run_parallel(width, height))
    for (int ty = 0; ty < tiles_y; ++ty) {
        for (int tx = 0; tx < tiles_x; ++tx) {
            const int y_end = std::min(height, (ty + 1) * kTile);
            const int x_end = std::min(width, (tx + 1) * kTile);
            for (int y = ty * kTile; y < y_end; ++y) {
                for (int x = tx * kTile; x < x_end; ++x) {
                    const auto inputs = seed_inputs(x, y, width, height);
                    cells[static_cast<std::size_t>(y) * width + x] =
                        Cell{random_unit(inputs[0]), random_unit(inputs[1]), random_unit(inputs[2]), 1.0f};
                }
            }
        }
    }
}

}
