#include "ncaplay/nca_stepper.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace ncaplay {

namespace {

constexpr int kTile = 8;

std::array<float, 3> convolve(const CellGrid& src, int x, int y, const Parameters& params) {
    std::array<float, 3> acc{0.0f, 0.0f, 0.0f};
    for (int i = -1; i <= 1; ++i) {
        for (int j = -1; j <= 1; ++j) {
            const Cell& n = src.get_wrapped(x + i, y + j);
            for (int c = 0; c < kChannels; ++c) {
                acc[c] += n[c] * params.filters[c][i + 1][j + 1];
            }
        }
    }
    return acc;
}

void validate(const CellGrid& src, const CellGrid& dst, const Parameters& params) {
    if (&src == &dst) {
        throw std::invalid_argument("nca_step: src and dst must be distinct grids");
    }
    if (src.width() != dst.width() || src.height() != dst.height()) {
        throw std::invalid_argument("nca_step: src and dst sizes differ");
    }
    for (int c = 0; c < kChannels; ++c) {
        if (!params.activations[c]) {
            throw std::invalid_argument("nca_step: activation for channel " + std::to_string(c) + " is empty");
        }
    }
}

}

float clamp_unit(float v) {
    if (std::isnan(v)) return 0.0f;
    if (v < 0.0f) return 0.0f;
    if (v > 1.0f) return 1.0f;
    return v;
}

bool run_parallel(int width, int height) {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) > kParallelCellThreshold;
}

Cell nca_cell(const CellGrid& src, int x, int y, const Parameters& params, std::size_t* nan_count) {
    const auto acc = convolve(src, x, y, params);
    Cell cell{0.0f, 0.0f, 0.0f, 1.0f};
    for (int c = 0; c < kChannels; ++c) {
        const float v = params.activations[c](acc[c]);
        if (nan_count && std::isnan(v)) ++*nan_count;
        cell[c] = clamp_unit(v);
    }
    return cell;
}

std::size_t nca_step(const CellGrid& src, CellGrid& dst, const Parameters& params) {
    const int width = src.width();
    const int height = src.height();
    if (width == 0 || height == 0) return 0;
    validate(src, dst, params);

    const int tiles_x = (width + kTile - 1) / kTile;
    const int tiles_y = (height + kTile - 1) / kTile;
    auto& out = dst.raw();
    std::size_t nan_count = 0;
    std::exception_ptr failure;

    #pragma omp parallel for collapse(2) reduction(+:nan_count) if(run_parallel(width, height))
    for (int ty = 0; ty < tiles_y; ++ty) {
        for (int tx = 0; tx < tiles_x; ++tx) {
            std::size_t tile_nans = 0;
            try {
                const int y_end = std::min(height, (ty + 1) * kTile);
                const int x_end = std::min(width, (tx + 1) * kTile);
                for (int y = ty * kTile; y < y_end; ++y) {
                    for (int x = tx * kTile; x < x_end; ++x) {
                        out[static_cast<std::size_t>(y) * width + x] = nca_cell(src, x, y, params, &tile_nans);
                    }
                }
                nan_count += tile_nans;
            } catch (...) {
                // Exceptions may not leave an OpenMP region; rethrown below.
                #pragma omp critical(ncaplay_step_failure)
                {
                    if (!failure) failure = std::current_exception();
                }
            }
        }
    }

    if (failure) std::rethrow_exception(failure);
    return nan_count;
}

}
