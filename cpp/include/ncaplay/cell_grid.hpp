#pragma once
#include <array>
#include <cstddef>
#include <vector>

namespace ncaplay {

// r, g, b, a
using Cell = std::array<float, 4>;

constexpr int kChannels = 3;

class CellGrid {
public:
    CellGrid(int width, int height);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    std::size_t size() const noexcept { return cells_.size(); }

    // Throws std::out_of_range outside [0, width) x [0, height).
    Cell& at(int x, int y);
    const Cell& at(int x, int y) const;

    // Toroidal lookup, any integer coordinate is valid.
    const Cell& get_wrapped(int x, int y) const;

    void fill(const Cell& value);

    // Row-major, row 0 is the top row.
    const std::vector<Cell>& raw() const noexcept { return cells_; }
    std::vector<Cell>& raw() noexcept { return cells_; }

    bool operator==(const CellGrid& other) const;
    bool operator!=(const CellGrid& other) const { return !(*this == other); }

private:
    int width_;
    int height_;
    std::vector<Cell> cells_;

    void check_bounds(int x, int y) const;
    std::size_t idx(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
    }
};

// Front/back pair used ping-pong by the stepper.
class GridPair {
public:
    GridPair(int width, int height);

    int width() const noexcept { return grids_[0].width(); }
    int height() const noexcept { return grids_[0].height(); }

    const CellGrid& current() const noexcept { return grids_[current_]; }
    CellGrid& current_mut() noexcept { return grids_[current_]; }

    // Write target of the next step.
    CellGrid& back() noexcept { return grids_[current_ ^ 1u]; }

    void swap() noexcept { current_ ^= 1u; }

private:
    std::array<CellGrid, 2> grids_;
    unsigned current_ = 0;
};

}
