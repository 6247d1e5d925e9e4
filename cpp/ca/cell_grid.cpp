#include "ncaplay/cell_grid.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace ncaplay {

static int checked_dimension(int value, const char* name) {
    if (value <= 0) {
        throw std::invalid_argument(std::string("grid ") + name + " must be positive, got " + std::to_string(value));
    }
    return value;
}

static int wrap(int v, int n) {
    int r = v % n;
    return r < 0 ? r + n : r;
}

CellGrid::CellGrid(int width, int height)
    : width_(checked_dimension(width, "width")),
      height_(checked_dimension(height, "height")),
      cells_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), Cell{0.0f, 0.0f, 0.0f, 1.0f}) {}

void CellGrid::check_bounds(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) + ") outside " +
                                std::to_string(width_) + "x" + std::to_string(height_) + " grid");
    }
}

Cell& CellGrid::at(int x, int y) {
    check_bounds(x, y);
    return cells_[idx(x, y)];
}

const Cell& CellGrid::at(int x, int y) const {
    check_bounds(x, y);
    return cells_[idx(x, y)];
}

const Cell& CellGrid::get_wrapped(int x, int y) const {
    return cells_[idx(wrap(x, width_), wrap(y, height_))];
}

void CellGrid::fill(const Cell& value) {
    std::fill(cells_.begin(), cells_.end(), value);
}

bool CellGrid::operator==(const CellGrid& other) const {
    return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
}

GridPair::GridPair(int width, int height)
    : grids_{{CellGrid(width, height), CellGrid(width, height)}} {}

}
