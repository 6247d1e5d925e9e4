#pragma once
#include <array>
#include <cstddef>
#include <string>
#include "ncaplay/cell_grid.hpp"

namespace ncaplay {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

enum class BrushShape {
    Circle,
    Square,
};

// One draw event: the brush swept from start to end. Cell (x, y) sits at point (x, y).
struct Brush {
    Point start;
    Point end;
    float radius = 0.0f;
    BrushShape shape = BrushShape::Circle;
    std::array<float, 3> color{1.0f, 1.0f, 1.0f};
};

Point closest_point_on_segment(Point start, Point end, Point pos);

bool brush_covers(const Brush& brush, Point pos);

// Overwrites every covered cell with brush.color (alpha 1). radius <= 0 paints nothing.
// Returns the number of cells written.
std::size_t draw(CellGrid& grid, const Brush& brush);

const char* to_string(BrushShape shape);
// Throws std::invalid_argument for unknown names.
BrushShape brush_shape_from_string(const std::string& name);

}
