#include "ncaplay/brush.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ncaplay {

Point closest_point_on_segment(Point start, Point end, Point pos) {
    const float dx = end.x - start.x;
    const float dy = end.y - start.y;
    const float len2 = dx * dx + dy * dy;
    if (len2 == 0.0f) return start;
    float t = ((pos.x - start.x) * dx + (pos.y - start.y) * dy) / len2;
    t = std::min(1.0f, std::max(0.0f, t));
    return Point{start.x + t * dx, start.y + t * dy};
}

static bool finite_segment(const Brush& brush) {
    return std::isfinite(brush.start.x) && std::isfinite(brush.start.y) && std::isfinite(brush.end.x) &&
           std::isfinite(brush.end.y);
}

bool brush_covers(const Brush& brush, Point pos) {
    if (!(brush.radius > 0.0f) || !finite_segment(brush)) return false;
    const Point proj = closest_point_on_segment(brush.start, brush.end, pos);
    const float r = brush.radius;
    if (pos.x < proj.x - r || pos.x > proj.x + r || pos.y < proj.y - r || pos.y > proj.y + r) {
        return false;
    }
    if (brush.shape == BrushShape::Square) return true;
    // Nearest integer, ties to even; no anti-aliasing.
    const float dist = std::hypot(pos.x - proj.x, pos.y - proj.y);
    return std::nearbyint(dist) <= r;
}

std::size_t draw(CellGrid& grid, const Brush& brush) {
    if (!(brush.radius > 0.0f) || !finite_segment(brush)) return 0;

    const float r = brush.radius;
    const float lo_x = std::floor(std::min(brush.start.x, brush.end.x) - r);
    const float hi_x = std::ceil(std::max(brush.start.x, brush.end.x) + r);
    const float lo_y = std::floor(std::min(brush.start.y, brush.end.y) - r);
    const float hi_y = std::ceil(std::max(brush.start.y, brush.end.y) + r);

    // Clip each axis on its own, a stroke may leave the grid on either side.
    if (hi_x < 0.0f || hi_y < 0.0f || lo_x > grid.width() - 1 || lo_y > grid.height() - 1) return 0;
    const int x0 = static_cast<int>(std::max(0.0f, lo_x));
    const int y0 = static_cast<int>(std::max(0.0f, lo_y));
    const int x1 = static_cast<int>(std::min(static_cast<float>(grid.width() - 1), hi_x));
    const int y1 = static_cast<int>(std::min(static_cast<float>(grid.height() - 1), hi_y));

    const Cell paint{brush.color[0], brush.color[1], brush.color[2], 1.0f};
    std::size_t painted = 0;
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            if (brush_covers(brush, Point{static_cast<float>(x), static_cast<float>(y)})) {
                grid.at(x, y) = paint;
                ++painted;
            }
        }
    }
    return painted;
}

const char* to_string(BrushShape shape) {
    return shape == BrushShape::Square ? "square" : "circle";
}

BrushShape brush_shape_from_string(const std::string& name) {
    if (name == "circle") return BrushShape::Circle;
    if (name == "square") return BrushShape::Square;
    throw std::invalid_argument("unknown brush shape: " + name);
}

}
