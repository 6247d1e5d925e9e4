#include "ncaplay/stroke_tracker.hpp"

namespace ncaplay {

StrokeTracker::StrokeTracker(BrushSettings settings) : settings_(settings) {}

std::optional<Brush> StrokeTracker::sample(Point pos, bool active) {
    if (!active) {
        last_.reset();
        return std::nullopt;
    }
    // first sample of a stroke is a dot
    const Point start = last_.value_or(pos);
    last_ = pos;

    Brush brush;
    brush.start = start;
    brush.end = pos;
    brush.radius = settings_.radius;
    brush.shape = settings_.shape;
    brush.color = settings_.color;
    return brush;
}

}
