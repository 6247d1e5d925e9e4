#pragma once
#include <optional>
#include "ncaplay/brush.hpp"

namespace ncaplay {

// Current tool state of the drawing input.
struct BrushSettings {
    float radius = 10.0f;
    BrushShape shape = BrushShape::Circle;
    std::array<float, 3> color{1.0f, 1.0f, 1.0f};
};

// Turns pointer samples into swept brush segments between consecutive active samples.
class StrokeTracker {
public:
    explicit StrokeTracker(BrushSettings settings = BrushSettings{});

    void set_settings(const BrushSettings& settings) { settings_ = settings; }
    const BrushSettings& settings() const noexcept { return settings_; }

    // Returns the segment to paint, or nothing while the pointer is up.
    std::optional<Brush> sample(Point pos, bool active);

    void release() { last_.reset(); }
    bool drawing() const noexcept { return last_.has_value(); }

private:
    BrushSettings settings_;
    std::optional<Point> last_;
};

}
