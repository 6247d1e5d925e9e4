#include <catch2/catch.hpp>
#include "ncaplay/stroke_tracker.hpp"

using namespace ncaplay;

TEST_CASE("StrokeTracker", "[StrokeTracker]") {
    BrushSettings settings;
    settings.radius = 3.0f;
    settings.shape = BrushShape::Square;
    settings.color = {0.1f, 0.2f, 0.3f};
    StrokeTracker tracker(settings);

    SECTION("Pointer Up Emits Nothing") {
        REQUIRE_FALSE(tracker.sample(Point{4.0f, 4.0f}, false).has_value());
        REQUIRE_FALSE(tracker.drawing());
    }

    SECTION("First Sample Is A Dot") {
        auto b = tracker.sample(Point{4.0f, 5.0f}, true);
        REQUIRE(b.has_value());
        REQUIRE(b->start.x == 4.0f);
        REQUIRE(b->start.y == 5.0f);
        REQUIRE(b->end.x == 4.0f);
        REQUIRE(b->end.y == 5.0f);
        REQUIRE(b->radius == 3.0f);
        REQUIRE(b->shape == BrushShape::Square);
        REQUIRE(b->color[2] == 0.3f);
    }

    SECTION("Consecutive Samples Form Segments") {
        tracker.sample(Point{1.0f, 1.0f}, true);
        auto b = tracker.sample(Point{6.0f, 2.0f}, true);
        REQUIRE(b->start.x == 1.0f);
        REQUIRE(b->end.x == 6.0f);
        b = tracker.sample(Point{9.0f, 9.0f}, true);
        REQUIRE(b->start.x == 6.0f);
        REQUIRE(b->start.y == 2.0f);
        REQUIRE(b->end.y == 9.0f);
    }

    SECTION("Release Breaks The Stroke") {
        tracker.sample(Point{1.0f, 1.0f}, true);
        REQUIRE(tracker.drawing());
        REQUIRE_FALSE(tracker.sample(Point{5.0f, 5.0f}, false).has_value());
        auto b = tracker.sample(Point{8.0f, 8.0f}, true);
        REQUIRE(b->start.x == 8.0f);
        REQUIRE(b->end.x == 8.0f);
    }

    SECTION("Settings Change Applies To Next Segment") {
        tracker.sample(Point{1.0f, 1.0f}, true);
        BrushSettings smaller = settings;
        smaller.radius = 0.0f;
        tracker.set_settings(smaller);
        auto b = tracker.sample(Point{2.0f, 1.0f}, true);
        REQUIRE(b->radius == 0.0f);
        REQUIRE(b->start.x == 1.0f);
    }
}
