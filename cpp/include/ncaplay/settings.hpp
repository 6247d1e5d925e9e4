#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "ncaplay/brush.hpp"
#include "ncaplay/parameters.hpp"
#include "ncaplay/stroke_tracker.hpp"

namespace ncaplay {

struct ChannelSettings {
    Filter filter = identity_filter();
    ActivationSpec activation;
};

// Pointer path replayed as one stroke before the given step.
struct StrokeScript {
    std::uint64_t step = 0;
    std::vector<Point> points;
};

struct RunSettings {
    int steps = 100;
    bool save_frames = false;
    int frame_interval = 10;
    std::string output_dir = "frames";
    std::string log_level = "info";
};

struct Settings {
    int width = 256;
    int height = 256;
    std::array<ChannelSettings, 3> channels;
    BrushSettings brush;
    RunSettings run;
    std::vector<StrokeScript> strokes;
};

Settings default_settings();

// Keys missing from the document keep their defaults. Throws std::runtime_error on YAML
// syntax or type errors and std::invalid_argument on out-of-range values.
Settings parse_settings(const std::string& yaml);
std::string emit_settings(const Settings& settings);

Settings load_settings(const std::string& path);
void save_settings(const std::string& path, const Settings& settings);

// Falls back to defaults when the file is missing or unreadable and writes them back.
Settings load_settings_or_default(const std::string& path);

Parameters make_parameters(const Settings& settings);

}
