#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include "ncaplay/frame_io.hpp"
#include "ncaplay/log.hpp"
#include "ncaplay/metrics.hpp"
#include "ncaplay/settings.hpp"
#include "ncaplay/simulation.hpp"
#include "ncaplay/stroke_tracker.hpp"

using namespace ncaplay;

struct ParsedArgs {
    std::string config_path;
    std::string log_file;
    Settings settings;
};

static void print_usage() {
    std::cerr << "Usage: ncaplay_cli [--config=FILE] [--width=N] [--height=N] [--steps=N]\n"
              << "                   [--save-frames] [--frame-interval=N] [--output-dir=DIR]\n"
              << "                   [--log-level=LEVEL] [--log-file=FILE]\n";
}

// command line overrides are applied on top of the settings file
static ParsedArgs parse_args(int argc, char* argv[]) {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--config=") == 0) args.config_path = arg.substr(9);
    }
    args.settings = args.config_path.empty() ? default_settings() : load_settings_or_default(args.config_path);

    auto& s = args.settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--config=") == 0)
            continue;
        else if (arg.find("--width=") == 0)
            s.width = std::stoi(arg.substr(8));
        else if (arg.find("--height=") == 0)
            s.height = std::stoi(arg.substr(9));
        else if (arg.find("--steps=") == 0)
            s.run.steps = std::stoi(arg.substr(8));
        else if (arg == "--save-frames")
            s.run.save_frames = true;
        else if (arg.find("--frame-interval=") == 0)
            s.run.frame_interval = std::stoi(arg.substr(17));
        else if (arg.find("--output-dir=") == 0)
            s.run.output_dir = arg.substr(13);
        else if (arg.find("--log-level=") == 0)
            s.run.log_level = arg.substr(12);
        else if (arg.find("--log-file=") == 0)
            args.log_file = arg.substr(11);
        else
            throw std::invalid_argument("unknown argument: " + arg);
    }
    if (s.run.frame_interval <= 0) {
        throw std::invalid_argument("--frame-interval must be positive");
    }
    return args;
}

static std::string frame_name(const std::string& dir, std::uint64_t step) {
    std::ostringstream ss;
    ss << dir << "/step_" << std::setw(6) << std::setfill('0') << step << ".ppm";
    return ss.str();
}

static void log_stats(const Simulation& sim, std::uint64_t step) {
    const CellGrid grid = sim.snapshot();
    logger()->info("step {}: mean r={:.3f} g={:.3f} b={:.3f}  entropy r={:.3f} g={:.3f} b={:.3f}", step,
                   channel_mean(grid, 0), channel_mean(grid, 1), channel_mean(grid, 2),
                   channel_entropy(grid, 0), channel_entropy(grid, 1), channel_entropy(grid, 2));
}

int main(int argc, char* argv[]) {
    ParsedArgs args;
    try {
        args = parse_args(argc, argv);
        init_logging(args.settings.run.log_level, args.log_file);
    } catch (const std::exception& e) {
        std::cerr << "ncaplay_cli: " << e.what() << "\n";
        print_usage();
        return 1;
    }

    const Settings& s = args.settings;
    logger()->info("grid {}x{}, {} steps", s.width, s.height, s.run.steps);

    try {
        Simulation sim(s.width, s.height, make_parameters(s));

        if (s.run.save_frames) {
            std::filesystem::create_directories(s.run.output_dir);
        }

        std::multimap<std::uint64_t, const StrokeScript*> strokes_by_step;
        for (const auto& stroke : s.strokes) strokes_by_step.emplace(stroke.step, &stroke);

        StrokeTracker tracker(s.brush);
        for (std::uint64_t step = 0; step < static_cast<std::uint64_t>(s.run.steps); ++step) {
            auto range = strokes_by_step.equal_range(step);
            for (auto it = range.first; it != range.second; ++it) {
                for (const auto& p : it->second->points) {
                    if (auto brush = tracker.sample(p, true)) sim.queue_stroke(*brush);
                }
                tracker.release();
            }

            if (s.run.save_frames && step % static_cast<std::uint64_t>(s.run.frame_interval) == 0) {
                write_ppm(frame_name(s.run.output_dir, step), sim.snapshot());
            }

            const StepReport report = sim.step();
            if (report.strokes_applied > 0) {
                logger()->debug("step {}: applied {} brush segments", report.step, report.strokes_applied);
            }
            if (report.step % static_cast<std::uint64_t>(s.run.frame_interval) == 0) {
                log_stats(sim, report.step);
            }
        }

        if (s.run.save_frames) {
            write_ppm(frame_name(s.run.output_dir, sim.step_count()), sim.snapshot());
        }
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        return 1;
    }

    logger()->info("simulation complete");
    return 0;
}
