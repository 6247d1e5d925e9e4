#include "ncaplay/simulation.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include "ncaplay/initializer.hpp"
#include "ncaplay/log.hpp"
#include "ncaplay/nca_stepper.hpp"

namespace ncaplay {

static void check_channel(int channel) {
    if (channel < 0 || channel >= kChannels) {
        throw std::invalid_argument("channel must be 0, 1 or 2, got " + std::to_string(channel));
    }
}

Simulation::Simulation(int width, int height, Parameters params)
    : grids_(width, height), params_(std::move(params)) {
    for (int c = 0; c < kChannels; ++c) {
        if (!params_.activations[c]) {
            throw std::invalid_argument("activation for channel " + std::to_string(c) + " is empty");
        }
    }
    seed(grids_.current_mut());
    logger()->info("simulation {}x{} seeded", width, height);
}

void Simulation::reset() {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    pending_.clear();
    seed(grids_.current_mut());
    steps_ = 0;
    logger()->info("simulation reset");
}

void Simulation::set_filter(int channel, const Filter& filter) {
    check_channel(channel);
    std::lock_guard<std::mutex> lock(param_mutex_);
    params_.filters[channel] = filter;
    logger()->debug("filter for channel {} updated", channel);
}

void Simulation::set_activation(int channel, Activation activation) {
    check_channel(channel);
    if (!activation) {
        throw std::invalid_argument("activation for channel " + std::to_string(channel) + " is empty");
    }
    // the replaced callable is destroyed outside the lock
    Activation previous;
    {
        std::lock_guard<std::mutex> lock(param_mutex_);
        previous = std::exchange(params_.activations[channel], std::move(activation));
    }
    logger()->debug("activation for channel {} updated", channel);
}

void Simulation::set_parameters(Parameters params) {
    for (int c = 0; c < kChannels; ++c) {
        if (!params.activations[c]) {
            throw std::invalid_argument("activation for channel " + std::to_string(c) + " is empty");
        }
    }
    {
        std::lock_guard<std::mutex> lock(param_mutex_);
        std::swap(params_, params);
    }
    logger()->debug("parameters replaced");
}

Parameters Simulation::parameters() const {
    std::lock_guard<std::mutex> lock(param_mutex_);
    return params_;
}

void Simulation::queue_stroke(const Brush& brush) {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    pending_.push_back(brush);
}

std::size_t Simulation::pending_strokes() const {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return pending_.size();
}

std::size_t Simulation::draw(const Brush& brush) {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return ncaplay::draw(grids_.current_mut(), brush);
}

StepReport Simulation::step() {
    const Parameters snapshot = parameters();

    std::lock_guard<std::mutex> lock(grid_mutex_);
    StepReport report;
    for (const auto& brush : pending_) {
        ncaplay::draw(grids_.current_mut(), brush);
    }
    report.strokes_applied = pending_.size();
    pending_.clear();

    report.nan_values = nca_step(grids_.current(), grids_.back(), snapshot);
    grids_.swap();
    report.step = ++steps_;

    if (report.nan_values > 0) {
        logger()->warn("step {}: {} activation outputs were NaN, clamped to 0", report.step, report.nan_values);
    }
    return report;
}

CellGrid Simulation::snapshot() const {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return grids_.current();
}

std::uint64_t Simulation::step_count() const {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    return steps_;
}

}
