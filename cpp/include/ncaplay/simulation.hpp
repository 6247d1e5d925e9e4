#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>
#include "ncaplay/brush.hpp"
#include "ncaplay/cell_grid.hpp"
#include "ncaplay/parameters.hpp"

namespace ncaplay {

struct StepReport {
    std::uint64_t step = 0;
    std::size_t nan_values = 0;
    std::size_t strokes_applied = 0;
};

// Owns the front/back grids and the parameter store. Steps and draws are serialized on
// the current buffer; parameter edits land at the next step boundary.
class Simulation {
public:
    // Throws std::invalid_argument for non-positive dimensions.
    Simulation(int width, int height, Parameters params = default_parameters());

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    int width() const noexcept { return grids_.width(); }
    int height() const noexcept { return grids_.height(); }

    // Reseeds the current buffer and drops queued strokes.
    void reset();

    void set_filter(int channel, const Filter& filter);
    void set_activation(int channel, Activation activation);
    void set_parameters(Parameters params);
    Parameters parameters() const;

    void queue_stroke(const Brush& brush);
    std::size_t pending_strokes() const;

    // Paints into the current buffer right away. Returns the number of cells written.
    std::size_t draw(const Brush& brush);

    StepReport step();

    // Copy of the current buffer.
    CellGrid snapshot() const;

    // Access without locking; only valid while no other thread steps or draws.
    const CellGrid& current() const noexcept { return grids_.current(); }

    std::uint64_t step_count() const;

private:
    mutable std::mutex grid_mutex_;
    mutable std::mutex param_mutex_;
    GridPair grids_;
    Parameters params_;
    std::vector<Brush> pending_;
    std::uint64_t steps_ = 0;
};

}
