#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include "ncaplay/brush.hpp"
#include "ncaplay/initializer.hpp"
#include "ncaplay/metrics.hpp"
#include "ncaplay/nca_stepper.hpp"
#include "ncaplay/simulation.hpp"

namespace py = pybind11;
using namespace ncaplay;

using FloatArray = py::array_t<float, py::array::c_style | py::array::forcecast>;

static Filter filter_from_array(FloatArray arr) {
    auto buf = arr.request();
    if (buf.ndim != 2 || buf.shape[0] != 3 || buf.shape[1] != 3) {
        throw std::invalid_argument("filter must be a 3x3 array");
    }
    const float* ptr = static_cast<const float*>(buf.ptr);
    std::array<float, 9> values{};
    std::copy(ptr, ptr + 9, values.begin());
    return filter_from_row_major(values);
}

static py::array_t<float> grid_to_array(const CellGrid& grid) {
    py::array_t<float> out({static_cast<py::ssize_t>(grid.height()), static_cast<py::ssize_t>(grid.width()),
                            static_cast<py::ssize_t>(4)});
    std::memcpy(out.mutable_data(), grid.raw().data(), grid.size() * sizeof(Cell));
    return out;
}

static CellGrid grid_from_array(FloatArray state) {
    auto buf = state.request();
    if (buf.ndim != 3 || buf.shape[2] != 4) {
        throw std::invalid_argument("state must have shape (height, width, 4)");
    }
    CellGrid grid(static_cast<int>(buf.shape[1]), static_cast<int>(buf.shape[0]));
    std::memcpy(grid.raw().data(), buf.ptr, grid.size() * sizeof(Cell));
    return grid;
}

static Parameters parameters_from(const std::vector<FloatArray>& filters, const std::vector<ActivationSpec>& specs) {
    if (filters.size() != 3 || specs.size() != 3) {
        throw std::invalid_argument("expected three filters and three activation specs");
    }
    Parameters p;
    for (int c = 0; c < 3; ++c) {
        p.filters[c] = filter_from_array(filters[c]);
        p.activations[c] = make_activation(specs[c]);
    }
    return p;
}

static py::array_t<float> py_nca_step(FloatArray state, const std::vector<FloatArray>& filters,
                                      const std::vector<ActivationSpec>& specs) {
    const CellGrid src = grid_from_array(state);
    const Parameters params = parameters_from(filters, specs);
    CellGrid dst(src.width(), src.height());
    {
        py::gil_scoped_release release;
        nca_step(src, dst, params);
    }
    return grid_to_array(dst);
}

static py::array_t<float> py_seed(int width, int height) {
    CellGrid grid(width, height);
    seed(grid);
    return grid_to_array(grid);
}

PYBIND11_MODULE(ncaplay_native, m) {
    py::enum_<ActivationKind>(m, "ActivationKind")
        .value("IDENTITY", ActivationKind::Identity)
        .value("ABSOLUTE", ActivationKind::Absolute)
        .value("BELL", ActivationKind::Bell)
        .value("SIGMOID", ActivationKind::Sigmoid)
        .value("TANH", ActivationKind::Tanh);

    py::class_<ActivationSpec>(m, "ActivationSpec")
        .def(py::init<>())
        .def(py::init([](ActivationKind kind, float scale) { return ActivationSpec{kind, scale}; }),
             py::arg("kind"), py::arg("scale") = 1.0f)
        .def_readwrite("kind", &ActivationSpec::kind)
        .def_readwrite("scale", &ActivationSpec::scale)
        .def("__call__", [](const ActivationSpec& spec, float x) { return make_activation(spec)(x); });

    py::enum_<BrushShape>(m, "BrushShape")
        .value("CIRCLE", BrushShape::Circle)
        .value("SQUARE", BrushShape::Square);

    py::class_<Brush>(m, "Brush")
        .def(py::init([](std::pair<float, float> start, std::pair<float, float> end, float radius,
                         BrushShape shape, std::array<float, 3> color) {
                 Brush b;
                 b.start = Point{start.first, start.second};
                 b.end = Point{end.first, end.second};
                 b.radius = radius;
                 b.shape = shape;
                 b.color = color;
                 return b;
             }),
             py::arg("start"), py::arg("end"), py::arg("radius"), py::arg("shape") = BrushShape::Circle,
             py::arg("color") = std::array<float, 3>{1.0f, 1.0f, 1.0f})
        .def_readwrite("radius", &Brush::radius)
        .def_readwrite("shape", &Brush::shape)
        .def_readwrite("color", &Brush::color);

    py::class_<StepReport>(m, "StepReport")
        .def_readonly("step", &StepReport::step)
        .def_readonly("nan_values", &StepReport::nan_values)
        .def_readonly("strokes_applied", &StepReport::strokes_applied);

    py::class_<Simulation>(m, "Simulation")
        .def(py::init([](int width, int height) { return new Simulation(width, height); }),
             py::arg("width"), py::arg("height"))
        .def_property_readonly("width", &Simulation::width)
        .def_property_readonly("height", &Simulation::height)
        // Takes the grid lock, which a stepping thread may hold while calling back into Python.
        .def_property_readonly("step_count",
                               py::cpp_function(&Simulation::step_count, py::call_guard<py::gil_scoped_release>()))
        .def("step", &Simulation::step, py::call_guard<py::gil_scoped_release>())
        .def("reset", &Simulation::reset, py::call_guard<py::gil_scoped_release>())
        .def("draw", &Simulation::draw, py::call_guard<py::gil_scoped_release>())
        .def("queue_stroke", &Simulation::queue_stroke, py::call_guard<py::gil_scoped_release>())
        .def("set_filter", [](Simulation& sim, int channel, FloatArray filter) {
            const Filter f = filter_from_array(filter);
            py::gil_scoped_release release;
            sim.set_filter(channel, f);
        })
        .def("set_activation", [](Simulation& sim, int channel, const ActivationSpec& spec) {
            Activation fn = make_activation(spec);
            py::gil_scoped_release release;
            sim.set_activation(channel, std::move(fn));
        })
        // Python callables reacquire the GIL on every call.
        .def("set_activation", [](Simulation& sim, int channel, std::function<float(float)> fn) {
            py::gil_scoped_release release;
            sim.set_activation(channel, std::move(fn));
        })
        .def("state", [](const Simulation& sim) {
            CellGrid grid = [&] {
                py::gil_scoped_release release;
                return sim.snapshot();
            }();
            return grid_to_array(grid);
        });

    m.def("nca_step", &py_nca_step, "Step an (H, W, 4) state once", py::arg("state"), py::arg("filters"),
          py::arg("activations"));
    m.def("seed", &py_seed, "Deterministic initial state", py::arg("width"), py::arg("height"));
    m.def("entropy", &entropy, "Compute simple entropy");
}
