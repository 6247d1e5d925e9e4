#pragma once
#include <array>
#include <functional>
#include <string>

namespace ncaplay {

// filter[i + 1][j + 1] weighs the neighbor at offset (dx = i, dy = j).
using Filter = std::array<std::array<float, 3>, 3>;

using Activation = std::function<float(float)>;

enum class ActivationKind {
    Identity,
    Absolute,
    Bell,
    Sigmoid,
    Tanh,
};

// Built-in activation with a single scale knob:
//   identity  s * x
//   absolute  |s * x|
//   bell      1 - 2^(-s * x^2)
//   sigmoid   1 / (1 + e^(-s * x))
//   tanh      tanh(s * x)
struct ActivationSpec {
    ActivationKind kind = ActivationKind::Identity;
    float scale = 1.0f;
};

struct Parameters {
    std::array<Filter, 3> filters;
    std::array<Activation, 3> activations;
};

Filter identity_filter();
Filter filter_from_row_major(const std::array<float, 9>& values);
std::array<float, 9> filter_to_row_major(const Filter& filter);

Activation make_activation(const ActivationSpec& spec);
std::array<ActivationSpec, 3> default_activation_specs();

// Identity filters with the default activations.
Parameters default_parameters();

const char* to_string(ActivationKind kind);
// Throws std::invalid_argument for unknown names.
ActivationKind activation_kind_from_string(const std::string& name);

}
