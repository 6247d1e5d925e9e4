#include "ncaplay/parameters.hpp"
#include <cmath>
#include <stdexcept>

namespace ncaplay {

Filter identity_filter() {
    Filter f{};
    f[1][1] = 1.0f;
    return f;
}

Filter filter_from_row_major(const std::array<float, 9>& values) {
    Filter f{};
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            f[i][j] = values[i * 3 + j];
        }
    }
    return f;
}

std::array<float, 9> filter_to_row_major(const Filter& filter) {
    std::array<float, 9> out{};
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            out[i * 3 + j] = filter[i][j];
        }
    }
    return out;
}

Activation make_activation(const ActivationSpec& spec) {
    const float s = spec.scale;
    switch (spec.kind) {
    case ActivationKind::Identity:
        return [s](float x) { return s * x; };
    case ActivationKind::Absolute:
        return [s](float x) { return std::fabs(s * x); };
    case ActivationKind::Bell:
        return [s](float x) { return 1.0f - std::exp2(-s * x * x); };
    case ActivationKind::Sigmoid:
        return [s](float x) { return 1.0f / (1.0f + std::exp(-s * x)); };
    case ActivationKind::Tanh:
        return [s](float x) { return std::tanh(s * x); };
    }
    throw std::invalid_argument("unknown activation kind");
}

std::array<ActivationSpec, 3> default_activation_specs() {
    return {ActivationSpec{ActivationKind::Bell, 0.6f},
            ActivationSpec{ActivationKind::Absolute, 1.0f},
            ActivationSpec{ActivationKind::Absolute, 1.2f}};
}

Parameters default_parameters() {
    Parameters p;
    const auto specs = default_activation_specs();
    for (int c = 0; c < 3; ++c) {
        p.filters[c] = identity_filter();
        p.activations[c] = make_activation(specs[c]);
    }
    return p;
}

const char* to_string(ActivationKind kind) {
    switch (kind) {
    case ActivationKind::Identity: return "identity";
    case ActivationKind::Absolute: return "absolute";
    case ActivationKind::Bell: return "bell";
    case ActivationKind::Sigmoid: return "sigmoid";
    case ActivationKind::Tanh: return "tanh";
    }
    return "unknown";
}

ActivationKind activation_kind_from_string(const std::string& name) {
    if (name == "identity") return ActivationKind::Identity;
    if (name == "absolute" || name == "abs") return ActivationKind::Absolute;
    if (name == "bell") return ActivationKind::Bell;
    if (name == "sigmoid") return ActivationKind::Sigmoid;
    if (name == "tanh") return ActivationKind::Tanh;
    throw std::invalid_argument("unknown activation kind: " + name);
}

}
