#include "ncaplay/settings.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "ncaplay/log.hpp"

namespace ncaplay {

namespace {

const char* const kChannelNames[3] = {"red", "green", "blue"};

template <std::size_t N>
std::array<float, N> parse_floats(const YAML::Node& node, const char* what) {
    if (!node.IsSequence() || node.size() != N) {
        throw std::invalid_argument(std::string(what) + " must be a list of " + std::to_string(N) + " numbers");
    }
    std::array<float, N> out{};
    for (std::size_t i = 0; i < N; ++i) out[i] = node[i].as<float>();
    return out;
}

void parse_channel(const YAML::Node& node, ChannelSettings& channel) {
    if (node["filter"]) {
        channel.filter = filter_from_row_major(parse_floats<9>(node["filter"], "filter"));
    }
    if (const auto act = node["activation"]) {
        if (act.IsScalar()) {
            channel.activation = ActivationSpec{activation_kind_from_string(act.as<std::string>()), 1.0f};
        } else {
            if (act["kind"]) channel.activation.kind = activation_kind_from_string(act["kind"].as<std::string>());
            if (act["scale"]) channel.activation.scale = act["scale"].as<float>();
        }
    }
}

void parse_brush(const YAML::Node& node, BrushSettings& brush) {
    if (node["radius"]) brush.radius = node["radius"].as<float>();
    if (node["shape"]) brush.shape = brush_shape_from_string(node["shape"].as<std::string>());
    if (node["color"]) brush.color = parse_floats<3>(node["color"], "brush color");
}

void parse_run(const YAML::Node& node, RunSettings& run) {
    if (node["steps"]) run.steps = node["steps"].as<int>();
    if (node["save_frames"]) run.save_frames = node["save_frames"].as<bool>();
    if (node["frame_interval"]) run.frame_interval = node["frame_interval"].as<int>();
    if (node["output_dir"]) run.output_dir = node["output_dir"].as<std::string>();
    if (node["log_level"]) run.log_level = node["log_level"].as<std::string>();
}

StrokeScript parse_stroke(const YAML::Node& node) {
    StrokeScript stroke;
    if (node["step"]) stroke.step = node["step"].as<std::uint64_t>();
    const auto points = node["points"];
    if (!points || !points.IsSequence() || points.size() == 0) {
        throw std::invalid_argument("stroke needs a non-empty points list");
    }
    for (const auto& p : points) {
        const auto xy = parse_floats<2>(p, "stroke point");
        stroke.points.push_back(Point{xy[0], xy[1]});
    }
    return stroke;
}

void validate(const Settings& s) {
    if (s.width <= 0 || s.height <= 0) {
        throw std::invalid_argument("grid width and height must be positive");
    }
    if (s.run.steps < 0) {
        throw std::invalid_argument("run.steps must not be negative");
    }
    if (s.run.frame_interval <= 0) {
        throw std::invalid_argument("run.frame_interval must be positive");
    }
}

YAML::Node flow_list(const float* values, std::size_t n) {
    YAML::Node node(YAML::NodeType::Sequence);
    for (std::size_t i = 0; i < n; ++i) node.push_back(values[i]);
    node.SetStyle(YAML::EmitterStyle::Flow);
    return node;
}

}

Settings default_settings() {
    Settings s;
    const auto specs = default_activation_specs();
    for (int c = 0; c < 3; ++c) {
        s.channels[c].filter = identity_filter();
        s.channels[c].activation = specs[c];
    }
    return s;
}

Settings parse_settings(const std::string& yaml) {
    Settings s = default_settings();
    try {
        const YAML::Node root = YAML::Load(yaml);
        if (!root || root.IsNull()) return s;
        if (!root.IsMap()) {
            throw std::runtime_error("settings document must be a map");
        }

        if (const auto grid = root["grid"]) {
            if (grid["width"]) s.width = grid["width"].as<int>();
            if (grid["height"]) s.height = grid["height"].as<int>();
        }
        if (const auto channels = root["channels"]) {
            for (int c = 0; c < 3; ++c) {
                if (channels[kChannelNames[c]]) parse_channel(channels[kChannelNames[c]], s.channels[c]);
            }
        }
        if (root["brush"]) parse_brush(root["brush"], s.brush);
        if (root["run"]) parse_run(root["run"], s.run);
        if (const auto strokes = root["strokes"]) {
            for (const auto& node : strokes) s.strokes.push_back(parse_stroke(node));
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("settings parse error: ") + e.what());
    }
    validate(s);
    return s;
}

std::string emit_settings(const Settings& s) {
    YAML::Node root;
    root["grid"]["width"] = s.width;
    root["grid"]["height"] = s.height;

    for (int c = 0; c < 3; ++c) {
        const auto& ch = s.channels[c];
        YAML::Node node;
        const auto values = filter_to_row_major(ch.filter);
        node["filter"] = flow_list(values.data(), values.size());
        node["activation"]["kind"] = to_string(ch.activation.kind);
        node["activation"]["scale"] = ch.activation.scale;
        root["channels"][kChannelNames[c]] = node;
    }

    root["brush"]["radius"] = s.brush.radius;
    root["brush"]["shape"] = to_string(s.brush.shape);
    root["brush"]["color"] = flow_list(s.brush.color.data(), s.brush.color.size());

    root["run"]["steps"] = s.run.steps;
    root["run"]["save_frames"] = s.run.save_frames;
    root["run"]["frame_interval"] = s.run.frame_interval;
    root["run"]["output_dir"] = s.run.output_dir;
    root["run"]["log_level"] = s.run.log_level;

    for (const auto& stroke : s.strokes) {
        YAML::Node node;
        node["step"] = stroke.step;
        YAML::Node points(YAML::NodeType::Sequence);
        for (const auto& p : stroke.points) {
            const float xy[2] = {p.x, p.y};
            points.push_back(flow_list(xy, 2));
        }
        node["points"] = points;
        root["strokes"].push_back(node);
    }

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str()) + "\n";
}

Settings load_settings(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open settings file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_settings(buffer.str());
}

void save_settings(const std::string& path, const Settings& settings) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open settings file " + path + " for writing");
    }
    out << emit_settings(settings);
    if (!out) {
        throw std::runtime_error("failed writing settings file " + path);
    }
    logger()->info("settings written to {}", path);
}

Settings load_settings_or_default(const std::string& path) {
    try {
        Settings s = load_settings(path);
        logger()->info("settings read from {}", path);
        return s;
    } catch (const std::exception& e) {
        logger()->info("{}; using default settings", e.what());
    }
    Settings s = default_settings();
    try {
        save_settings(path, s);
    } catch (const std::runtime_error& e) {
        logger()->warn("could not write default settings: {}", e.what());
    }
    return s;
}

Parameters make_parameters(const Settings& settings) {
    Parameters p;
    for (int c = 0; c < 3; ++c) {
        p.filters[c] = settings.channels[c].filter;
        p.activations[c] = make_activation(settings.channels[c].activation);
    }
    return p;
}

}
