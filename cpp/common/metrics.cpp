#include "ncaplay/metrics.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace ncaplay {

static void check_channel(int channel) {
    if (channel < 0 || channel >= kChannels) {
        throw std::invalid_argument("channel must be 0, 1 or 2, got " + std::to_string(channel));
    }
}

float entropy(const std::vector<float>& data) {
    if (data.empty()) return 0.0f;
    std::unordered_map<int, int> bins;
    for (float v : data) {
        // 1.0 shares the top bin
        int bucket = static_cast<int>(v * 10.0f);
        if (bucket > 9) bucket = 9;
        bins[bucket]++;
    }
    float total = static_cast<float>(data.size());
    float h = 0.0f;
    for (auto& kv : bins) {
        float p = kv.second / total;
        h -= p * std::log2(p + 1e-9f);
    }
    return h;
}

float channel_entropy(const CellGrid& grid, int channel) {
    check_channel(channel);
    std::vector<float> values;
    values.reserve(grid.size());
    for (const auto& cell : grid.raw()) values.push_back(cell[channel]);
    return entropy(values);
}

float channel_mean(const CellGrid& grid, int channel) {
    check_channel(channel);
    double sum = 0.0;
    for (const auto& cell : grid.raw()) sum += cell[channel];
    return static_cast<float>(sum / static_cast<double>(grid.size()));
}

}
