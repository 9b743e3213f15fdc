/**
 * @file PolarityNetwork.cpp
 * @brief Glorot-uniform weight draw and forward pass of the polarity scorer.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PolarityNetwork.h"

#include <algorithm>
#include <cmath>

namespace {
inline float toSigned(float v01) { return std::max(-1.0f, std::min(1.0f, v01 * 2.0f - 1.0f)); }
}

PolarityNetwork::PolarityNetwork(std::mt19937& rng) {
    // Variance-scaled uniform: limit = sqrt(6 / (fanIn + fanOut)) per layer.
    const float lim1 = std::sqrt(6.0f / (float)(Inputs + Hidden));
    const float lim2 = std::sqrt(6.0f / (float)(Hidden + 1));
    std::uniform_real_distribution<float> d1(-lim1, lim1);
    std::uniform_real_distribution<float> d2(-lim2, lim2);
    for (auto& row : w1) for (auto& v : row) v = d1(rng);
    for (auto& v : b1) v = d1(rng);
    for (auto& v : w2) v = d2(rng);
    b2 = d2(rng);
}

PolarityNetwork::PolarityNetwork(const std::array<std::array<float, Inputs>, Hidden>& w1_,
                                 const std::array<float, Hidden>& b1_,
                                 const std::array<float, Hidden>& w2_,
                                 float b2_)
    : w1(w1_), b1(b1_), w2(w2_), b2(b2_) {}

float PolarityNetwork::score(const Features& in) const {
    float out = b2;
    for (int j = 0; j < Hidden; ++j) {
        float a = b1[j];
        for (int i = 0; i < Inputs; ++i) a += w1[j][i] * in[i];
        out += w2[j] * std::tanh(a);
    }
    // |out| is bounded by |b2| + sum|w2|, so the sigmoid never saturates to exactly 0 or 1.
    return 1.0f / (1.0f + std::exp(-out));
}

float PolarityNetwork::scoreAtSpawn(float x, float y, float width, float height, float seed) const {
    float nx = width > 0.0f ? toSigned(x / width) : 0.0f;
    float ny = height > 0.0f ? toSigned(y / height) : 0.0f;
    return score({nx, ny, 0.0f, toSigned(seed)});
}
