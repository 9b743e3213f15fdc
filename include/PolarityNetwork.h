/**
 * @file PolarityNetwork.h
 * @brief Fixed random feed-forward scorer assigning each spark its polarity at spawn.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <array>
#include <random>

/**
 * @class PolarityNetwork
 * @brief 4 inputs -> 6 tanh hidden units -> 1 sigmoid output. Weights are drawn once and never change.
 *
 * Inputs are expected in [-1,1]: normalized x, normalized y, normalized age (0 at spawn) and the
 * normalized seed feature. Output is strictly inside (0,1).
 */
class PolarityNetwork {
public:
    static constexpr int Inputs = 4;
    static constexpr int Hidden = 6;

    using Features = std::array<float, Inputs>;

    /** @brief Draw weights from a Glorot-uniform distribution using @p rng. */
    explicit PolarityNetwork(std::mt19937& rng);
    /** @brief Build from explicit weights (row-major hidden weights, one row per hidden unit). */
    PolarityNetwork(const std::array<std::array<float, Inputs>, Hidden>& w1,
                    const std::array<float, Hidden>& b1,
                    const std::array<float, Hidden>& w2,
                    float b2);

    /** @brief Forward pass. Pure given the fixed weights. */
    float score(const Features& in) const;

    /** @brief Convenience: build features from a position inside a width x height viewport and a seed in [0,1]. */
    float scoreAtSpawn(float x, float y, float width, float height, float seed) const;

private:
    std::array<std::array<float, Inputs>, Hidden> w1{}; /**< hidden weights */
    std::array<float, Hidden> b1{};                     /**< hidden biases */
    std::array<float, Hidden> w2{};                     /**< output weights */
    float b2{0.0f};                                     /**< output bias */
};
