/**
 * @file ColorMix.h
 * @brief Gamma-correct, pigment-style color blending used by spark energy transfers.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

/**
 * @struct Rgb
 * @brief Gamma-encoded color with continuous channels in [0,255].
 *
 * Channels are floats so the small per-frame mixing steps accumulate instead of rounding away.
 */
struct Rgb {
    float r{0.0f};
    float g{0.0f};
    float b{0.0f};

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

namespace colormix {

constexpr float Gamma = 2.2f;
constexpr float PigmentDarkening = 0.15f;

/** @brief Clamp to [0,255] and decode a gamma-encoded channel into linear light [0,1]. */
float toLinear(float channel);
/** @brief Encode linear light (clamped to [0,1]) back to a gamma channel in [0,255]. */
float toGamma(float linear);

/** @brief 1 - t(1-t)*0.15: equals 1 at both ends and dips to 0.9625 mid-blend. */
float darkeningFactor(float t);

/**
 * @brief Blend @p from toward @p to by @p t (clamped to [0,1]) in linear light with pigment darkening.
 *
 * mix(a, b, 0) returns a unchanged.
 */
Rgb mix(const Rgb& from, const Rgb& to, float t);

/** @brief Relative luminance of a gamma-encoded color, in [0,1]. */
float luminance(const Rgb& c);

}
