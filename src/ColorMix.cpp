/**
 * @file ColorMix.cpp
 * @brief Gamma-space color blending with pigment darkening.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ColorMix.h"

#include <algorithm>
#include <cmath>

namespace colormix {

float toLinear(float channel) {
    float c = std::max(0.0f, std::min(255.0f, channel)) / 255.0f;
    return std::pow(c, Gamma);
}

float toGamma(float linear) {
    float l = std::max(0.0f, std::min(1.0f, linear));
    return 255.0f * std::pow(l, 1.0f / Gamma);
}

float darkeningFactor(float t) {
    return 1.0f - t * (1.0f - t) * PigmentDarkening;
}

Rgb mix(const Rgb& from, const Rgb& to, float t) {
    if (!(t > 0.0f)) return from; // also catches NaN
    if (t > 1.0f) t = 1.0f;
    const float dark = darkeningFactor(t);
    auto channel = [&](float a, float b) {
        float la = toLinear(a);
        float lb = toLinear(b);
        return toGamma((la + (lb - la) * t) * dark);
    };
    return Rgb{channel(from.r, to.r), channel(from.g, to.g), channel(from.b, to.b)};
}

float luminance(const Rgb& c) {
    return 0.2126f * toLinear(c.r) + 0.7152f * toLinear(c.g) + 0.0722f * toLinear(c.b);
}

}
