#include <gtest/gtest.h>

#include "ColorMix.h"

TEST(ColorMix, ZeroStepReturnsSourceExactly) {
    const Rgb a{231.7f, 12.25f, 99.0f};
    const Rgb b{0.0f, 255.0f, 10.0f};
    EXPECT_EQ(colormix::mix(a, b, 0.0f), a);
    EXPECT_EQ(colormix::mix(a, b, -0.5f), a);
}

TEST(ColorMix, DarkeningFactorEndpointsAndMidpoint) {
    EXPECT_FLOAT_EQ(colormix::darkeningFactor(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(colormix::darkeningFactor(1.0f), 1.0f);
    EXPECT_FLOAT_EQ(colormix::darkeningFactor(0.5f), 0.9625f);
}

TEST(ColorMix, FullStepReachesTarget) {
    const Rgb a{255.0f, 0.0f, 0.0f};
    const Rgb b{10.0f, 200.0f, 40.0f};
    Rgb m = colormix::mix(a, b, 1.0f);
    EXPECT_NEAR(m.r, b.r, 0.05f);
    EXPECT_NEAR(m.g, b.g, 0.05f);
    EXPECT_NEAR(m.b, b.b, 0.05f);
    // t above 1 is clamped
    Rgb over = colormix::mix(a, b, 3.0f);
    EXPECT_NEAR(over.g, b.g, 0.05f);
}

TEST(ColorMix, MidBlendIsGammaCorrectAndDarkened) {
    const Rgb black{0.0f, 0.0f, 0.0f};
    const Rgb white{255.0f, 255.0f, 255.0f};
    Rgb m = colormix::mix(black, white, 0.5f);
    // Linear midpoint 0.5 darkened by 0.9625, re-encoded with gamma 2.2
    const float expected = colormix::toGamma(0.5f * 0.9625f);
    EXPECT_NEAR(m.r, expected, 1e-3f);
    EXPECT_GT(m.r, 127.5f); // gamma-correct blends are brighter than a naive sRGB average
    EXPECT_FLOAT_EQ(m.r, m.g);
    EXPECT_FLOAT_EQ(m.g, m.b);
}

TEST(ColorMix, GammaConversionsClampAndInvert) {
    EXPECT_FLOAT_EQ(colormix::toLinear(-20.0f), 0.0f);
    EXPECT_FLOAT_EQ(colormix::toLinear(400.0f), 1.0f);
    EXPECT_FLOAT_EQ(colormix::toGamma(2.0f), 255.0f);
    EXPECT_NEAR(colormix::toGamma(colormix::toLinear(100.0f)), 100.0f, 1e-2f);
}

TEST(ColorMix, Luminance) {
    EXPECT_FLOAT_EQ(colormix::luminance(Rgb{0.0f, 0.0f, 0.0f}), 0.0f);
    EXPECT_NEAR(colormix::luminance(Rgb{255.0f, 255.0f, 255.0f}), 1.0f, 1e-4f);
    EXPECT_GT(colormix::luminance(Rgb{0.0f, 255.0f, 0.0f}), colormix::luminance(Rgb{0.0f, 0.0f, 255.0f}));
}
