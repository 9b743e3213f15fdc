#include <gtest/gtest.h>

#include <random>

#include "PolarityNetwork.h"

TEST(PolarityNetwork, ScoresStayStrictlyInsideUnitInterval) {
    std::mt19937 rng(1234);
    PolarityNetwork net(rng);
    std::uniform_real_distribution<float> d(-1.0f, 1.0f);
    for (int i = 0; i < 2000; ++i) {
        float s = net.score({d(rng), d(rng), d(rng), d(rng)});
        ASSERT_GT(s, 0.0f);
        ASSERT_LT(s, 1.0f);
    }
}

TEST(PolarityNetwork, SameSeedSameWeights) {
    std::mt19937 r1(77), r2(77);
    PolarityNetwork a(r1), b(r2);
    PolarityNetwork::Features f{0.1f, -0.4f, 0.0f, 0.9f};
    EXPECT_FLOAT_EQ(a.score(f), b.score(f));
    EXPECT_FLOAT_EQ(a.scoreAtSpawn(300.0f, 200.0f, 800.0f, 600.0f, 0.3f),
                    b.scoreAtSpawn(300.0f, 200.0f, 800.0f, 600.0f, 0.3f));
}

TEST(PolarityNetwork, ExplicitWeights) {
    std::array<std::array<float, PolarityNetwork::Inputs>, PolarityNetwork::Hidden> w1{};
    std::array<float, PolarityNetwork::Hidden> b1{};
    std::array<float, PolarityNetwork::Hidden> w2{};

    PolarityNetwork zero(w1, b1, w2, 0.0f);
    EXPECT_FLOAT_EQ(zero.score({0.3f, 0.2f, 0.0f, -1.0f}), 0.5f);

    // Single path: hidden 0 reads x only, output follows tanh(x)
    w1[0][0] = 1.0f;
    w2[0] = 2.0f;
    PolarityNetwork xOnly(w1, b1, w2, 0.0f);
    EXPECT_GT(xOnly.score({1.0f, 0.0f, 0.0f, 0.0f}), 0.5f);
    EXPECT_LT(xOnly.score({-1.0f, 0.0f, 0.0f, 0.0f}), 0.5f);
    // Left edge of the viewport maps to x = -1
    EXPECT_LT(xOnly.scoreAtSpawn(0.0f, 50.0f, 100.0f, 100.0f, 0.5f), 0.5f);
    EXPECT_GT(xOnly.scoreAtSpawn(100.0f, 50.0f, 100.0f, 100.0f, 0.5f), 0.5f);
}

TEST(PolarityNetwork, ZeroViewportUsesCenteredFeatures) {
    std::mt19937 rng(5);
    PolarityNetwork net(rng);
    EXPECT_FLOAT_EQ(net.scoreAtSpawn(10.0f, 10.0f, 0.0f, 0.0f, 0.5f), net.score({0.0f, 0.0f, 0.0f, 0.0f}));
}
