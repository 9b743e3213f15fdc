#include <gtest/gtest.h>

#include <memory>

#include "FlowParticle.h"
#include "Spark.h"

namespace {
std::shared_ptr<Spark> makeAt(uint64_t id, float x, float y) {
    Spark::Init init;
    init.id = id;
    init.x = x;
    init.y = y;
    return std::make_shared<Spark>(init);
}
}

TEST(FlowParticle, TravelsFromGiverToReceiver) {
    auto giver = makeAt(1, 100.0f, 100.0f);
    auto receiver = makeAt(2, 200.0f, 100.0f);
    FlowParticle f(giver, receiver, Rgb{255.0f, 200.0f, 0.0f});
    EXPECT_EQ(f.giver(), 1u);
    EXPECT_EQ(f.receiver(), 2u);
    EXPECT_TRUE(f.references(2));
    EXPECT_FALSE(f.references(3));

    float x = 0.0f, y = 0.0f;
    ASSERT_TRUE(f.position(x, y));
    EXPECT_FLOAT_EQ(x, 100.0f);

    EXPECT_TRUE(f.update(0.5f, 100.0f));
    EXPECT_NEAR(f.progress(), 0.5f, 1e-5f);
    EXPECT_NEAR(f.alpha(), 0.5f, 1e-5f);
    ASSERT_TRUE(f.position(x, y));
    EXPECT_NEAR(x, 150.0f, 1e-3f);
    EXPECT_NEAR(y, 100.0f, 1e-3f);
    EXPECT_NEAR(f.size(), 1.75f, 1e-5f);

    EXPECT_FALSE(f.update(0.5f, 100.0f));
    EXPECT_FLOAT_EQ(f.alpha(), 0.0f);
}

TEST(FlowParticle, RetiresWhenAnEndpointExpires) {
    auto giver = makeAt(1, 0.0f, 0.0f);
    auto receiver = makeAt(2, 50.0f, 0.0f);
    FlowParticle f(giver, receiver, Rgb{});
    receiver.reset();
    float x, y;
    EXPECT_FALSE(f.position(x, y));
    EXPECT_FALSE(f.update(0.01f, 160.0f));
}

TEST(FlowParticle, CoincidentEndpointsUseUnitDistance) {
    auto giver = makeAt(1, 10.0f, 10.0f);
    auto receiver = makeAt(2, 10.0f, 10.0f);
    FlowParticle f(giver, receiver, Rgb{});
    EXPECT_TRUE(f.update(0.001f, 160.0f));
    EXPECT_NEAR(f.progress(), 0.16f, 1e-5f);
}
