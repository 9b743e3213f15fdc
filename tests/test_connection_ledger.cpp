#include <gtest/gtest.h>

#include <memory>
#include <unordered_set>

#include "ConnectionLedger.h"
#include "Spark.h"

namespace {
std::shared_ptr<Spark> makeSpark(uint64_t id) {
    Spark::Init init;
    init.id = id;
    return std::make_shared<Spark>(init);
}
}

TEST(PairKey, IsOrderIndependent) {
    EXPECT_EQ(PairKey::of(3, 9), PairKey::of(9, 3));
    EXPECT_EQ(PairKey::of(9, 3).lo, 3u);
    EXPECT_EQ(PairKey::of(9, 3).hi, 9u);
    EXPECT_NE(PairKey::of(1, 2), PairKey::of(1, 3));
    PairKeyHash h;
    EXPECT_EQ(h(PairKey::of(5, 11)), h(PairKey::of(11, 5)));
}

TEST(ConnectionLedger, TargetWeightIsSmoothstepOfCloseness) {
    EXPECT_FLOAT_EQ(ConnectionLedger::targetWeight(0.0f, 140.0f), 1.0f);
    EXPECT_FLOAT_EQ(ConnectionLedger::targetWeight(70.0f, 140.0f), 0.5f);
    EXPECT_FLOAT_EQ(ConnectionLedger::targetWeight(140.0f, 140.0f), 0.0f);
    EXPECT_FLOAT_EQ(ConnectionLedger::targetWeight(500.0f, 140.0f), 0.0f);
    EXPECT_GT(ConnectionLedger::targetWeight(35.0f, 140.0f), ConnectionLedger::targetWeight(105.0f, 140.0f));
}

TEST(ConnectionLedger, ApproachNeverOvershootsBelowTimeConstant) {
    const float dt = 1.0f / 60.0f;
    float up = 0.0f;
    float down = 1.0f;
    for (int i = 0; i < 600; ++i) {
        up = ConnectionLedger::approach(up, 0.7f, dt);
        down = ConnectionLedger::approach(down, 0.2f, dt);
        ASSERT_LE(up, 0.7f);
        ASSERT_GE(down, 0.2f);
    }
    EXPECT_NEAR(up, 0.7f, 1e-3f);
    EXPECT_NEAR(down, 0.2f, 1e-3f);
    EXPECT_FLOAT_EQ(ConnectionLedger::approach(0.0f, 0.5f, 0.1f), 0.3f);
}

TEST(ConnectionLedger, FadeRemovesFullStrengthWithinAQuarterSecond) {
    float s = 1.0f;
    for (int i = 0; i < 15; ++i) s = ConnectionLedger::fade(s, 1.0f / 60.0f);
    EXPECT_EQ(s, 0.0f);
    EXPECT_FLOAT_EQ(ConnectionLedger::fade(0.5f, 0.0f), 0.5f);
    EXPECT_FLOAT_EQ(ConnectionLedger::fade(1.0f, 0.25f), 0.0f);
    EXPECT_FLOAT_EQ(ConnectionLedger::fade(0.1f, 1.0f), 0.0f);
}

TEST(ConnectionLedger, ObtainCreatesOncePerPair) {
    ConnectionLedger ledger;
    auto a = makeSpark(4);
    auto b = makeSpark(2);
    bool created = false;
    Connection& c1 = ledger.obtain(PairKey::of(4, 2), a, b, &created);
    EXPECT_TRUE(created);
    EXPECT_FLOAT_EQ(c1.strength, 0.0f);
    c1.strength = 0.4f;
    // Endpoint a is always the smaller id
    EXPECT_EQ(c1.a.lock(), b);
    EXPECT_EQ(c1.b.lock(), a);

    Connection& c2 = ledger.obtain(PairKey::of(2, 4), b, a, &created);
    EXPECT_FALSE(created);
    EXPECT_FLOAT_EQ(c2.strength, 0.4f);
    EXPECT_EQ(ledger.size(), 1u);
    ASSERT_NE(ledger.find(PairKey::of(4, 2)), nullptr);
    EXPECT_EQ(ledger.find(PairKey::of(4, 3)), nullptr);
}

TEST(ConnectionLedger, EraseAndReinsertThroughTombstones) {
    ConnectionLedger ledger;
    std::vector<std::shared_ptr<Spark>> sparks;
    for (uint64_t id = 1; id <= 40; ++id) sparks.push_back(makeSpark(id));

    for (int round = 0; round < 20; ++round) {
        for (size_t i = 0; i + 1 < sparks.size(); ++i) {
            ledger.obtain(PairKey::of(sparks[i]->id(), sparks[i + 1]->id()), sparks[i], sparks[i + 1]);
        }
        ASSERT_EQ(ledger.size(), sparks.size() - 1);
        size_t removed = ledger.eraseIf([](const PairKey& k, const Connection&) { return k.lo % 2 == 0; });
        EXPECT_EQ(removed, 19u);
        ASSERT_EQ(ledger.size(), 20u);
        for (size_t i = 0; i + 1 < sparks.size(); ++i) {
            PairKey k = PairKey::of(sparks[i]->id(), sparks[i + 1]->id());
            EXPECT_EQ(ledger.find(k) != nullptr, k.lo % 2 == 1);
        }
    }

    std::unordered_set<PairKey, PairKeyHash> seen;
    ledger.forEach([&](const PairKey& k, const Connection&) { EXPECT_TRUE(seen.insert(k).second); });
    EXPECT_EQ(seen.size(), ledger.size());

    EXPECT_TRUE(ledger.erase(PairKey::of(1, 2)));
    EXPECT_FALSE(ledger.erase(PairKey::of(1, 2)));
    ledger.clear();
    EXPECT_TRUE(ledger.empty());
}

TEST(ConnectionLedger, EndpointsAreObservedNotOwned) {
    ConnectionLedger ledger;
    auto a = makeSpark(1);
    auto b = makeSpark(2);
    Connection& c = ledger.obtain(PairKey::of(1, 2), a, b);
    b.reset();
    EXPECT_TRUE(c.b.expired());
    EXPECT_FALSE(c.a.expired());
}
