#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <vector>

#include "Spark.h"
#include "SpatialGrid.h"

namespace {
std::shared_ptr<Spark> makeAt(uint64_t id, float x, float y) {
    Spark::Init init;
    init.id = id;
    init.x = x;
    init.y = y;
    return std::make_shared<Spark>(init);
}

bool contains(const std::vector<Spark*>& v, const Spark* s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}
}

TEST(SpatialGrid, DimensionsFollowCellSize) {
    SpatialGrid g(100.0f, 950.0f, 420.0f);
    EXPECT_EQ(g.columns(), 10);
    EXPECT_EQ(g.rows(), 5);
    g.resize(0.0f, 0.0f);
    EXPECT_EQ(g.columns(), 1);
    EXPECT_EQ(g.rows(), 1);
}

TEST(SpatialGrid, NeighborsComeFromTheSurroundingBlockOnly) {
    SpatialGrid g(100.0f, 1000.0f, 1000.0f);
    auto center = makeAt(1, 450.0f, 450.0f);
    auto adjacent = makeAt(2, 560.0f, 380.0f);   // one cell right, one up
    auto sameCell = makeAt(3, 410.0f, 490.0f);
    auto far = makeAt(4, 800.0f, 800.0f);
    for (auto& s : {center, adjacent, sameCell, far}) g.insert(*s);
    EXPECT_EQ(g.size(), 4u);

    std::vector<Spark*> out;
    g.neighborsOf(*center, out);
    EXPECT_TRUE(contains(out, adjacent.get()));
    EXPECT_TRUE(contains(out, sameCell.get()));
    EXPECT_FALSE(contains(out, far.get()));
    EXPECT_FALSE(contains(out, center.get()));
}

TEST(SpatialGrid, ClearEmptiesBuckets) {
    SpatialGrid g(50.0f, 200.0f, 200.0f);
    auto a = makeAt(1, 10.0f, 10.0f);
    auto b = makeAt(2, 20.0f, 20.0f);
    g.insert(*a);
    g.insert(*b);
    g.clear();
    EXPECT_EQ(g.size(), 0u);
    std::vector<Spark*> out;
    g.neighborsOf(*a, out);
    EXPECT_TRUE(out.empty());
}

TEST(SpatialGrid, OutOfRangePointsClampToEdgeCells) {
    SpatialGrid g(100.0f, 300.0f, 300.0f);
    int cx = -1, cy = -1;
    g.cellOf(-50.0f, 1000.0f, cx, cy);
    EXPECT_EQ(cx, 0);
    EXPECT_EQ(cy, 2);
    g.cellOf(299.0f, 0.0f, cx, cy);
    EXPECT_EQ(cx, 2);
    EXPECT_EQ(cy, 0);
}
