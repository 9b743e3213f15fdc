#include <gtest/gtest.h>

#include <string>

#include "GlowRenderer.h"

namespace {
SparkSystem::FrameSnapshot blankSnapshot() {
    SparkSystem::FrameSnapshot snap;
    snap.width = 100.0f;
    snap.height = 100.0f;
    return snap;
}
}

TEST(GlowField, GlyphRamp) {
    EXPECT_EQ(GlowField::glyphFor(0.0f), ' ');
    EXPECT_EQ(GlowField::glyphFor(-3.0f), ' ');
    EXPECT_EQ(GlowField::glyphFor(1.0f), '#');
    EXPECT_EQ(GlowField::glyphFor(7.0f), '#');
    EXPECT_NE(GlowField::glyphFor(0.5f), ' ');
}

TEST(GlowField, ColorPairsFollowHue) {
    EXPECT_EQ(GlowField::colorPairFor(Rgb{255.0f, 10.0f, 0.0f}), 2);
    EXPECT_EQ(GlowField::colorPairFor(Rgb{0.0f, 0.0f, 200.0f}), 5);
    EXPECT_EQ(GlowField::colorPairFor(Rgb{250.0f, 240.0f, 20.0f}), 4);
    EXPECT_EQ(GlowField::colorPairFor(Rgb{255.0f, 255.0f, 255.0f}), 8);
    EXPECT_EQ(GlowField::colorPairFor(Rgb{0.0f, 0.0f, 0.0f}), 8);
}

TEST(GlowField, EmptySnapshotIsBlank) {
    GlowField field;
    field.rasterize(blankSnapshot(), 12, 6);
    EXPECT_EQ(field.columns(), 12);
    EXPECT_EQ(field.rows(), 6);
    for (int y = 0; y < 6; ++y) {
        for (int x = 0; x < 12; ++x) {
            EXPECT_EQ(field.at(x, y).glyph, ' ');
            EXPECT_FLOAT_EQ(field.intensityAt(x, y), 0.0f);
        }
    }
    SparkSystem::FrameSnapshot degenerate;
    field.rasterize(degenerate, 4, 4);
    EXPECT_EQ(field.at(0, 0).glyph, ' ');
}

TEST(GlowField, SparkCoreFlowAndLine) {
    SparkSystem::FrameSnapshot snap = blankSnapshot();
    SparkSystem::SparkView spark{55.0f, 55.0f, 2.0f, 20.0f, 1.0f, 0.0f, Rgb{255.0f, 20.0f, 0.0f}, 1};
    snap.sparks.push_back(spark);
    SparkSystem::FlowView flow{15.0f, 85.0f, Rgb{255.0f, 200.0f, 0.0f}, 1.0f, 2.5f};
    snap.flows.push_back(flow);
    SparkSystem::ConnectionView line{5.0f, 25.0f, 95.0f, 25.0f, Rgb{0.0f, 0.0f, 255.0f}, Rgb{0.0f, 0.0f, 255.0f},
                                     1.0f, 1.0f, 0.35f};
    snap.connections.push_back(line);

    GlowField field;
    field.rasterize(snap, 10, 10);

    const GlowField::Cell& core = field.at(5, 5);
    EXPECT_EQ(core.glyph, '@');
    EXPECT_TRUE(core.bold);
    EXPECT_EQ(core.colorPair, 2);
    // Halo lights the neighbors more dimly than the core
    EXPECT_GT(field.intensityAt(4, 5), 0.0f);
    EXPECT_LT(field.intensityAt(4, 5), field.intensityAt(5, 5));

    EXPECT_EQ(field.at(1, 8).glyph, '*');
    EXPECT_EQ(field.at(3, 2).glyph, '-');
    EXPECT_EQ(field.at(3, 2).colorPair, 5);
    EXPECT_EQ(field.at(0, 9).glyph, ' ');
}

TEST(GlowRenderer, StatusText) {
    SparkSystem::FrameSnapshot snap = blankSnapshot();
    snap.sparks.push_back(SparkSystem::SparkView{1.0f, 1.0f, 1.0f, 6.0f, 1.0f, 0.0f, Rgb{}, 1});
    snap.targetPopulation = 12;
    snap.interactions = 3;
    GlowRenderer::Status status;
    status.fps = 59.6;
    status.paused = true;
    status.lowPower = true;
    const std::string text = GlowRenderer::statusText(snap, status);
    EXPECT_NE(text.find("Sparks: 1/12"), std::string::npos);
    EXPECT_NE(text.find("Pairs: 3"), std::string::npos);
    EXPECT_NE(text.find("60 fps"), std::string::npos);
    EXPECT_NE(text.find("low-power"), std::string::npos);
    EXPECT_NE(text.find("PAUSED"), std::string::npos);
}

TEST(GlowRenderer, NullWindowIsANoOp) {
    GlowRenderer renderer;
    renderer.draw(blankSnapshot());
    renderer.drawStatusLine(blankSnapshot(), GlowRenderer::Status{});
    SUCCEED();
}
