#include <gtest/gtest.h>

#include "rectangle_smoother.hpp"

namespace {

Rectangle box(double x, double y, double w, double h) {
    return orderCorners(std::vector<Point>{
        Point(x, y), Point(x + w, y), Point(x, y + h), Point(x + w, y + h)});
}

}  // namespace

TEST(RectangleSmoother, FirstMeasurementPassesThrough) {
    RectangleSmoother smoother;
    Rectangle in = box(100, 100, 400, 300);
    Rectangle out;

    ASSERT_TRUE(smoother.update(&in, &out));
    EXPECT_EQ(0.0, rectangleDistance(in, out));
    EXPECT_TRUE(smoother.hasAnchor());
}

TEST(RectangleSmoother, SmallJitterSnapsToAnchor) {
    RectangleSmoother smoother;
    Rectangle first = box(100, 100, 400, 300);
    Rectangle jitter = box(103, 102, 400, 300);
    Rectangle out;

    smoother.update(&first, &out);
    ASSERT_TRUE(smoother.update(&jitter, &out));
    EXPECT_EQ(0.0, rectangleDistance(first, out));
}

TEST(RectangleSmoother, ModerateMoveIsBlended) {
    RectangleSmoother smoother;
    Rectangle first = box(100, 100, 400, 300);
    Rectangle moved = box(140, 100, 400, 300);
    Rectangle out;

    smoother.update(&first, &out);
    ASSERT_TRUE(smoother.update(&moved, &out));
    EXPECT_GT(out.topLeft.x, 100.0);
    EXPECT_LT(out.topLeft.x, 140.0);
    EXPECT_NEAR(100.0, out.topLeft.y, 1e-9);
}

TEST(RectangleSmoother, LargeJumpRestartsAtNewPosition) {
    RectangleSmoother smoother;
    Rectangle first = box(100, 100, 300, 200);
    Rectangle far = box(600, 500, 300, 200);
    Rectangle out;

    smoother.update(&first, &out);
    smoother.update(&first, &out);
    ASSERT_TRUE(smoother.update(&far, &out));
    EXPECT_EQ(0.0, rectangleDistance(far, out));
    EXPECT_EQ(1u, smoother.historySize());
    EXPECT_EQ(1, smoother.confidence());
}

TEST(RectangleSmoother, AnchorSurvivesLimitedMisses) {
    SmootherConfig config;
    RectangleSmoother smoother(config);
    Rectangle in = box(100, 100, 400, 300);
    Rectangle out;

    for (int i = 0; i < config.max_confidence; i++) {
        smoother.update(&in, &out);
    }

    for (int miss = 1; miss <= config.max_anchor_misses; miss++) {
        ASSERT_TRUE(smoother.update(nullptr, &out)) << "miss " << miss;
        EXPECT_EQ(0.0, rectangleDistance(in, out));
    }
    EXPECT_FALSE(smoother.update(nullptr, &out));
    EXPECT_FALSE(smoother.hasAnchor());
}

TEST(RectangleSmoother, LowConfidenceAnchorIsNotHeld) {
    RectangleSmoother smoother;
    Rectangle in = box(100, 100, 400, 300);
    Rectangle out;

    smoother.update(&in, &out);
    EXPECT_FALSE(smoother.update(nullptr, &out));
}

TEST(RectangleSmoother, ResetForgetsEverything) {
    RectangleSmoother smoother;
    Rectangle in = box(100, 100, 400, 300);
    Rectangle out;

    smoother.update(&in, &out);
    smoother.update(&in, &out);
    smoother.reset();
    EXPECT_FALSE(smoother.hasAnchor());
    EXPECT_EQ(0u, smoother.historySize());
    EXPECT_FALSE(smoother.update(nullptr, &out));
}
