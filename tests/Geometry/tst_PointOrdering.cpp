#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <vector>

#include "geometry.hpp"

namespace {

double sum(const Point& p) { return p.x + p.y; }
double diff(const Point& p) { return p.x - p.y; }

void expectOrderingInvariant(const std::vector<Point>& pts) {
    Rectangle r = orderCorners(pts);

    double minSum = sum(pts[0]), maxSum = sum(pts[0]);
    double minDiff = diff(pts[0]), maxDiff = diff(pts[0]);
    for (const auto& p : pts) {
        minSum = std::min(minSum, sum(p));
        maxSum = std::max(maxSum, sum(p));
        minDiff = std::min(minDiff, diff(p));
        maxDiff = std::max(maxDiff, diff(p));
    }

    EXPECT_DOUBLE_EQ(minSum, sum(r.topLeft));
    EXPECT_DOUBLE_EQ(maxSum, sum(r.bottomRight));
    EXPECT_DOUBLE_EQ(minDiff, diff(r.topRight));
    EXPECT_DOUBLE_EQ(maxDiff, diff(r.bottomLeft));
}

}  // namespace

TEST(PointOrdering, ExtremesOfSumAndDifference) {
    expectOrderingInvariant({Point(10, 10), Point(300, 20), Point(20, 400), Point(310, 390)});
    expectOrderingInvariant({Point(150, 0), Point(300, 150), Point(150, 300), Point(0, 150)});
    expectOrderingInvariant({Point(40, 80), Point(500, 10), Point(60, 470), Point(620, 450)});
}

TEST(PointOrdering, IndependentOfInputPermutation) {
    std::vector<Point> pts = {Point(12, 30), Point(410, 22), Point(35, 515), Point(402, 530)};
    Rectangle expected = orderCorners(pts);

    std::sort(pts.begin(), pts.end(), [](const Point& a, const Point& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });
    do {
        Rectangle r = orderCorners(pts);
        EXPECT_EQ(expected.topLeft, r.topLeft);
        EXPECT_EQ(expected.topRight, r.topRight);
        EXPECT_EQ(expected.bottomLeft, r.bottomLeft);
        EXPECT_EQ(expected.bottomRight, r.bottomRight);
    } while (std::next_permutation(pts.begin(), pts.end(), [](const Point& a, const Point& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    }));
}

TEST(PointOrdering, RectangleOverloadReordersLabels) {
    Rectangle scrambled(Point(300, 400), Point(0, 0), Point(300, 0), Point(0, 400));
    Rectangle r = orderCorners(scrambled);
    EXPECT_EQ(Point(0, 0), r.topLeft);
    EXPECT_EQ(Point(300, 400), r.bottomRight);
    EXPECT_DOUBLE_EQ(300.0 * 400.0, r.area());
}

TEST(PointOrdering, NormalizeWindingRestoresGeometricLabels) {
    Rectangle ordered = orderCorners(std::vector<Point>{
        Point(0, 0), Point(300, 0), Point(0, 400), Point(300, 400)});
    EXPECT_LT(ordered.signedArea(), 0.0);

    Rectangle upright = normalizeWinding(ordered);
    EXPECT_EQ(Point(300, 0), upright.topRight);
    EXPECT_EQ(Point(0, 400), upright.bottomLeft);
    EXPECT_GT(upright.signedArea(), 0.0);

    // Already geometric: unchanged
    Rectangle again = normalizeWinding(upright);
    EXPECT_EQ(upright.topRight, again.topRight);
    EXPECT_EQ(upright.bottomLeft, again.bottomLeft);
}

TEST(RectangleGeometry, AreaAndEdges) {
    Rectangle r(Point(0, 0), Point(200, 0), Point(0, 100), Point(200, 100));
    EXPECT_DOUBLE_EQ(20000.0, r.area());
    EXPECT_GT(r.signedArea(), 0.0);
    EXPECT_DOUBLE_EQ(200.0, r.topEdge());
    EXPECT_DOUBLE_EQ(100.0, r.leftEdge());
    EXPECT_DOUBLE_EQ(600.0, r.perimeter());
}

TEST(RectangleGeometry, Validity) {
    EXPECT_TRUE(Rectangle(Point(0, 0), Point(1, 0), Point(0, 1), Point(1, 1)).isValid());
    EXPECT_FALSE(Rectangle(Point(0, 0), Point(0, 0), Point(0, 1), Point(1, 1)).isValid());
    EXPECT_FALSE(Rectangle(Point(0, 0), Point(1, 0), Point(0, 1), Point(2e6, 1)).isValid());
    EXPECT_FALSE(Rectangle(Point(0, 0), Point(1, 0), Point(0, 1),
                           Point(std::numeric_limits<double>::quiet_NaN(), 1)).isValid());
}

TEST(RectangleGeometry, DistanceIsMeanCornerDistance) {
    Rectangle a(Point(0, 0), Point(100, 0), Point(0, 100), Point(100, 100));
    EXPECT_DOUBLE_EQ(0.0, rectangleDistance(a, a));
    EXPECT_DOUBLE_EQ(5.0, rectangleDistance(a, a.translated(3, 4)));
}

TEST(RegionOfInterest, ClampsToImage) {
    EXPECT_EQ(cv::Rect(0, 0, 50, 40), RegionOfInterest(-10, -20, 60, 60).clampTo(100, 100));
    EXPECT_EQ(cv::Rect(90, 80, 10, 20), RegionOfInterest(90, 80, 50, 50).clampTo(100, 100));
    EXPECT_LE(RegionOfInterest(200, 200, 10, 10).clampTo(100, 100).area(), 0);
}
