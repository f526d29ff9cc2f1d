#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>
#include <limits>
#include <vector>

#include "contour_scorer.hpp"
#include "corner_refiner.hpp"
#include "edge_extractor.hpp"
#include "../Support/synthetic_images.hpp"

namespace {

const cv::Size kFrame(640, 480);

cv::Mat blankBinary() {
    return cv::Mat(kFrame, CV_8UC1, cv::Scalar(0));
}

cv::Mat filledPolygon(const std::vector<cv::Point>& pts) {
    cv::Mat binary = blankBinary();
    std::vector<std::vector<cv::Point>> polys(1, pts);
    cv::fillPoly(binary, polys, cv::Scalar(255));
    return binary;
}

// Axis-aligned box in traversal order
std::vector<cv::Point2f> box(float x, float y, float w, float h) {
    return {cv::Point2f(x, y), cv::Point2f(x + w, y),
            cv::Point2f(x + w, y + h), cv::Point2f(x, y + h)};
}

cv::Mat uniform(int value, int count) {
    return cv::Mat(1, count, CV_8UC1, cv::Scalar(value));
}

}  // namespace

// EdgeExtractor

TEST(EdgeExtractor, MedianFromHistogram) {
    cv::Mat image;
    cv::hconcat(uniform(10, 50), uniform(200, 50), image);
    EXPECT_DOUBLE_EQ(10.0, EdgeExtractor::computeMedian(image));

    cv::hconcat(uniform(100, 60), uniform(250, 40), image);
    EXPECT_DOUBLE_EQ(100.0, EdgeExtractor::computeMedian(image));

    EXPECT_DOUBLE_EQ(0.0, EdgeExtractor::computeMedian(cv::Mat()));
}

TEST(EdgeExtractor, CannyThresholdsRespectFloors) {
    EdgeExtractor edges;

    // Dark frame: both thresholds sit on their floors
    CannyThresholds dark = edges.thresholdsFor(cv::Mat(100, 100, CV_8UC1, cv::Scalar(30)));
    EXPECT_DOUBLE_EQ(50.0, dark.low);
    EXPECT_DOUBLE_EQ(150.0, dark.high);

    // Median 100: low follows the median, high stays on its floor
    cv::Mat mid;
    cv::hconcat(uniform(100, 60), uniform(250, 40), mid);
    CannyThresholds middle = edges.thresholdsFor(mid);
    EXPECT_NEAR(67.0, middle.low, 1e-9);
    EXPECT_DOUBLE_EQ(150.0, middle.high);

    // Bright frame: both follow the median
    CannyThresholds bright = edges.thresholdsFor(cv::Mat(100, 100, CV_8UC1, cv::Scalar(200)));
    EXPECT_NEAR(134.0, bright.low, 1e-9);
    EXPECT_NEAR(266.0, bright.high, 1e-9);
}

TEST(EdgeExtractor, FloorsComeFromConfig) {
    DetectorConfig config;
    config.canny_low_floor = 10.0;
    config.canny_high_floor = 20.0;
    EdgeExtractor edges(config);

    CannyThresholds t = edges.thresholdsFor(cv::Mat(100, 100, CV_8UC1, cv::Scalar(30)));
    EXPECT_NEAR(20.1, t.low, 1e-9);
    EXPECT_NEAR(39.9, t.high, 1e-9);
}

TEST(EdgeExtractor, EmptyInputGivesEmptyEdges) {
    EdgeExtractor edges;
    EXPECT_TRUE(edges.cannyEdges(cv::Mat()).empty());
    EXPECT_TRUE(edges.adaptiveEdges(cv::Mat()).empty());
}

// ContourScorer sanity checks

TEST(ContourScorer, AspectLimits) {
    ContourScorer scorer;
    EXPECT_FALSE(scorer.passesSanityChecks(box(50, 50, 300, 100), kFrame));   // 3.0
    EXPECT_TRUE(scorer.passesSanityChecks(box(50, 50, 250, 100), kFrame));    // 2.5
    EXPECT_FALSE(scorer.passesSanityChecks(box(50, 50, 100, 250), kFrame));   // 0.4
    EXPECT_TRUE(scorer.passesSanityChecks(box(50, 50, 100, 200), kFrame));    // 0.5
}

TEST(ContourScorer, MinimumEdgeScalesWithFrame) {
    ContourScorer scorer;
    // 640x480: max(60, 8% of 480) = 60
    EXPECT_FALSE(scorer.passesSanityChecks(box(50, 50, 50, 80), kFrame));
    EXPECT_TRUE(scorer.passesSanityChecks(box(50, 50, 100, 100), kFrame));
    // 2000x1500: 8% of 1500 = 120
    EXPECT_FALSE(scorer.passesSanityChecks(box(50, 50, 100, 100), cv::Size(2000, 1500)));
}

TEST(ContourScorer, SanityChecksNeedFourPoints) {
    ContourScorer scorer;
    std::vector<cv::Point2f> triangle = {cv::Point2f(0, 0), cv::Point2f(200, 0), cv::Point2f(0, 200)};
    EXPECT_FALSE(scorer.passesSanityChecks(triangle, kFrame));
}

// ContourScorer candidates

TEST(ContourScorer, ConvexQuadIsPolygonCandidate) {
    cv::Mat binary = filledPolygon({cv::Point(100, 100), cv::Point(400, 100),
                                    cv::Point(400, 300), cv::Point(100, 300)});
    ContourScorer scorer;
    ScoredCandidate best = scorer.findBest(binary);

    ASSERT_TRUE(best.found);
    EXPECT_EQ(CANDIDATE_POLYGON, best.kind);
    EXPECT_EQ(1, best.candidate_count);
    EXPECT_GT(best.rectangularity, 0.95);
    EXPECT_NEAR(best.contour_area * best.rectangularity, best.score, 1e-6);
}

TEST(ContourScorer, NotchedOutlineFallsBackToRotatedBox) {
    // Six vertices after approximation, but most of its box is filled
    cv::Mat binary = filledPolygon({cv::Point(100, 100), cv::Point(340, 100), cv::Point(340, 160),
                                    cv::Point(400, 160), cv::Point(400, 300), cv::Point(100, 300)});
    ContourScorer scorer;
    ScoredCandidate best = scorer.findBest(binary);

    ASSERT_TRUE(best.found);
    EXPECT_EQ(CANDIDATE_ROTATED_BOX, best.kind);
    EXPECT_NEAR(100.0, minX(best.rectangle), 2.0);
    EXPECT_NEAR(400.0, maxX(best.rectangle), 2.0);
    EXPECT_NEAR(100.0, minY(best.rectangle), 2.0);
    EXPECT_NEAR(300.0, maxY(best.rectangle), 2.0);
}

TEST(ContourScorer, PolygonRectangularityCutoff) {
    // Symmetric trapezoid filling 60% of its bounding box
    cv::Mat binary = filledPolygon({cv::Point(250, 100), cv::Point(350, 100),
                                    cv::Point(550, 400), cv::Point(50, 400)});

    EXPECT_FALSE(ContourScorer().findBest(binary).found);

    DetectorConfig config;
    config.min_quad_rectangularity = 0.5;
    ScoredCandidate best = ContourScorer(config).findBest(binary);
    ASSERT_TRUE(best.found);
    EXPECT_EQ(CANDIDATE_POLYGON, best.kind);
    EXPECT_NEAR(0.6, best.rectangularity, 0.03);
}

TEST(ContourScorer, RotatedBoxRectangularityCutoff) {
    // Thin L shape: about 46% of its box
    cv::Mat binary = filledPolygon({cv::Point(100, 100), cv::Point(400, 100), cv::Point(400, 180),
                                    cv::Point(180, 180), cv::Point(180, 400), cv::Point(100, 400)});

    EXPECT_FALSE(ContourScorer().findBest(binary).found);

    DetectorConfig config;
    config.min_box_rectangularity = 0.4;
    ScoredCandidate best = ContourScorer(config).findBest(binary);
    ASSERT_TRUE(best.found);
    EXPECT_EQ(CANDIDATE_ROTATED_BOX, best.kind);
}

TEST(ContourScorer, AreaLimitsFollowGivenFrameSize) {
    cv::Mat binary(210, 270, CV_8UC1, cv::Scalar(0));
    cv::rectangle(binary, cv::Rect(5, 5, 260, 200), cv::Scalar(255), cv::FILLED);
    ContourScorer scorer;

    // Against the crop alone the shape looks like a border
    EXPECT_FALSE(scorer.findBest(binary).found);
    EXPECT_TRUE(scorer.findBest(binary, kFrame).found);
}

TEST(ContourScorer, EqualScoresKeepFirstContour) {
    cv::Mat binary = blankBinary();
    cv::rectangle(binary, cv::Rect(40, 100, 200, 150), cv::Scalar(255), cv::FILLED);
    cv::rectangle(binary, cv::Rect(360, 100, 200, 150), cv::Scalar(255), cv::FILLED);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    ASSERT_EQ(2u, contours.size());
    cv::Rect first = cv::boundingRect(contours[0]);

    ScoredCandidate best = ContourScorer().findBest(binary);
    ASSERT_TRUE(best.found);
    EXPECT_EQ(2, best.candidate_count);
    EXPECT_NEAR(first.x, minX(best.rectangle), 1.0);
    EXPECT_NEAR(first.y, minY(best.rectangle), 1.0);
}

TEST(ContourScorer, EmptyBinaryFindsNothing) {
    ScoredCandidate best = ContourScorer().findBest(cv::Mat());
    EXPECT_FALSE(best.found);
    EXPECT_EQ(0, best.contour_count);
}

// CornerRefiner

TEST(CornerRefiner, SnapsToTrueCorners) {
    cv::Mat gray = makeDocumentImage(640, 480, cv::Rect(120, 90, 400, 300), 40, 220);
    cv::cvtColor(gray, gray, cv::COLOR_BGR2GRAY);
    Rectangle start = orderCorners(std::vector<Point>{
        Point(123, 93), Point(516, 93), Point(123, 386), Point(516, 386)});

    bool refined = false;
    Rectangle r = CornerRefiner().refine(gray, start, &refined);

    EXPECT_TRUE(refined);
    EXPECT_NEAR(120.0, minX(r), 2.0);
    EXPECT_NEAR(90.0, minY(r), 2.0);
    EXPECT_NEAR(520.0, maxX(r), 2.0);
    EXPECT_NEAR(390.0, maxY(r), 2.0);
}

TEST(CornerRefiner, NonGrayInputIsReturnedUnchanged) {
    cv::Mat color = makeDocumentImage(640, 480, cv::Rect(120, 90, 400, 300), 40, 220);
    Rectangle start = orderCorners(std::vector<Point>{
        Point(120, 90), Point(520, 90), Point(120, 390), Point(520, 390)});

    bool refined = true;
    Rectangle r = CornerRefiner().refine(color, start, &refined);

    EXPECT_FALSE(refined);
    EXPECT_EQ(0.0, rectangleDistance(start, r));
}

TEST(CornerRefiner, DisabledRefinementOnlyClamps) {
    DetectorConfig config;
    config.enable_corner_refinement = false;
    cv::Mat gray(480, 640, CV_8UC1, cv::Scalar(100));
    Rectangle start = orderCorners(std::vector<Point>{
        Point(-20, 10), Point(700, 10), Point(-20, 500), Point(700, 500)});

    bool refined = true;
    Rectangle r = CornerRefiner(config).refine(gray, start, &refined);

    EXPECT_FALSE(refined);
    EXPECT_DOUBLE_EQ(0.0, minX(r));
    EXPECT_DOUBLE_EQ(639.0, maxX(r));
    EXPECT_DOUBLE_EQ(10.0, minY(r));
    EXPECT_DOUBLE_EQ(479.0, maxY(r));
}

TEST(CornerRefiner, DriftBeyondWindowIsRejected) {
    std::vector<cv::Point2f> start = box(100, 100, 200, 150);

    std::vector<cv::Point2f> moved = start;
    moved[2].x += 5.0f;
    EXPECT_TRUE(CornerRefiner::withinWindow(start, moved, 11));

    moved[2].x += 7.0f;
    EXPECT_FALSE(CornerRefiner::withinWindow(start, moved, 11));

    moved = start;
    moved[0].y = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(CornerRefiner::withinWindow(start, moved, 11));

    moved.pop_back();
    EXPECT_FALSE(CornerRefiner::withinWindow(start, moved, 11));
}
