#include "quality_evaluator.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace {

// Skew of an edge against whichever image axis it runs closest to
double edgeSkew(const Point& a, const Point& b) {
    double dx = std::abs(b.x - a.x);
    double dy = std::abs(b.y - a.y);
    double length = std::sqrt(dx * dx + dy * dy);
    if (length <= 0.0) {
        return 1.0;
    }
    return std::min(dx, dy) / length;
}

bool ratioWithin(double a, double b, double lo, double hi) {
    if (b <= 0.0) {
        return false;
    }
    double ratio = a / b;
    return ratio >= lo && ratio <= hi;
}

}  // namespace

const char* qualityName(RectangleQuality quality) {
    switch (quality) {
        case QUALITY_GOOD: return "GOOD";
        case QUALITY_BAD_ANGLE: return "BAD_ANGLE";
        case QUALITY_TOO_FAR: return "TOO_FAR";
    }
    return "UNKNOWN";
}

QualityEvaluator::QualityEvaluator(const QualityConfig& config) : config_(config) {}

QualityEvaluator::~QualityEvaluator() {}

RectangleQuality QualityEvaluator::evaluate(const Rectangle& rect, int refWidth, int refHeight,
                                            QualitySpace space) const {
    if (space == QUALITY_SPACE_VIEW) {
        return evaluateInView(rect, refWidth, refHeight);
    }
    return evaluateInImage(rect, refWidth, refHeight);
}

RectangleQuality QualityEvaluator::evaluateInImage(const Rectangle& input,
                                                   int imageWidth, int imageHeight) const {
    if (imageWidth <= 0 || imageHeight <= 0) {
        return QUALITY_TOO_FAR;
    }

    // Edge pairs below are compared by label, so the labels must be geometric
    Rectangle rect = normalizeWinding(input);

    double topYDiff = std::abs(rect.topRight.y - rect.topLeft.y);
    double bottomYDiff = std::abs(rect.bottomLeft.y - rect.bottomRight.y);
    double leftXDiff = std::abs(rect.topLeft.x - rect.bottomLeft.x);
    double rightXDiff = std::abs(rect.topRight.x - rect.bottomRight.x);

    double maxDiff = config_.image_max_edge_misalignment;
    if (topYDiff > maxDiff || bottomYDiff > maxDiff || leftXDiff > maxDiff || rightXDiff > maxDiff) {
        return QUALITY_BAD_ANGLE;
    }

    double margin = config_.image_edge_margin;
    if (rect.topLeft.y > margin ||
        rect.topRight.y > margin ||
        rect.bottomLeft.y < (imageHeight - margin) ||
        rect.bottomRight.y < (imageHeight - margin)) {
        return QUALITY_TOO_FAR;
    }

    return QUALITY_GOOD;
}

RectangleQuality QualityEvaluator::evaluateInView(const Rectangle& rect,
                                                  int viewWidth, int viewHeight) const {
    if (viewWidth <= 0 || viewHeight <= 0) {
        return QUALITY_TOO_FAR;
    }

    double top = rect.topEdge();
    double bottom = rect.bottomEdge();
    double left = rect.leftEdge();
    double right = rect.rightEdge();

    double area = std::max(top, bottom) * std::max(left, right);
    double viewArea = static_cast<double>(viewWidth) * viewHeight;
    double areaRatio = area / viewArea;

    // Too small, or so large that it is most likely the viewport border
    if (areaRatio < config_.view_min_area_ratio || areaRatio > config_.view_max_area_ratio) {
        return QUALITY_TOO_FAR;
    }

    double maxSkew = config_.view_max_skew_ratio;
    if (edgeSkew(rect.topLeft, rect.topRight) > maxSkew ||
        edgeSkew(rect.bottomLeft, rect.bottomRight) > maxSkew ||
        edgeSkew(rect.topLeft, rect.bottomLeft) > maxSkew ||
        edgeSkew(rect.topRight, rect.bottomRight) > maxSkew) {
        return QUALITY_BAD_ANGLE;
    }

    double lo = config_.view_min_opposite_edge_ratio;
    double hi = config_.view_max_opposite_edge_ratio;
    if (!ratioWithin(top, bottom, lo, hi) || !ratioWithin(left, right, lo, hi)) {
        return QUALITY_BAD_ANGLE;
    }

    return QUALITY_GOOD;
}

float QualityEvaluator::detectBlur(const cv::Mat& gray) const {
    if (gray.empty()) {
        return 0.0f;
    }

    // Laplacian variance method
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);

    double variance = stddev.val[0] * stddev.val[0];

    // variance < 100 is blurry, > 500 is sharp
    return static_cast<float>(std::min(variance / 500.0, 1.0));
}

float QualityEvaluator::checkBrightness(const cv::Mat& gray) const {
    if (gray.empty()) {
        return 0.0f;
    }

    cv::Scalar meanVal = cv::mean(gray);
    double brightness = meanVal.val[0] / 255.0;

    float distance = static_cast<float>(std::abs(brightness - 0.5));
    return std::max(0.0f, 1.0f - distance * 2.0f);
}

FrameMetrics QualityEvaluator::measure(const cv::Mat& image, const Rectangle* region) const {
    FrameMetrics metrics;

    if (image.empty()) {
        return metrics;
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    if (region) {
        std::vector<cv::Point2f> pts = region->points2f();
        cv::Rect bounds = cv::boundingRect(pts) & cv::Rect(0, 0, gray.cols, gray.rows);
        // Tiny regions give meaningless statistics; use the full frame
        if (bounds.width >= 10 && bounds.height >= 10) {
            gray = gray(bounds);
        }
    }

    metrics.sharpness = detectBlur(gray);
    metrics.exposure = checkBrightness(gray);
    return metrics;
}
