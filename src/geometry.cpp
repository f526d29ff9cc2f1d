#include "geometry.hpp"

#include <algorithm>
#include <cmath>

namespace {
const double kMaxCoordinate = 1000000.0;
const double kPointEpsilon = 1e-3;

bool isValidPoint(const Point& pt) {
    return std::isfinite(pt.x) && std::isfinite(pt.y) &&
           std::abs(pt.x) <= kMaxCoordinate && std::abs(pt.y) <= kMaxCoordinate;
}
}  // namespace

double distance(const Point& a, const Point& b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

double Rectangle::topEdge() const { return distance(topLeft, topRight); }
double Rectangle::bottomEdge() const { return distance(bottomLeft, bottomRight); }
double Rectangle::leftEdge() const { return distance(topLeft, bottomLeft); }
double Rectangle::rightEdge() const { return distance(topRight, bottomRight); }

double Rectangle::perimeter() const {
    return topEdge() + rightEdge() + bottomEdge() + leftEdge();
}

double Rectangle::signedArea() const {
    const Point ring[4] = {topLeft, topRight, bottomRight, bottomLeft};
    double sum = 0.0;
    for (int i = 0; i < 4; i++) {
        const Point& cur = ring[i];
        const Point& next = ring[(i + 1) % 4];
        sum += cur.x * next.y - next.x * cur.y;
    }
    return sum / 2.0;
}

double Rectangle::area() const {
    return std::abs(signedArea());
}

std::vector<Point> Rectangle::points() const {
    return {topLeft, topRight, bottomLeft, bottomRight};
}

std::vector<cv::Point2f> Rectangle::points2f() const {
    return {
        cv::Point2f(static_cast<float>(topLeft.x), static_cast<float>(topLeft.y)),
        cv::Point2f(static_cast<float>(topRight.x), static_cast<float>(topRight.y)),
        cv::Point2f(static_cast<float>(bottomLeft.x), static_cast<float>(bottomLeft.y)),
        cv::Point2f(static_cast<float>(bottomRight.x), static_cast<float>(bottomRight.y))
    };
}

Rectangle Rectangle::translated(double dx, double dy) const {
    Point d(dx, dy);
    return Rectangle(topLeft + d, topRight + d, bottomLeft + d, bottomRight + d);
}

Rectangle Rectangle::scaled(double sx, double sy) const {
    return Rectangle(Point(topLeft.x * sx, topLeft.y * sy),
                     Point(topRight.x * sx, topRight.y * sy),
                     Point(bottomLeft.x * sx, bottomLeft.y * sy),
                     Point(bottomRight.x * sx, bottomRight.y * sy));
}

bool Rectangle::isValid() const {
    std::vector<Point> pts = points();
    for (size_t i = 0; i < pts.size(); i++) {
        if (!isValidPoint(pts[i])) {
            return false;
        }
        for (size_t j = i + 1; j < pts.size(); j++) {
            if (distance(pts[i], pts[j]) < kPointEpsilon) {
                return false;
            }
        }
    }
    return true;
}

cv::Rect RegionOfInterest::clampTo(int imageWidth, int imageHeight) const {
    if (width <= 0 || height <= 0 || imageWidth <= 0 || imageHeight <= 0) {
        return cv::Rect();
    }
    return cv::Rect(x, y, width, height) & cv::Rect(0, 0, imageWidth, imageHeight);
}

Rectangle orderCorners(const std::vector<Point>& points) {
    if (points.size() != 4) {
        return Rectangle();
    }

    size_t minSum = 0, maxSum = 0, minDiff = 0, maxDiff = 0;
    for (size_t i = 1; i < points.size(); i++) {
        double sum = points[i].x + points[i].y;
        double diff = points[i].x - points[i].y;
        if (sum < points[minSum].x + points[minSum].y) minSum = i;
        if (sum > points[maxSum].x + points[maxSum].y) maxSum = i;
        if (diff < points[minDiff].x - points[minDiff].y) minDiff = i;
        if (diff > points[maxDiff].x - points[maxDiff].y) maxDiff = i;
    }

    return Rectangle(points[minSum], points[minDiff], points[maxDiff], points[maxSum]);
}

Rectangle orderCorners(const std::vector<cv::Point2f>& points) {
    std::vector<Point> converted;
    converted.reserve(points.size());
    for (const auto& pt : points) {
        converted.push_back(Point(pt.x, pt.y));
    }
    return orderCorners(converted);
}

Rectangle orderCorners(const Rectangle& rect) {
    return orderCorners(rect.points());
}

Rectangle normalizeWinding(const Rectangle& rect) {
    // y grows downwards, so TL -> TR -> BR -> BL of an upright document has
    // a positive shoelace sum
    if (rect.signedArea() < 0.0) {
        return Rectangle(rect.topLeft, rect.bottomLeft, rect.topRight, rect.bottomRight);
    }
    return rect;
}

double rectangleDistance(const Rectangle& a, const Rectangle& b) {
    return (distance(a.topLeft, b.topLeft) +
            distance(a.topRight, b.topRight) +
            distance(a.bottomLeft, b.bottomLeft) +
            distance(a.bottomRight, b.bottomRight)) / 4.0;
}
