#include "contour_scorer.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

ContourScorer::ContourScorer(const DetectorConfig& config) : config_(config) {}

bool ContourScorer::passesSanityChecks(const std::vector<cv::Point2f>& quad,
                                       const cv::Size& frameSize) const {
    if (quad.size() != 4) {
        return false;
    }

    // quad is in traversal order here, so edge i joins vertex i and i + 1
    double edges[4];
    for (int i = 0; i < 4; i++) {
        edges[i] = cv::norm(quad[(i + 1) % 4] - quad[i]);
    }

    double shortSide = std::min(frameSize.width, frameSize.height);
    double minEdge = std::max(config_.min_edge_length, shortSide * config_.min_edge_ratio);
    for (double edge : edges) {
        if (edge < minEdge) {
            return false;
        }
    }

    double width = (edges[0] + edges[2]) / 2.0;
    double height = (edges[1] + edges[3]) / 2.0;
    if (height <= 0.0) {
        return false;
    }
    double aspect = width / height;
    return aspect >= config_.min_edge_aspect && aspect <= config_.max_edge_aspect;
}

bool ContourScorer::scoreContour(const std::vector<cv::Point>& contour,
                                 const cv::Size& frameSize,
                                 ScoredCandidate& candidate) const {
    double frameArea = static_cast<double>(frameSize.width) * frameSize.height;
    double minArea = std::max(config_.min_contour_area, frameArea * config_.min_contour_area_ratio);
    double maxArea = frameArea * config_.max_contour_area_ratio;

    double area = cv::contourArea(contour);
    // Too large usually means the frame or screen border, not a document
    if (area < minArea || area > maxArea) {
        return false;
    }

    double perimeter = cv::arcLength(contour, true);
    std::vector<cv::Point> approx;
    cv::approxPolyDP(contour, approx, config_.approx_epsilon * perimeter, true);
    if (approx.size() != 4) {
        cv::approxPolyDP(contour, approx, config_.approx_epsilon_relaxed * perimeter, true);
    }

    if (approx.size() == 4 && cv::isContourConvex(approx)) {
        std::vector<cv::Point2f> quad;
        for (const auto& pt : approx) {
            quad.push_back(cv::Point2f(static_cast<float>(pt.x), static_cast<float>(pt.y)));
        }

        cv::RotatedRect box = cv::minAreaRect(quad);
        double boxArea = static_cast<double>(box.size.width) * box.size.height;
        double rectangularity = boxArea > 1.0 ? area / boxArea : 0.0;

        if (rectangularity < config_.min_quad_rectangularity ||
            !passesSanityChecks(quad, frameSize)) {
            return false;
        }

        candidate.rectangle = orderCorners(quad);
        candidate.contour_area = area;
        candidate.rectangularity = rectangularity;
        candidate.kind = CANDIDATE_POLYGON;
        return true;
    }

    // Noise can fragment a genuinely rectangular outline into a polygon with
    // more vertices; its rotated bounding box still describes the document
    cv::RotatedRect box = cv::minAreaRect(contour);
    double boxArea = static_cast<double>(box.size.width) * box.size.height;
    if (boxArea <= 1.0) {
        return false;
    }

    double rectangularity = area / boxArea;
    cv::Point2f vertices[4];
    box.points(vertices);
    std::vector<cv::Point2f> quad(vertices, vertices + 4);

    if (rectangularity < config_.min_box_rectangularity ||
        !passesSanityChecks(quad, frameSize)) {
        return false;
    }

    candidate.rectangle = orderCorners(quad);
    candidate.contour_area = area;
    candidate.rectangularity = rectangularity;
    candidate.kind = CANDIDATE_ROTATED_BOX;
    return true;
}

ScoredCandidate ContourScorer::findBest(const cv::Mat& binary, const cv::Size& frameSize) const {
    ScoredCandidate best;

    if (binary.empty()) {
        return best;
    }

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    best.contour_count = static_cast<int>(contours.size());

    cv::Size limits = frameSize.area() > 0 ? frameSize : binary.size();

    for (const auto& contour : contours) {
        ScoredCandidate candidate;
        if (!scoreContour(contour, limits, candidate)) {
            continue;
        }

        best.candidate_count++;
        candidate.score = candidate.contour_area * candidate.rectangularity;

        // Strict comparison keeps the earliest contour on ties
        if (candidate.score > best.score) {
            best.found = true;
            best.rectangle = candidate.rectangle;
            best.contour_area = candidate.contour_area;
            best.rectangularity = candidate.rectangularity;
            best.score = candidate.score;
            best.kind = candidate.kind;
        }
    }

    return best;
}
