#include "corner_refiner.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

#include "log.hpp"

namespace {
const char* TAG = "CornerRefiner";

float clampf(double v, double lo, double hi) {
    return static_cast<float>(std::max(lo, std::min(hi, v)));
}
}  // namespace

CornerRefiner::CornerRefiner(const DetectorConfig& config) : config_(config) {}

bool CornerRefiner::withinWindow(const std::vector<cv::Point2f>& start,
                                 const std::vector<cv::Point2f>& refined, int window) {
    if (start.size() != refined.size()) {
        return false;
    }
    for (size_t i = 0; i < refined.size(); i++) {
        const cv::Point2f& pt = refined[i];
        if (!std::isfinite(pt.x) || !std::isfinite(pt.y) ||
            std::abs(pt.x - start[i].x) > window || std::abs(pt.y - start[i].y) > window) {
            return false;
        }
    }
    return true;
}

Rectangle CornerRefiner::refine(const cv::Mat& gray, const Rectangle& rect, bool* refined) const {
    if (refined) {
        *refined = false;
    }

    if (gray.empty() || gray.type() != CV_8UC1) {
        return rect;
    }

    double maxX = std::max(1.0, static_cast<double>(gray.cols - 1));
    double maxY = std::max(1.0, static_cast<double>(gray.rows - 1));

    std::vector<cv::Point2f> corners;
    for (const auto& pt : rect.points()) {
        corners.push_back(cv::Point2f(clampf(pt.x, 0.0, maxX), clampf(pt.y, 0.0, maxY)));
    }
    Rectangle clamped = orderCorners(corners);

    if (!config_.enable_corner_refinement) {
        return clamped;
    }

    std::vector<cv::Point2f> start = corners;
    int half = std::max(1, config_.refine_window_size);
    cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER,
                              config_.refine_max_iterations, config_.refine_epsilon);

    try {
        cv::cornerSubPix(gray, corners, cv::Size(half, half), cv::Size(-1, -1), criteria);
    } catch (const cv::Exception& e) {
        DOCSCAN_LOGW(TAG, "cornerSubPix failed, keeping unrefined corners: %s", e.what());
        return clamped;
    }

    if (!withinWindow(start, corners, half)) {
        DOCSCAN_LOGD(TAG, "Corners diverged, keeping unrefined corners");
        return clamped;
    }

    if (refined) {
        *refined = true;
    }
    return orderCorners(corners);
}
