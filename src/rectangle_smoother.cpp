#include "rectangle_smoother.hpp"

#include <algorithm>
#include <cmath>

#include "log.hpp"

namespace {
const char* TAG = "RectangleSmoother";
}

RectangleSmoother::RectangleSmoother(const SmootherConfig& config)
    : config_(config),
      has_last_measurement_(false),
      has_anchor_(false),
      anchor_misses_(0),
      confidence_(0) {
    config_.max_history = std::max(1, config_.max_history);
}

void RectangleSmoother::reset() {
    history_.clear();
    has_last_measurement_ = false;
    has_anchor_ = false;
    anchor_misses_ = 0;
    confidence_ = 0;
}

Point RectangleSmoother::center(const Rectangle& rect) {
    return (rect.topLeft + rect.topRight + rect.bottomLeft + rect.bottomRight) * 0.25;
}

Rectangle RectangleSmoother::blend(const Rectangle& base, const Rectangle& target, double alpha) {
    alpha = std::max(0.0, std::min(1.0, alpha));
    return Rectangle(base.topLeft * (1.0 - alpha) + target.topLeft * alpha,
                     base.topRight * (1.0 - alpha) + target.topRight * alpha,
                     base.bottomLeft * (1.0 - alpha) + target.bottomLeft * alpha,
                     base.bottomRight * (1.0 - alpha) + target.bottomRight * alpha);
}

Rectangle RectangleSmoother::weightedAverage() const {
    // Weights 1..n, newest heaviest
    Rectangle sum(Point(0, 0), Point(0, 0), Point(0, 0), Point(0, 0));
    double total = 0.0;
    double weight = 1.0;
    for (const auto& rect : history_) {
        sum.topLeft += rect.topLeft * weight;
        sum.topRight += rect.topRight * weight;
        sum.bottomLeft += rect.bottomLeft * weight;
        sum.bottomRight += rect.bottomRight * weight;
        total += weight;
        weight += 1.0;
    }
    return sum.scaled(1.0 / total, 1.0 / total);
}

bool RectangleSmoother::holdAnchor(bool dropHistory, Rectangle* out) {
    if (dropHistory) {
        history_.clear();
        has_last_measurement_ = false;
    }

    if (has_anchor_ && confidence_ >= config_.min_confidence_to_hold) {
        anchor_misses_++;
        if (anchor_misses_ <= config_.max_anchor_misses) {
            confidence_ = std::max(1, confidence_ - 1);
            if (out) *out = anchor_;
            return true;
        }
        DOCSCAN_LOGD(TAG, "Anchor dropped after %d misses", anchor_misses_ - 1);
    }

    has_anchor_ = false;
    anchor_misses_ = 0;
    confidence_ = 0;
    return false;
}

bool RectangleSmoother::update(const Rectangle* measured, Rectangle* out) {
    if (!measured || !measured->isValid()) {
        return holdAnchor(false, out);
    }

    anchor_misses_ = 0;
    Rectangle sample = orderCorners(*measured);

    if (has_last_measurement_ &&
        rectangleDistance(last_measurement_, sample) > config_.history_reset_distance) {
        history_.clear();
    }
    history_.push_back(sample);
    while (static_cast<int>(history_.size()) > config_.max_history) {
        history_.pop_front();
    }

    Rectangle candidate = history_.size() >= 2 ? weightedAverage() : sample;

    if (has_anchor_) {
        double delta = rectangleDistance(candidate, anchor_);
        double centerDelta = distance(center(candidate), center(anchor_));
        double anchorArea = anchor_.area();
        double areaShift = anchorArea > 0 ? std::abs(anchorArea - candidate.area()) / anchorArea : 0.0;

        if (centerDelta >= config_.reject_center_distance || areaShift > config_.reject_area_shift) {
            // A different document (or a big move): start over from this sample
            history_.clear();
            history_.push_back(sample);
            last_measurement_ = sample;
            has_last_measurement_ = true;
            anchor_ = sample;
            confidence_ = 1;
            if (out) *out = anchor_;
            return true;
        }

        if (delta <= config_.snap_distance &&
            centerDelta <= config_.snap_center_distance &&
            areaShift <= config_.snap_area_shift) {
            candidate = anchor_;
        } else if (delta <= config_.blend_distance &&
                   centerDelta <= config_.blend_center_distance &&
                   areaShift <= config_.blend_area_shift) {
            double normalized = std::min(1.0, delta / config_.blend_distance);
            candidate = blend(anchor_, candidate, 0.25 + normalized * 0.45);
        } else {
            return holdAnchor(true, out);
        }
    }

    last_measurement_ = sample;
    has_last_measurement_ = true;
    confidence_ = std::min(confidence_ + 1, config_.max_confidence);

    anchor_ = orderCorners(candidate);
    has_anchor_ = true;
    if (out) *out = anchor_;
    return true;
}
