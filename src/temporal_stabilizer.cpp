#include "temporal_stabilizer.hpp"

#include <algorithm>

#include "log.hpp"

namespace {
const char* TAG = "TemporalStabilizer";
}

TemporalStabilizer::TemporalStabilizer(const StabilizerConfig& config)
    : config_(config), counter_(0) {
    if (config_.detections_before_capture < 1) {
        DOCSCAN_LOGW(TAG, "detections_before_capture=%d, using 1",
                     config_.detections_before_capture);
        config_.detections_before_capture = 1;
    }
}

StabilizerState TemporalStabilizer::update(bool found, RectangleQuality quality) {
    if (!found) {
        counter_ = 0;
    } else if (quality == QUALITY_GOOD) {
        counter_ = std::min(counter_ + 1, config_.detections_before_capture);
    } else {
        counter_ = std::max(counter_ - 1, 0);
    }
    return state();
}

StabilizerState TemporalStabilizer::state() const {
    if (counter_ <= 0) {
        return STABILIZER_IDLE;
    }
    if (counter_ >= config_.detections_before_capture) {
        return STABILIZER_READY;
    }
    return STABILIZER_ACCUMULATING;
}

bool TemporalStabilizer::consumeCapture() {
    if (state() != STABILIZER_READY) {
        return false;
    }
    DOCSCAN_LOGI(TAG, "Auto-capture after %d stable detections", counter_);
    counter_ = 0;
    return true;
}

void TemporalStabilizer::reset() {
    counter_ = 0;
}

const char* stabilizerStateName(StabilizerState state) {
    switch (state) {
        case STABILIZER_IDLE: return "idle";
        case STABILIZER_ACCUMULATING: return "accumulating";
        case STABILIZER_READY: return "ready";
    }
    return "unknown";
}
