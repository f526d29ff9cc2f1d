#ifndef DOCSCAN_RECTANGLE_SMOOTHER_HPP
#define DOCSCAN_RECTANGLE_SMOOTHER_HPP

#include <deque>

#include "geometry.hpp"

struct SmootherConfig {
    int max_history;                // measurements kept for the weighted average
    double snap_distance;           // mean corner delta that keeps the anchor as-is
    double snap_center_distance;
    double snap_area_shift;
    double blend_distance;          // mean corner delta still blended toward the anchor
    double blend_center_distance;
    double blend_area_shift;
    double history_reset_distance;  // jump that discards the history
    double reject_center_distance;  // jump that re-seeds the anchor outright
    double reject_area_shift;
    int max_anchor_misses;          // missed frames the anchor survives
    int min_confidence_to_hold;
    int max_confidence;

    SmootherConfig() {
        max_history = 5;
        snap_distance = 8.0;
        snap_center_distance = 18.0;
        snap_area_shift = 0.08;
        blend_distance = 80.0;
        blend_center_distance = 120.0;
        blend_area_shift = 0.55;
        history_reset_distance = 90.0;
        reject_center_distance = 200.0;
        reject_area_shift = 1.2;
        max_anchor_misses = 20;
        min_confidence_to_hold = 2;
        max_confidence = 30;
    }
};

// Preview-overlay jitter filter. Works in whatever space it is fed (usually
// view space); never feeds back into detection.
class RectangleSmoother {
public:
    explicit RectangleSmoother(const SmootherConfig& config = SmootherConfig());

    // Returns true and fills `out` when there is something to display.
    // Pass nullptr for a frame without a detection.
    bool update(const Rectangle* measured, Rectangle* out);

    void reset();

    bool hasAnchor() const { return has_anchor_; }
    int anchorMisses() const { return anchor_misses_; }
    int confidence() const { return confidence_; }
    size_t historySize() const { return history_.size(); }

private:
    bool holdAnchor(bool dropHistory, Rectangle* out);
    Rectangle weightedAverage() const;

    static Point center(const Rectangle& rect);
    static Rectangle blend(const Rectangle& base, const Rectangle& target, double alpha);

    SmootherConfig config_;
    std::deque<Rectangle> history_;
    bool has_last_measurement_;
    Rectangle last_measurement_;
    bool has_anchor_;
    Rectangle anchor_;
    int anchor_misses_;
    int confidence_;
};

#endif // DOCSCAN_RECTANGLE_SMOOTHER_HPP
