#ifndef DOCSCAN_TEMPORAL_STABILIZER_HPP
#define DOCSCAN_TEMPORAL_STABILIZER_HPP

#include "quality_evaluator.hpp"

enum StabilizerState {
    STABILIZER_IDLE = 0,
    STABILIZER_ACCUMULATING = 1,
    STABILIZER_READY = 2
};

struct StabilizerConfig {
    int detections_before_capture;  // N; READY when the counter reaches it

    StabilizerConfig() : detections_before_capture(8) {}
};

// Per-frame counter deciding when an auto-capture may fire.
// Owned by one caller and driven from a single thread; no locking.
class TemporalStabilizer {
public:
    explicit TemporalStabilizer(const StabilizerConfig& config = StabilizerConfig());

    // Feed one detection outcome. `quality` is ignored when `found` is false.
    StabilizerState update(bool found, RectangleQuality quality);

    // Returns true (and resets) when READY; false otherwise
    bool consumeCapture();

    void reset();

    int counter() const { return counter_; }
    StabilizerState state() const;
    const StabilizerConfig& config() const { return config_; }

private:
    StabilizerConfig config_;
    int counter_;
};

const char* stabilizerStateName(StabilizerState state);

#endif // DOCSCAN_TEMPORAL_STABILIZER_HPP
