#ifndef DOCSCAN_DOCUMENT_DETECTOR_HPP
#define DOCSCAN_DOCUMENT_DETECTOR_HPP

#include <opencv2/core.hpp>

#include "contour_scorer.hpp"
#include "corner_refiner.hpp"
#include "detector_config.hpp"
#include "edge_extractor.hpp"
#include "frame.hpp"
#include "geometry.hpp"
#include "preprocessor.hpp"

enum DetectionPass {
    DETECTION_PASS_NONE = 0,
    DETECTION_PASS_CANNY = 1,
    DETECTION_PASS_ADAPTIVE = 2
};

struct DetectionResult {
    bool found;
    Rectangle rectangle;    // upright image space, canonical order
    int frame_width;        // upright frame size
    int frame_height;

    // Diagnostics; they never change the outcome
    DetectionPass pass;
    CandidateKind kind;
    bool refined;
    CannyThresholds canny;
    int contour_count;
    int candidate_count;
    double best_score;

    DetectionResult()
        : found(false), frame_width(0), frame_height(0),
          pass(DETECTION_PASS_NONE), kind(CANDIDATE_NONE), refined(false),
          contour_count(0), candidate_count(0), best_score(0) {}
};

// Single-frame document boundary detector. Holds only configuration, so
// one instance per worker can be reused across frames.
class DocumentDetector {
public:
    explicit DocumentDetector(const DetectorConfig& config = DetectorConfig());
    ~DocumentDetector();

    // roi (optional) is in upright image space and is clamped to the image;
    // the returned rectangle is always in full upright image coordinates
    DetectionResult detect(const Frame& frame, const RegionOfInterest* roi = nullptr);

    // Same pipeline on an image that is already upright
    DetectionResult detectUpright(const cv::Mat& image, const RegionOfInterest* roi = nullptr);

    const DetectorConfig& config() const { return config_; }

private:
    void detectInGray(const cv::Mat& gray, const cv::Size& frameSize, DetectionResult& result);

    DetectorConfig config_;
    Preprocessor preprocessor_;
    EdgeExtractor edges_;
    ContourScorer scorer_;
    CornerRefiner refiner_;
};

#endif // DOCSCAN_DOCUMENT_DETECTOR_HPP
