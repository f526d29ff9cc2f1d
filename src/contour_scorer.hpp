#ifndef DOCSCAN_CONTOUR_SCORER_HPP
#define DOCSCAN_CONTOUR_SCORER_HPP

#include <opencv2/core.hpp>
#include <vector>

#include "detector_config.hpp"
#include "geometry.hpp"

enum CandidateKind {
    CANDIDATE_NONE = 0,
    CANDIDATE_POLYGON = 1,      // convex 4-vertex approximation
    CANDIDATE_ROTATED_BOX = 2   // minimum-area box of a non-quad contour
};

struct ScoredCandidate {
    bool found;
    Rectangle rectangle;        // ordered, unrefined
    double contour_area;
    double rectangularity;
    double score;
    CandidateKind kind;
    int contour_count;
    int candidate_count;        // contours that passed every filter

    ScoredCandidate()
        : found(false), contour_area(0), rectangularity(0), score(0),
          kind(CANDIDATE_NONE), contour_count(0), candidate_count(0) {}
};

class ContourScorer {
public:
    explicit ContourScorer(const DetectorConfig& config = DetectorConfig());

    // Best rectangle among the external contours of a binary edge image.
    // Area and edge limits refer to frameSize, the whole frame at the
    // binary image's scale; an empty size means the binary image itself.
    ScoredCandidate findBest(const cv::Mat& binary, const cv::Size& frameSize = cv::Size()) const;

    // Edge-length and aspect sanity checks against a frame size
    bool passesSanityChecks(const std::vector<cv::Point2f>& quad, const cv::Size& frameSize) const;

private:
    bool scoreContour(const std::vector<cv::Point>& contour,
                      const cv::Size& frameSize,
                      ScoredCandidate& candidate) const;

    DetectorConfig config_;
};

#endif // DOCSCAN_CONTOUR_SCORER_HPP
