#ifndef DOCSCAN_CORNER_REFINER_HPP
#define DOCSCAN_CORNER_REFINER_HPP

#include <opencv2/core.hpp>
#include <vector>

#include "detector_config.hpp"
#include "geometry.hpp"

class CornerRefiner {
public:
    explicit CornerRefiner(const DetectorConfig& config = DetectorConfig());

    // Sub-pixel localization on the contrast-boosted grayscale image.
    // On any numerical failure the clamped input corners are returned, so
    // refinement never rejects a candidate. Result is re-ordered.
    Rectangle refine(const cv::Mat& gray, const Rectangle& rect, bool* refined = nullptr) const;

    // True when every refined corner is finite and moved at most `window`
    // pixels along each axis from its start
    static bool withinWindow(const std::vector<cv::Point2f>& start,
                             const std::vector<cv::Point2f>& refined, int window);

private:
    DetectorConfig config_;
};

#endif // DOCSCAN_CORNER_REFINER_HPP
