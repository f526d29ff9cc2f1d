#ifndef DOCSCAN_EDGE_EXTRACTOR_HPP
#define DOCSCAN_EDGE_EXTRACTOR_HPP

#include <opencv2/core.hpp>

#include "detector_config.hpp"

struct CannyThresholds {
    double low;
    double high;

    CannyThresholds() : low(0), high(0) {}
    CannyThresholds(double l, double h) : low(l), high(h) {}
};

class EdgeExtractor {
public:
    explicit EdgeExtractor(const DetectorConfig& config = DetectorConfig());

    // First pass: Canny with median-adaptive thresholds, then morphological close
    cv::Mat cannyEdges(const cv::Mat& blurred, CannyThresholds* used = nullptr) const;

    // Fallback pass: adaptive Gaussian binarization, then the same close.
    // Pixels darker than their neighbourhood become foreground, so a
    // low-contrast document boundary is an outer contour of its own.
    // The threshold window smooths on its own; pass the unblurred image.
    cv::Mat adaptiveEdges(const cv::Mat& gray) const;

    CannyThresholds thresholdsFor(const cv::Mat& blurred) const;

    // Median intensity of an 8-bit single channel image (256-bin histogram)
    static double computeMedian(const cv::Mat& gray);

private:
    cv::Mat closeGaps(const cv::Mat& binary) const;

    DetectorConfig config_;
};

#endif // DOCSCAN_EDGE_EXTRACTOR_HPP
