#include "edge_extractor.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>

EdgeExtractor::EdgeExtractor(const DetectorConfig& config) : config_(config) {}

double EdgeExtractor::computeMedian(const cv::Mat& gray) {
    if (gray.empty()) {
        return 0.0;
    }

    int channels[] = {0};
    int histSize[] = {256};
    float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    cv::Mat hist;
    cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, histSize, ranges);

    double total = static_cast<double>(gray.total());
    double cumulative = 0.0;
    for (int i = 0; i < 256; i++) {
        cumulative += hist.at<float>(i);
        if (cumulative >= total * 0.5) {
            return static_cast<double>(i);
        }
    }
    return 255.0;
}

CannyThresholds EdgeExtractor::thresholdsFor(const cv::Mat& blurred) const {
    double median = computeMedian(blurred);
    // Floors keep high-resolution sensor noise out of the edge map
    double low = std::max(config_.canny_low_floor, (1.0 - config_.canny_sigma) * median);
    double high = std::max(config_.canny_high_floor, (1.0 + config_.canny_sigma) * median);
    return CannyThresholds(low, high);
}

cv::Mat EdgeExtractor::closeGaps(const cv::Mat& binary) const {
    int size = std::max(1, config_.close_kernel_size);
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(size, size));
    cv::Mat closed;
    cv::morphologyEx(binary, closed, cv::MORPH_CLOSE, kernel);
    return closed;
}

cv::Mat EdgeExtractor::cannyEdges(const cv::Mat& blurred, CannyThresholds* used) const {
    if (blurred.empty()) {
        return cv::Mat();
    }

    CannyThresholds thresholds = thresholdsFor(blurred);
    if (used) {
        *used = thresholds;
    }

    cv::Mat edges;
    cv::Canny(blurred, edges, thresholds.low, thresholds.high);

    // Bridge small gaps left by glare or shadow on the document edge
    return closeGaps(edges);
}

cv::Mat EdgeExtractor::adaptiveEdges(const cv::Mat& gray) const {
    if (gray.empty()) {
        return cv::Mat();
    }

    int blockSize = std::max(3, config_.adaptive_block_size);
    if (blockSize % 2 == 0) {
        blockSize++;
    }

    cv::Mat binary;
    cv::adaptiveThreshold(gray, binary, 255,
                          cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY_INV, blockSize, config_.adaptive_c);

    return closeGaps(binary);
}
