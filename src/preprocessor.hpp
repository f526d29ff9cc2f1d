#ifndef DOCSCAN_PREPROCESSOR_HPP
#define DOCSCAN_PREPROCESSOR_HPP

#include <opencv2/core.hpp>

#include "detector_config.hpp"
#include "frame.hpp"
#include "image_enhancer.hpp"

struct PreprocessedImage {
    cv::Mat gray;      // upright, contrast-boosted; used for corner refinement
    cv::Mat blurred;   // gray after noise-reducing blur; used for edges

    bool empty() const { return gray.empty(); }
};

class Preprocessor {
public:
    explicit Preprocessor(const DetectorConfig& config = DetectorConfig());

    // Grayscale (NV21 decoded first), rotated upright, CLAHE, blur
    PreprocessedImage process(const Frame& frame);

    // Same stages for an image that is already upright (any channel count)
    PreprocessedImage processUpright(const cv::Mat& image);

private:
    DetectorConfig config_;
    ImageEnhancer enhancer_;
};

#endif // DOCSCAN_PREPROCESSOR_HPP
