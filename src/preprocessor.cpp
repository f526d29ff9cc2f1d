#include "preprocessor.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>

Preprocessor::Preprocessor(const DetectorConfig& config) : config_(config) {}

PreprocessedImage Preprocessor::process(const Frame& frame) {
    if (frame.empty()) {
        return PreprocessedImage();
    }
    return processUpright(frame.toUprightGray());
}

PreprocessedImage Preprocessor::processUpright(const cv::Mat& image) {
    PreprocessedImage result;

    if (image.empty()) {
        return result;
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    // Boost local contrast so low-contrast edges (white card on a light desk)
    // survive the blur
    result.gray = enhancer_.applyCLAHE(gray, config_.clahe_clip_limit, config_.clahe_tile_size);

    int kernel = std::max(3, std::min(5, config_.blur_kernel_size));
    if (kernel % 2 == 0) {
        kernel++;
    }
    cv::GaussianBlur(result.gray, result.blurred, cv::Size(kernel, kernel), 0);

    return result;
}
