#include "image_enhancer.hpp"

#include <opencv2/imgproc.hpp>
#include <vector>

ImageEnhancer::ImageEnhancer() {}

ImageEnhancer::~ImageEnhancer() {}

cv::Mat ImageEnhancer::applyCLAHE(const cv::Mat& input, double clipLimit, int tileSize) {
    if (input.empty()) {
        return input;
    }

    cv::Mat result;
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(clipLimit, cv::Size(tileSize, tileSize));

    if (input.channels() == 1) {
        clahe->apply(input, result);
    } else {
        // Color image - equalize lightness only so hues are preserved
        cv::Mat bgr;
        if (input.channels() == 4) {
            cv::cvtColor(input, bgr, cv::COLOR_BGRA2BGR);
        } else {
            bgr = input;
        }

        cv::Mat lab;
        cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);

        std::vector<cv::Mat> channels;
        cv::split(lab, channels);
        clahe->apply(channels[0], channels[0]);
        cv::merge(channels, lab);

        cv::cvtColor(lab, result, cv::COLOR_Lab2BGR);
    }

    return result;
}

cv::Mat ImageEnhancer::adjustSaturation(const cv::Mat& input, float saturation) {
    if (input.channels() != 3) {
        return input;
    }

    cv::Mat hsv;
    cv::cvtColor(input, hsv, cv::COLOR_BGR2HSV);

    std::vector<cv::Mat> channels;
    cv::split(hsv, channels);
    channels[1].convertTo(channels[1], -1, saturation, 0.0);
    cv::merge(channels, hsv);

    cv::Mat result;
    cv::cvtColor(hsv, result, cv::COLOR_HSV2BGR);
    return result;
}

cv::Mat ImageEnhancer::applyColorControls(const cv::Mat& input, const ColorControls& controls) {
    if (input.empty() || controls.isIdentity()) {
        return input.clone();
    }

    cv::Mat working;
    if (input.channels() == 4) {
        cv::cvtColor(input, working, cv::COLOR_BGRA2BGR);
    } else {
        working = input;
    }

    if (controls.saturation != 1.0f) {
        working = adjustSaturation(working, controls.saturation);
    }

    // alpha: contrast, beta: brightness offset in pixel units
    cv::Mat result;
    working.convertTo(result, -1, controls.contrast, controls.brightness * 255.0);

    return result;
}
