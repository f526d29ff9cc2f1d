#ifndef DOCSCAN_PERSPECTIVE_WARPER_HPP
#define DOCSCAN_PERSPECTIVE_WARPER_HPP

#include <opencv2/core.hpp>
#include <vector>

#include "geometry.hpp"

struct WarpResult {
    cv::Mat image;      // warped crop, or the untouched source on failure
    bool success;
    int width;
    int height;

    WarpResult() : success(false), width(0), height(0) {}
};

class PerspectiveWarper {
public:
    PerspectiveWarper();
    ~PerspectiveWarper();

    // Flattens and crops the quadrilateral in one resampling step.
    // A degenerate rectangle returns the original image with success = false.
    WarpResult warp(const cv::Mat& image, const Rectangle& rect);

    // max(top, bottom) x max(left, right), rounded
    static cv::Size outputSizeFor(const Rectangle& rect);

    static const double kMinWarpArea;
};

#endif // DOCSCAN_PERSPECTIVE_WARPER_HPP
