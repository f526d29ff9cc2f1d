#include "perspective_warper.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

#include "log.hpp"

namespace {
const char* TAG = "PerspectiveWarper";
}

const double PerspectiveWarper::kMinWarpArea = 1.0;

PerspectiveWarper::PerspectiveWarper() {}

PerspectiveWarper::~PerspectiveWarper() {}

cv::Size PerspectiveWarper::outputSizeFor(const Rectangle& rect) {
    double width = std::max(rect.topEdge(), rect.bottomEdge());
    double height = std::max(rect.leftEdge(), rect.rightEdge());
    return cv::Size(static_cast<int>(std::lround(width)), static_cast<int>(std::lround(height)));
}

WarpResult PerspectiveWarper::warp(const cv::Mat& image, const Rectangle& input) {
    WarpResult result;
    result.image = image;
    result.width = image.cols;
    result.height = image.rows;

    if (image.empty()) {
        return result;
    }

    if (!input.isValid() || input.area() < kMinWarpArea) {
        DOCSCAN_LOGW(TAG, "Degenerate rectangle (area %.2f), returning original image", input.area());
        return result;
    }

    // Never produce a mirror image of the document
    Rectangle rect = normalizeWinding(input);
    cv::Size outputSize = outputSizeFor(rect);
    if (outputSize.width < 1 || outputSize.height < 1) {
        DOCSCAN_LOGW(TAG, "Output size %dx%d too small, returning original image",
                     outputSize.width, outputSize.height);
        return result;
    }

    // Corner (0,0) and (w,h) span the full destination, matching the edge
    // lengths used for the output size
    std::vector<cv::Point2f> src = rect.points2f();
    float w = static_cast<float>(outputSize.width);
    float h = static_cast<float>(outputSize.height);
    std::vector<cv::Point2f> dst = {
        cv::Point2f(0, 0),
        cv::Point2f(w, 0),
        cv::Point2f(0, h),
        cv::Point2f(w, h)
    };

    try {
        cv::Mat M = cv::getPerspectiveTransform(src, dst);
        if (M.empty() || !cv::checkRange(M)) {
            DOCSCAN_LOGW(TAG, "Singular perspective transform, returning original image");
            return result;
        }

        cv::Mat warped;
        cv::warpPerspective(image, warped, M, outputSize);

        result.image = warped;
        result.width = outputSize.width;
        result.height = outputSize.height;
        result.success = true;
    } catch (const cv::Exception& e) {
        DOCSCAN_LOGE(TAG, "Perspective warp failed, returning original image: %s", e.what());
    }

    return result;
}
