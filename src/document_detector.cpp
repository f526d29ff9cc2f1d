#include "document_detector.hpp"

#include <opencv2/imgproc.hpp>
#include <cmath>

#include "log.hpp"

namespace {
const char* TAG = "DocumentDetector";

const char* passName(DetectionPass pass) {
    switch (pass) {
        case DETECTION_PASS_CANNY: return "canny";
        case DETECTION_PASS_ADAPTIVE: return "adaptive";
        default: return "none";
    }
}
}  // namespace

DocumentDetector::DocumentDetector(const DetectorConfig& config)
    : config_(config),
      preprocessor_(config),
      edges_(config),
      scorer_(config),
      refiner_(config) {}

DocumentDetector::~DocumentDetector() {}

DetectionResult DocumentDetector::detect(const Frame& frame, const RegionOfInterest* roi) {
    if (frame.empty()) {
        DetectionResult result;
        result.frame_width = frame.uprightWidth();
        result.frame_height = frame.uprightHeight();
        return result;
    }
    return detectUpright(frame.toUprightGray(), roi);
}

DetectionResult DocumentDetector::detectUpright(const cv::Mat& image, const RegionOfInterest* roi) {
    DetectionResult result;

    if (image.empty()) {
        return result;
    }

    result.frame_width = image.cols;
    result.frame_height = image.rows;

    cv::Rect region(0, 0, image.cols, image.rows);
    if (roi) {
        region = roi->clampTo(image.cols, image.rows);
        if (region.area() <= 0) {
            DOCSCAN_LOGD(TAG, "ROI (%d,%d %dx%d) outside %dx%d frame",
                         roi->x, roi->y, roi->width, roi->height, image.cols, image.rows);
            return result;
        }
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image(region), gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image(region), gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image(region);
    }

    // Optional downscale for speed; corners are mapped back afterwards
    double scale = 1.0;
    if (config_.processing_width > 0 && gray.cols > config_.processing_width) {
        scale = static_cast<double>(config_.processing_width) / gray.cols;
        cv::Mat resized;
        cv::resize(gray, resized, cv::Size(), scale, scale, cv::INTER_AREA);
        gray = resized;
    }

    // Contour limits refer to the whole frame even when only an ROI is searched
    cv::Size frameSize(static_cast<int>(std::lround(image.cols * scale)),
                       static_cast<int>(std::lround(image.rows * scale)));
    detectInGray(gray, frameSize, result);

    if (result.found) {
        if (scale != 1.0) {
            result.rectangle = result.rectangle.scaled(1.0 / scale, 1.0 / scale);
        }
        result.rectangle = result.rectangle.translated(region.x, region.y);
    }

    DOCSCAN_LOGD(TAG, "cannyLow=%.1f cannyHigh=%.1f contours=%d candidates=%d bestScore=%.1f pass=%s",
                 result.canny.low, result.canny.high, result.contour_count,
                 result.candidate_count, result.best_score, passName(result.pass));

    return result;
}

void DocumentDetector::detectInGray(const cv::Mat& gray, const cv::Size& frameSize,
                                    DetectionResult& result) {
    PreprocessedImage pre = preprocessor_.processUpright(gray);
    if (pre.empty()) {
        return;
    }

    // First pass: Canny, precise on high-contrast edges
    cv::Mat binary = edges_.cannyEdges(pre.blurred, &result.canny);
    ScoredCandidate best = scorer_.findBest(binary, frameSize);
    result.contour_count = best.contour_count;
    result.candidate_count = best.candidate_count;
    DetectionPass pass = DETECTION_PASS_CANNY;

    // Second pass: adaptive threshold on the contrast-boosted image, better on
    // low-contrast documents. The threshold window does its own smoothing.
    if (!best.found && config_.enable_fallback_pass) {
        binary = edges_.adaptiveEdges(pre.gray);
        best = scorer_.findBest(binary, frameSize);
        result.contour_count += best.contour_count;
        result.candidate_count += best.candidate_count;
        pass = DETECTION_PASS_ADAPTIVE;
    }

    if (!best.found) {
        return;
    }

    result.found = true;
    result.pass = pass;
    result.kind = best.kind;
    result.best_score = best.score;
    result.rectangle = refiner_.refine(pre.gray, best.rectangle, &result.refined);
}
