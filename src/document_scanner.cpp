#include "document_scanner.hpp"

#include <opencv2/imgproc.hpp>

#include "log.hpp"

namespace {
const char* TAG = "DocumentScanner";
}

DocumentScanner::DocumentScanner(const DetectorConfig& detectorConfig,
                                 const QualityConfig& qualityConfig) {
    detector_ = std::make_unique<DocumentDetector>(detectorConfig);
    evaluator_ = std::make_unique<QualityEvaluator>(qualityConfig);
    warper_ = std::make_unique<PerspectiveWarper>();
    mapper_ = std::make_unique<CoordinateMapper>();
    enhancer_ = std::make_unique<ImageEnhancer>();
    DOCSCAN_LOGI(TAG, "Created (config version %d)", DetectorConfig::kConfigVersion);
}

DocumentScanner::~DocumentScanner() {}

DetectionResult DocumentScanner::detect(const Frame& frame, const RegionOfInterest* roi) {
    DetectionResult result = detector_->detect(frame, roi);

    if (result.found) {
        const Rectangle& r = result.rectangle;
        DOCSCAN_LOGD(TAG, "Corners: TL(%.1f,%.1f) TR(%.1f,%.1f) BL(%.1f,%.1f) BR(%.1f,%.1f) in %dx%d",
                     r.topLeft.x, r.topLeft.y, r.topRight.x, r.topRight.y,
                     r.bottomLeft.x, r.bottomLeft.y, r.bottomRight.x, r.bottomRight.y,
                     result.frame_width, result.frame_height);
    }

    return result;
}

DetectionResult DocumentScanner::detectInYuv(const uint8_t* bytes, size_t length,
                                             int width, int height, int rotation,
                                             const RegionOfInterest* roi) {
    Frame frame = Frame::wrap(bytes, length, width, height, PIXEL_FORMAT_NV21, rotation);
    return detect(frame, roi);
}

RectangleQuality DocumentScanner::evaluateQuality(const Rectangle& rect, int refWidth, int refHeight,
                                                  QualitySpace space) const {
    return evaluator_->evaluate(rect, refWidth, refHeight, space);
}

FrameMetrics DocumentScanner::measure(const Frame& frame, const Rectangle* region) const {
    if (frame.empty()) {
        return FrameMetrics();
    }
    return evaluator_->measure(frame.toUprightGray(), region);
}

Frame DocumentScanner::warpAndCrop(const Frame& frame, const Rectangle& rect, bool* success) {
    if (success) {
        *success = false;
    }
    if (frame.empty()) {
        return Frame();
    }

    WarpResult warped = warper_->warp(frame.toUprightBgr(), rect);
    if (success) {
        *success = warped.success;
    }
    return Frame::fromMat(warped.image, PIXEL_FORMAT_BGR);
}

Rectangle DocumentScanner::mapCoordinates(const Rectangle& rect, CoordinateSpace from, CoordinateSpace to,
                                          const MappingParams& params) const {
    return mapper_->map(rect, from, to, params);
}

CaptureResult DocumentScanner::processCapture(const Frame& frame, const Rectangle* rect,
                                              const CaptureOptions& options) {
    CaptureResult result;

    if (frame.empty()) {
        result.error_message = "Invalid image data";
        return result;
    }

    cv::Mat processed = frame.toUprightBgr();
    if (processed.empty()) {
        result.error_message = "Failed to decode frame";
        return result;
    }

    // Perspective crop; the full photo is kept if it fails
    if (options.apply_crop && rect) {
        WarpResult warped = warper_->warp(processed, *rect);
        if (warped.success) {
            processed = warped.image;
            result.cropped = true;
        } else {
            DOCSCAN_LOGW(TAG, "Crop failed, keeping full %dx%d image", processed.cols, processed.rows);
            result.error_message = "Perspective correction failed";
        }
    }

    if (!options.colors.isIdentity()) {
        try {
            processed = enhancer_->applyColorControls(processed, options.colors);
            result.color_adjusted = true;
        } catch (const cv::Exception& e) {
            DOCSCAN_LOGE(TAG, "Colour controls failed: %s", e.what());
            if (!result.error_message.empty()) {
                result.error_message += "; ";
            }
            result.error_message += "Colour adjustment failed";
        }
    }

    result.image = processed;
    result.width = processed.cols;
    result.height = processed.rows;
    result.success = true;
    return result;
}
