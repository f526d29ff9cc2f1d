#ifndef DOCSCAN_DOCUMENT_SCANNER_HPP
#define DOCSCAN_DOCUMENT_SCANNER_HPP

#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "coordinate_mapper.hpp"
#include "detector_config.hpp"
#include "document_detector.hpp"
#include "frame.hpp"
#include "geometry.hpp"
#include "image_enhancer.hpp"
#include "perspective_warper.hpp"
#include "quality_evaluator.hpp"

struct CaptureOptions {
    bool apply_crop;        // perspective warp to the supplied rectangle
    ColorControls colors;   // applied after the crop

    CaptureOptions() {
        apply_crop = true;
    }
};

struct CaptureResult {
    cv::Mat image;          // 3-channel BGR, upright
    int width;
    int height;
    bool success;
    bool cropped;           // false when no rectangle was given or the warp failed
    bool color_adjusted;
    std::string error_message;

    CaptureResult() : width(0), height(0), success(false), cropped(false), color_adjusted(false) {}
};

// Public entry point: detection, quality, warp, mapping and capture
// post-processing behind one object. Stateless between calls apart from
// configuration; the stabilizer and smoother live with the caller.
class DocumentScanner {
public:
    explicit DocumentScanner(const DetectorConfig& detectorConfig = DetectorConfig(),
                             const QualityConfig& qualityConfig = QualityConfig());
    ~DocumentScanner();

    DetectionResult detect(const Frame& frame, const RegionOfInterest* roi = nullptr);

    // NV21 camera buffer; `rotation` is the clockwise hint to upright
    DetectionResult detectInYuv(const uint8_t* bytes, size_t length,
                                int width, int height, int rotation,
                                const RegionOfInterest* roi = nullptr);

    RectangleQuality evaluateQuality(const Rectangle& rect, int refWidth, int refHeight,
                                     QualitySpace space) const;

    // Sharpness/exposure of the upright frame, optionally inside `region`
    FrameMetrics measure(const Frame& frame, const Rectangle* region = nullptr) const;

    // Upright BGR crop of the rectangle. On failure the upright frame is
    // returned unchanged and `success` (if given) is set to false.
    Frame warpAndCrop(const Frame& frame, const Rectangle& rect, bool* success = nullptr);

    Rectangle mapCoordinates(const Rectangle& rect, CoordinateSpace from, CoordinateSpace to,
                             const MappingParams& params) const;

    // Post-capture pipeline for a full-resolution photo. Only an unusable
    // frame fails; a failed crop or colour step falls back to the previous
    // image and is reported in error_message.
    CaptureResult processCapture(const Frame& frame, const Rectangle* rect,
                                 const CaptureOptions& options);

    const DetectorConfig& detectorConfig() const { return detector_->config(); }
    const QualityConfig& qualityConfig() const { return evaluator_->config(); }

private:
    std::unique_ptr<DocumentDetector> detector_;
    std::unique_ptr<QualityEvaluator> evaluator_;
    std::unique_ptr<PerspectiveWarper> warper_;
    std::unique_ptr<CoordinateMapper> mapper_;
    std::unique_ptr<ImageEnhancer> enhancer_;
};

#endif // DOCSCAN_DOCUMENT_SCANNER_HPP
