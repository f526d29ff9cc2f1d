#ifndef DOCSCAN_QUALITY_EVALUATOR_HPP
#define DOCSCAN_QUALITY_EVALUATOR_HPP

#include <opencv2/core.hpp>

#include "detector_config.hpp"
#include "geometry.hpp"

enum RectangleQuality {
    QUALITY_GOOD = 0,
    QUALITY_BAD_ANGLE = 1,
    QUALITY_TOO_FAR = 2
};

// Reference space the rectangle and the reference size are expressed in
enum QualitySpace {
    QUALITY_SPACE_IMAGE = 0,    // absolute pixel margins, right after detection
    QUALITY_SPACE_VIEW = 1      // ratios, after mapping into the on-screen preview
};

// Advisory per-frame measurements; they do not affect the verdict
struct FrameMetrics {
    float sharpness;    // 0-1, higher is sharper
    float exposure;     // 0-1, 1 at mid-grey

    FrameMetrics() : sharpness(0), exposure(0) {}
};

class QualityEvaluator {
public:
    explicit QualityEvaluator(const QualityConfig& config = QualityConfig());
    ~QualityEvaluator();

    RectangleQuality evaluate(const Rectangle& rect, int refWidth, int refHeight,
                              QualitySpace space) const;

    RectangleQuality evaluateInImage(const Rectangle& rect, int imageWidth, int imageHeight) const;
    RectangleQuality evaluateInView(const Rectangle& rect, int viewWidth, int viewHeight) const;

    // Laplacian variance and mean brightness, optionally inside the
    // rectangle's bounding box (image space)
    FrameMetrics measure(const cv::Mat& image, const Rectangle* region = nullptr) const;

    float detectBlur(const cv::Mat& gray) const;
    float checkBrightness(const cv::Mat& gray) const;

    const QualityConfig& config() const { return config_; }

private:
    QualityConfig config_;
};

const char* qualityName(RectangleQuality quality);

#endif // DOCSCAN_QUALITY_EVALUATOR_HPP
