#ifndef DOCSCAN_IMAGE_ENHANCER_HPP
#define DOCSCAN_IMAGE_ENHANCER_HPP

#include <opencv2/core.hpp>

struct ColorControls {
    float brightness;   // -1..1, added as brightness * 255
    float contrast;     // multiplier, 1 = unchanged
    float saturation;   // multiplier, 1 = unchanged

    ColorControls() {
        brightness = 0.0f;
        contrast = 1.0f;
        saturation = 1.0f;
    }

    bool isIdentity() const {
        return brightness == 0.0f && contrast == 1.0f && saturation == 1.0f;
    }
};

class ImageEnhancer {
public:
    ImageEnhancer();
    ~ImageEnhancer();

    // Contrast Limited Adaptive Histogram Equalization. Grayscale input is
    // equalized directly; colour input on the L channel of Lab.
    cv::Mat applyCLAHE(const cv::Mat& input, double clipLimit = 2.5, int tileSize = 8);

    // Saturation in HSV, then contrast/brightness as a linear transform.
    // Identity controls return an unchanged copy.
    cv::Mat applyColorControls(const cv::Mat& input, const ColorControls& controls);

private:
    cv::Mat adjustSaturation(const cv::Mat& input, float saturation);
};

#endif // DOCSCAN_IMAGE_ENHANCER_HPP
