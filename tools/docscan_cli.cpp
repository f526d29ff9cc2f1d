#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cstdio>
#include <string>

#include "document_scanner.hpp"
#include "log.hpp"
#include "result_json.hpp"

static const char* TAG = "docscan";

static const char* kKeys =
    "{help h usage ? |      | print this message }"
    "{@input         |      | image to scan }"
    "{o output       |      | write the cropped document here }"
    "{r rotation     | 0    | clockwise rotation to apply before detection }"
    "{roi            |      | search region x,y,w,h in upright coordinates }"
    "{w width        | 0    | processing width, 0 keeps full resolution }"
    "{no-fallback    |      | disable the adaptive-threshold pass }"
    "{brightness     | 0    | output brightness, -1..1 }"
    "{contrast       | 1    | output contrast multiplier }"
    "{saturation     | 1    | output saturation multiplier }"
    "{v verbose      |      | debug logging }";

static bool parseRoi(const std::string& text, RegionOfInterest* roi) {
    int x = 0, y = 0, w = 0, h = 0;
    if (std::sscanf(text.c_str(), "%d,%d,%d,%d", &x, &y, &w, &h) != 4) {
        return false;
    }
    *roi = RegionOfInterest(x, y, w, h);
    return true;
}

int main(int argc, char** argv) {
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("Detects a document in a photo and prints the result as JSON");

    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    std::string input = parser.get<std::string>("@input");
    int rotation = parser.get<int>("rotation");
    std::string roiText = parser.get<std::string>("roi");
    std::string output = parser.get<std::string>("output");

    ColorControls colors;
    colors.brightness = parser.get<float>("brightness");
    colors.contrast = parser.get<float>("contrast");
    colors.saturation = parser.get<float>("saturation");

    DetectorConfig config;
    config.processing_width = parser.get<int>("width");
    config.enable_fallback_pass = !parser.has("no-fallback");

    if (!parser.check()) {
        parser.printErrors();
        return 2;
    }
    if (input.empty()) {
        parser.printMessage();
        return 2;
    }

    setLogLevel(parser.has("verbose") ? LOG_LEVEL_DEBUG : LOG_LEVEL_WARN);

    RegionOfInterest roi;
    bool hasRoi = !roiText.empty();
    if (hasRoi && !parseRoi(roiText, &roi)) {
        DOCSCAN_LOGE(TAG, "Bad --roi '%s', expected x,y,w,h", roiText.c_str());
        return 2;
    }

    cv::Mat image = cv::imread(input, cv::IMREAD_COLOR);
    if (image.empty()) {
        DOCSCAN_LOGE(TAG, "Cannot read %s", input.c_str());
        return 1;
    }

    try {
        DocumentScanner scanner(config);
        Frame frame = Frame::fromMat(image, PIXEL_FORMAT_BGR, rotation);

        DetectionResult result = scanner.detect(frame, hasRoi ? &roi : nullptr);
        RectangleQuality quality = QUALITY_TOO_FAR;
        if (result.found) {
            quality = scanner.evaluateQuality(result.rectangle, result.frame_width,
                                              result.frame_height, QUALITY_SPACE_IMAGE);
        }
        FrameMetrics metrics = scanner.measure(frame, result.found ? &result.rectangle : nullptr);

        std::printf("%s\n", detectionToJson(result, quality, &metrics).c_str());

        if (!output.empty()) {
            CaptureOptions options;
            options.apply_crop = result.found;
            options.colors = colors;
            CaptureResult capture = scanner.processCapture(frame, result.found ? &result.rectangle : nullptr,
                                                           options);
            if (!capture.success) {
                DOCSCAN_LOGE(TAG, "Capture failed: %s", capture.error_message.c_str());
                return 1;
            }
            if (!capture.error_message.empty()) {
                DOCSCAN_LOGW(TAG, "%s", capture.error_message.c_str());
            }
            if (!cv::imwrite(output, capture.image)) {
                DOCSCAN_LOGE(TAG, "Cannot write %s", output.c_str());
                return 1;
            }
            DOCSCAN_LOGI(TAG, "Wrote %dx%d to %s", capture.width, capture.height, output.c_str());
        }
    } catch (const cv::Exception& e) {
        DOCSCAN_LOGE(TAG, "%s", e.what());
        return 1;
    }

    return 0;
}
