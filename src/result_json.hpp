#ifndef DOCSCAN_RESULT_JSON_HPP
#define DOCSCAN_RESULT_JSON_HPP

#include <string>

#include "document_detector.hpp"
#include "quality_evaluator.hpp"

// Flat JSON for tooling and host bridges. Corners are emitted as
// [x0,y0,...,x3,y3] in TL, TR, BL, BR order.
std::string detectionToJson(const DetectionResult& result,
                            RectangleQuality quality,
                            const FrameMetrics* metrics = nullptr);

std::string rectangleToJson(const Rectangle& rect);

#endif // DOCSCAN_RESULT_JSON_HPP
