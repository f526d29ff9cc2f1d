#include "result_json.hpp"

#include <cstdarg>
#include <cstdio>

static void append_fmt(std::string& s, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    s += buf;
}

static const char* passString(DetectionPass pass) {
    switch (pass) {
        case DETECTION_PASS_CANNY: return "canny";
        case DETECTION_PASS_ADAPTIVE: return "adaptive";
        default: return "none";
    }
}

static const char* kindString(CandidateKind kind) {
    switch (kind) {
        case CANDIDATE_POLYGON: return "polygon";
        case CANDIDATE_ROTATED_BOX: return "rotated_box";
        default: return "none";
    }
}

std::string rectangleToJson(const Rectangle& rect) {
    std::string json = "[";
    std::vector<Point> pts = rect.points();
    for (size_t i = 0; i < pts.size(); i++) {
        append_fmt(json, "%.2f,%.2f", pts[i].x, pts[i].y);
        if (i + 1 < pts.size()) json += ",";
    }
    json += "]";
    return json;
}

std::string detectionToJson(const DetectionResult& result,
                            RectangleQuality quality,
                            const FrameMetrics* metrics) {
    std::string json;
    json.reserve(512);

    json += "{";
    json += result.found ? "\"found\":true," : "\"found\":false,";
    append_fmt(json, "\"frame_width\":%d,", result.frame_width);
    append_fmt(json, "\"frame_height\":%d,", result.frame_height);

    if (result.found) {
        json += "\"corners\":";
        json += rectangleToJson(result.rectangle);
        json += ",";
        append_fmt(json, "\"quality\":\"%s\",", qualityName(quality));
        append_fmt(json, "\"area\":%.1f,", result.rectangle.area());
    }

    append_fmt(json, "\"pass\":\"%s\",", passString(result.pass));
    append_fmt(json, "\"kind\":\"%s\",", kindString(result.kind));
    json += result.refined ? "\"refined\":true," : "\"refined\":false,";
    append_fmt(json, "\"canny_low\":%.1f,", result.canny.low);
    append_fmt(json, "\"canny_high\":%.1f,", result.canny.high);
    append_fmt(json, "\"contour_count\":%d,", result.contour_count);
    append_fmt(json, "\"candidate_count\":%d,", result.candidate_count);
    append_fmt(json, "\"best_score\":%.1f", result.best_score);

    if (metrics) {
        append_fmt(json, ",\"sharpness\":%.4f", metrics->sharpness);
        append_fmt(json, ",\"exposure\":%.4f", metrics->exposure);
    }

    json += "}";
    return json;
}
