#include "frame.hpp"

#include <opencv2/imgproc.hpp>

Frame::Frame()
    : width_(0), height_(0), format_(PIXEL_FORMAT_BGR), rotation_(0) {}

int channelsForFormat(PixelFormat format) {
    switch (format) {
        case PIXEL_FORMAT_BGRA:
        case PIXEL_FORMAT_RGBA:
            return 4;
        case PIXEL_FORMAT_BGR:
        case PIXEL_FORMAT_RGB:
            return 3;
        case PIXEL_FORMAT_GRAY:
        case PIXEL_FORMAT_NV21:
            return 1;
    }
    CV_Error(cv::Error::StsBadArg, "Unknown pixel format");
}

size_t expectedBufferLength(int width, int height, PixelFormat format) {
    size_t pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (format == PIXEL_FORMAT_NV21) {
        return pixels + pixels / 2;
    }
    return pixels * static_cast<size_t>(channelsForFormat(format));
}

int normalizeRotation(int rotation) {
    if (rotation % 90 != 0) {
        CV_Error(cv::Error::StsBadArg,
                 cv::format("Rotation must be a multiple of 90, got %d", rotation));
    }
    int normalized = rotation % 360;
    if (normalized < 0) {
        normalized += 360;
    }
    return normalized;
}

cv::Mat rotateToUpright(const cv::Mat& src, int rotation) {
    cv::Mat result;
    switch (normalizeRotation(rotation)) {
        case 90:
            cv::rotate(src, result, cv::ROTATE_90_CLOCKWISE);
            break;
        case 180:
            cv::rotate(src, result, cv::ROTATE_180);
            break;
        case 270:
            cv::rotate(src, result, cv::ROTATE_90_COUNTERCLOCKWISE);
            break;
        default:
            result = src;
            break;
    }
    return result;
}

Frame Frame::wrap(const uint8_t* data, size_t length,
                  int width, int height,
                  PixelFormat format, int rotation) {
    int normalized = normalizeRotation(rotation);

    if (!data || length == 0 || width <= 0 || height <= 0) {
        return Frame();
    }

    size_t expected = expectedBufferLength(width, height, format);
    if (length != expected) {
        CV_Error(cv::Error::StsBadSize,
                 cv::format("Buffer length %zu does not match %dx%d (expected %zu)",
                            length, width, height, expected));
    }

    Frame frame;
    uint8_t* raw = const_cast<uint8_t*>(data);
    if (format == PIXEL_FORMAT_NV21) {
        CV_Assert(width % 2 == 0 && height % 2 == 0);
        frame.pixels_ = cv::Mat(height + height / 2, width, CV_8UC1, raw);
    } else {
        frame.pixels_ = cv::Mat(height, width, CV_8UC(channelsForFormat(format)), raw);
    }
    frame.width_ = width;
    frame.height_ = height;
    frame.format_ = format;
    frame.rotation_ = normalized;
    return frame;
}

Frame Frame::fromMat(const cv::Mat& mat, PixelFormat format, int rotation) {
    Frame frame;
    frame.rotation_ = normalizeRotation(rotation);
    frame.format_ = format;

    if (mat.empty()) {
        return frame;
    }

    CV_Assert(mat.depth() == CV_8U && mat.channels() == channelsForFormat(format));

    frame.pixels_ = mat;
    frame.width_ = mat.cols;
    frame.height_ = (format == PIXEL_FORMAT_NV21) ? mat.rows * 2 / 3 : mat.rows;
    return frame;
}

int Frame::uprightWidth() const {
    return (rotation_ == 90 || rotation_ == 270) ? height_ : width_;
}

int Frame::uprightHeight() const {
    return (rotation_ == 90 || rotation_ == 270) ? width_ : height_;
}

Frame Frame::clone() const {
    Frame copy = *this;
    copy.pixels_ = pixels_.clone();
    return copy;
}

cv::Mat Frame::toUprightBgr() const {
    if (empty()) {
        return cv::Mat();
    }

    cv::Mat bgr;
    switch (format_) {
        case PIXEL_FORMAT_BGRA:
            cv::cvtColor(pixels_, bgr, cv::COLOR_BGRA2BGR);
            break;
        case PIXEL_FORMAT_RGBA:
            cv::cvtColor(pixels_, bgr, cv::COLOR_RGBA2BGR);
            break;
        case PIXEL_FORMAT_RGB:
            cv::cvtColor(pixels_, bgr, cv::COLOR_RGB2BGR);
            break;
        case PIXEL_FORMAT_GRAY:
            cv::cvtColor(pixels_, bgr, cv::COLOR_GRAY2BGR);
            break;
        case PIXEL_FORMAT_NV21:
            cv::cvtColor(pixels_, bgr, cv::COLOR_YUV2BGR_NV21);
            break;
        case PIXEL_FORMAT_BGR:
        default:
            bgr = pixels_.clone();
            break;
    }

    return rotateToUpright(bgr, rotation_);
}

cv::Mat Frame::toUprightGray() const {
    if (empty()) {
        return cv::Mat();
    }

    cv::Mat gray;
    switch (format_) {
        case PIXEL_FORMAT_BGRA:
            cv::cvtColor(pixels_, gray, cv::COLOR_BGRA2GRAY);
            break;
        case PIXEL_FORMAT_RGBA:
            cv::cvtColor(pixels_, gray, cv::COLOR_RGBA2GRAY);
            break;
        case PIXEL_FORMAT_RGB:
            cv::cvtColor(pixels_, gray, cv::COLOR_RGB2GRAY);
            break;
        case PIXEL_FORMAT_BGR:
            cv::cvtColor(pixels_, gray, cv::COLOR_BGR2GRAY);
            break;
        case PIXEL_FORMAT_NV21:
            {
                cv::Mat rgb;
                cv::cvtColor(pixels_, rgb, cv::COLOR_YUV2RGB_NV21);
                cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
            }
            break;
        case PIXEL_FORMAT_GRAY:
        default:
            gray = pixels_.clone();
            break;
    }

    return rotateToUpright(gray, rotation_);
}
