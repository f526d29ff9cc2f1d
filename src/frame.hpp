#ifndef DOCSCAN_FRAME_HPP
#define DOCSCAN_FRAME_HPP

#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>

enum PixelFormat {
    PIXEL_FORMAT_BGRA = 0,
    PIXEL_FORMAT_BGR = 1,
    PIXEL_FORMAT_RGB = 2,
    PIXEL_FORMAT_GRAY = 3,
    PIXEL_FORMAT_NV21 = 4,  // Y plane followed by interleaved VU, 4:2:0
    PIXEL_FORMAT_RGBA = 5
};

// Immutable view over one camera frame or photo.
//
// A Frame built with wrap() references the caller's buffer and must not
// outlive it; the detector never keeps a Frame past the call it was given to.
// Frames produced by the library (warp output, clone()) own their pixels.
class Frame {
public:
    Frame();

    // Returns an empty frame for a null/empty buffer or a zero-area size.
    // Throws cv::Exception when the buffer length does not match
    // width x height for the format, or the rotation is not a multiple of 90.
    static Frame wrap(const uint8_t* data, size_t length,
                      int width, int height,
                      PixelFormat format, int rotation = 0);

    // Shares the matrix; for NV21 the matrix is (height * 3 / 2) x width
    static Frame fromMat(const cv::Mat& mat, PixelFormat format, int rotation = 0);

    int width() const { return width_; }
    int height() const { return height_; }
    PixelFormat format() const { return format_; }
    int rotation() const { return rotation_; }
    bool empty() const { return pixels_.empty(); }

    // Size after the rotation hint is applied
    int uprightWidth() const;
    int uprightHeight() const;

    const cv::Mat& pixels() const { return pixels_; }

    Frame clone() const;

    // Decoded and rotated to upright orientation, 3-channel BGR
    cv::Mat toUprightBgr() const;

    // Decoded, grayscale, rotated to upright orientation
    cv::Mat toUprightGray() const;

private:
    cv::Mat pixels_;
    int width_;
    int height_;
    PixelFormat format_;
    int rotation_;
};

int channelsForFormat(PixelFormat format);
size_t expectedBufferLength(int width, int height, PixelFormat format);

// Maps any multiple of 90 (including negatives) onto 0/90/180/270.
// Throws cv::Exception for other values.
int normalizeRotation(int rotation);

// Clockwise rotation by 0/90/180/270 degrees
cv::Mat rotateToUpright(const cv::Mat& src, int rotation);

#endif // DOCSCAN_FRAME_HPP
