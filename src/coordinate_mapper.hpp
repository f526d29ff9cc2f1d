#ifndef DOCSCAN_COORDINATE_MAPPER_HPP
#define DOCSCAN_COORDINATE_MAPPER_HPP

#include "geometry.hpp"

enum CoordinateSpace {
    SPACE_SENSOR = 0,   // raw buffer as delivered, before the rotation hint
    SPACE_IMAGE = 1,    // upright image, the space detect() reports in
    SPACE_VIEW = 2,     // on-screen preview viewport
    SPACE_BITMAP = 3    // arbitrary destination bitmap (e.g. the captured photo)
};

enum ScalePolicy {
    SCALE_FILL = 0,     // crop-to-fill: scale = max(sx, sy), centered
    SCALE_FIT = 1       // letterbox: scale = min(sx, sy), centered with padding
};

struct MappingParams {
    int image_width;    // upright image size
    int image_height;
    int rotation;       // clockwise degrees taking sensor space to image space
    int view_width;
    int view_height;
    ScalePolicy policy;
    int bitmap_width;
    int bitmap_height;

    MappingParams()
        : image_width(0), image_height(0), rotation(0),
          view_width(0), view_height(0), policy(SCALE_FILL),
          bitmap_width(0), bitmap_height(0) {}

    int sensorWidth() const;
    int sensorHeight() const;
};

// Pure coordinate transforms. Every result is clamped to the destination
// bounds and returned in canonical corner order. When a size needed for a
// mapping is zero the input rectangle is returned unchanged.
class CoordinateMapper {
public:
    Rectangle map(const Rectangle& rect, CoordinateSpace from, CoordinateSpace to,
                  const MappingParams& params) const;

    // Pixel-index rotation, matching cv::rotate on the buffer
    Rectangle sensorToImage(const Rectangle& rect, int sensorWidth, int sensorHeight, int rotation) const;
    Rectangle imageToSensor(const Rectangle& rect, int sensorWidth, int sensorHeight, int rotation) const;

    Rectangle imageToView(const Rectangle& rect, int imageWidth, int imageHeight,
                          int viewWidth, int viewHeight, ScalePolicy policy) const;
    Rectangle viewToImage(const Rectangle& rect, int imageWidth, int imageHeight,
                          int viewWidth, int viewHeight, ScalePolicy policy) const;

    // Independent X/Y scale, no aspect correction
    Rectangle scaleToSize(const Rectangle& rect, int srcWidth, int srcHeight,
                          int dstWidth, int dstHeight) const;

private:
    Point clampPoint(const Point& pt, double width, double height) const;
};

#endif // DOCSCAN_COORDINATE_MAPPER_HPP
