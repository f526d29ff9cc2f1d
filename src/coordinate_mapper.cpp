#include "coordinate_mapper.hpp"

#include <algorithm>
#include <vector>

#include "frame.hpp"

int MappingParams::sensorWidth() const {
    int r = normalizeRotation(rotation);
    return (r == 90 || r == 270) ? image_height : image_width;
}

int MappingParams::sensorHeight() const {
    int r = normalizeRotation(rotation);
    return (r == 90 || r == 270) ? image_width : image_height;
}

Point CoordinateMapper::clampPoint(const Point& pt, double width, double height) const {
    return Point(std::max(0.0, std::min(width, pt.x)),
                 std::max(0.0, std::min(height, pt.y)));
}

Rectangle CoordinateMapper::sensorToImage(const Rectangle& rect, int sensorWidth, int sensorHeight,
                                          int rotation) const {
    if (sensorWidth <= 0 || sensorHeight <= 0) {
        return rect;
    }

    int r = normalizeRotation(rotation);
    double w = sensorWidth;
    double h = sensorHeight;
    double outW = (r == 90 || r == 270) ? h : w;
    double outH = (r == 90 || r == 270) ? w : h;

    std::vector<Point> mapped;
    for (const auto& pt : rect.points()) {
        Point out;
        switch (r) {
            case 90:
                out = Point(h - 1.0 - pt.y, pt.x);
                break;
            case 180:
                out = Point(w - 1.0 - pt.x, h - 1.0 - pt.y);
                break;
            case 270:
                out = Point(pt.y, w - 1.0 - pt.x);
                break;
            default:
                out = pt;
                break;
        }
        mapped.push_back(clampPoint(out, outW, outH));
    }

    // Rotation changes which physical corner is top-left
    return orderCorners(mapped);
}

Rectangle CoordinateMapper::imageToSensor(const Rectangle& rect, int sensorWidth, int sensorHeight,
                                          int rotation) const {
    if (sensorWidth <= 0 || sensorHeight <= 0) {
        return rect;
    }

    int r = normalizeRotation(rotation);
    double w = sensorWidth;
    double h = sensorHeight;

    std::vector<Point> mapped;
    for (const auto& pt : rect.points()) {
        Point out;
        switch (r) {
            case 90:
                out = Point(pt.y, h - 1.0 - pt.x);
                break;
            case 180:
                out = Point(w - 1.0 - pt.x, h - 1.0 - pt.y);
                break;
            case 270:
                out = Point(w - 1.0 - pt.y, pt.x);
                break;
            default:
                out = pt;
                break;
        }
        mapped.push_back(clampPoint(out, w, h));
    }

    return orderCorners(mapped);
}

Rectangle CoordinateMapper::imageToView(const Rectangle& rect, int imageWidth, int imageHeight,
                                        int viewWidth, int viewHeight, ScalePolicy policy) const {
    if (imageWidth <= 0 || imageHeight <= 0 || viewWidth <= 0 || viewHeight <= 0) {
        return rect;
    }

    double sx = static_cast<double>(viewWidth) / imageWidth;
    double sy = static_cast<double>(viewHeight) / imageHeight;
    double scale = (policy == SCALE_FILL) ? std::max(sx, sy) : std::min(sx, sy);

    // Negative offsets for FILL (cropped overflow), positive for FIT (padding)
    double offsetX = (viewWidth - imageWidth * scale) / 2.0;
    double offsetY = (viewHeight - imageHeight * scale) / 2.0;

    std::vector<Point> mapped;
    for (const auto& pt : rect.points()) {
        Point out(pt.x * scale + offsetX, pt.y * scale + offsetY);
        mapped.push_back(clampPoint(out, viewWidth, viewHeight));
    }

    return Rectangle(mapped[0], mapped[1], mapped[2], mapped[3]);
}

Rectangle CoordinateMapper::viewToImage(const Rectangle& rect, int imageWidth, int imageHeight,
                                        int viewWidth, int viewHeight, ScalePolicy policy) const {
    if (imageWidth <= 0 || imageHeight <= 0 || viewWidth <= 0 || viewHeight <= 0) {
        return rect;
    }

    double sx = static_cast<double>(viewWidth) / imageWidth;
    double sy = static_cast<double>(viewHeight) / imageHeight;
    double scale = (policy == SCALE_FILL) ? std::max(sx, sy) : std::min(sx, sy);
    double offsetX = (viewWidth - imageWidth * scale) / 2.0;
    double offsetY = (viewHeight - imageHeight * scale) / 2.0;

    std::vector<Point> mapped;
    for (const auto& pt : rect.points()) {
        Point out((pt.x - offsetX) / scale, (pt.y - offsetY) / scale);
        mapped.push_back(clampPoint(out, imageWidth, imageHeight));
    }

    return Rectangle(mapped[0], mapped[1], mapped[2], mapped[3]);
}

Rectangle CoordinateMapper::scaleToSize(const Rectangle& rect, int srcWidth, int srcHeight,
                                        int dstWidth, int dstHeight) const {
    if (srcWidth <= 0 || srcHeight <= 0 || dstWidth <= 0 || dstHeight <= 0) {
        return rect;
    }

    double sx = static_cast<double>(dstWidth) / srcWidth;
    double sy = static_cast<double>(dstHeight) / srcHeight;

    std::vector<Point> mapped;
    for (const auto& pt : rect.points()) {
        mapped.push_back(clampPoint(Point(pt.x * sx, pt.y * sy), dstWidth, dstHeight));
    }

    return Rectangle(mapped[0], mapped[1], mapped[2], mapped[3]);
}

Rectangle CoordinateMapper::map(const Rectangle& rect, CoordinateSpace from, CoordinateSpace to,
                                const MappingParams& params) const {
    if (from == to) {
        return rect;
    }

    // Route everything through upright image space
    Rectangle image = rect;
    switch (from) {
        case SPACE_SENSOR:
            image = sensorToImage(rect, params.sensorWidth(), params.sensorHeight(), params.rotation);
            break;
        case SPACE_VIEW:
            image = viewToImage(rect, params.image_width, params.image_height,
                                params.view_width, params.view_height, params.policy);
            break;
        case SPACE_BITMAP:
            image = scaleToSize(rect, params.bitmap_width, params.bitmap_height,
                                params.image_width, params.image_height);
            break;
        case SPACE_IMAGE:
        default:
            break;
    }

    switch (to) {
        case SPACE_SENSOR:
            return imageToSensor(image, params.sensorWidth(), params.sensorHeight(), params.rotation);
        case SPACE_VIEW:
            return imageToView(image, params.image_width, params.image_height,
                               params.view_width, params.view_height, params.policy);
        case SPACE_BITMAP:
            return scaleToSize(image, params.image_width, params.image_height,
                               params.bitmap_width, params.bitmap_height);
        case SPACE_IMAGE:
        default:
            return image;
    }
}
