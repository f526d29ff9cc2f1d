#ifndef DOCSCAN_GEOMETRY_HPP
#define DOCSCAN_GEOMETRY_HPP

#include <opencv2/core.hpp>
#include <vector>

// Coordinates are doubles; every function states which space it works in
// (sensor, upright image, view or bitmap). Spaces are never mixed implicitly.
typedef cv::Point2d Point;

// Four corners in canonical order. See orderCorners() for how the labels
// are assigned from an unordered point set.
struct Rectangle {
    Point topLeft;
    Point topRight;
    Point bottomLeft;
    Point bottomRight;

    Rectangle() {}
    Rectangle(const Point& tl, const Point& tr, const Point& bl, const Point& br)
        : topLeft(tl), topRight(tr), bottomLeft(bl), bottomRight(br) {}

    double topEdge() const;
    double bottomEdge() const;
    double leftEdge() const;
    double rightEdge() const;
    double perimeter() const;

    // Shoelace area of TL -> TR -> BR -> BL
    double area() const;

    // Signed variant of area(); sign gives the winding of TL -> TR -> BR -> BL
    double signedArea() const;

    // Corners as TL, TR, BL, BR
    std::vector<Point> points() const;
    std::vector<cv::Point2f> points2f() const;

    Rectangle translated(double dx, double dy) const;
    Rectangle scaled(double sx, double sy) const;

    // Finite, within +-1e6 and mutually distinct
    bool isValid() const;
};

// Axis-aligned box in upright image space
struct RegionOfInterest {
    int x;
    int y;
    int width;
    int height;

    RegionOfInterest() : x(0), y(0), width(0), height(0) {}
    RegionOfInterest(int x_, int y_, int w, int h) : x(x_), y(y_), width(w), height(h) {}

    // Intersection with [0, imageWidth) x [0, imageHeight); empty when disjoint
    cv::Rect clampTo(int imageWidth, int imageHeight) const;
};

// Sum/diff ordering, robust to rotation:
//   topLeft     = min(x + y)    bottomRight = max(x + y)
//   topRight    = min(x - y)    bottomLeft  = max(x - y)
// Ties resolve to the earliest point in the input.
Rectangle orderCorners(const std::vector<Point>& points);
Rectangle orderCorners(const std::vector<cv::Point2f>& points);
Rectangle orderCorners(const Rectangle& rect);

// Geometric labelling of an ordered rectangle. With y pointing down the
// sum/diff rule puts the upper-right point in bottomLeft; when the quad winds
// the other way (negative signedArea) topRight and bottomLeft are swapped.
Rectangle normalizeWinding(const Rectangle& rect);

double distance(const Point& a, const Point& b);

// Mean corner-to-corner distance between two rectangles (same space)
double rectangleDistance(const Rectangle& a, const Rectangle& b);

#endif // DOCSCAN_GEOMETRY_HPP
