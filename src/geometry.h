#ifndef GEOMETRY_H
#define GEOMETRY_H

#include <vector>

struct Point {
    double x;
    double y;
};

// Closed implicitly: the fill connects the last point back to the first
typedef std::vector<Point> Polygon;

// Favicon "V": one six-point outline plus the right half used for the two-tone overlay
struct FaviconGlyph {
    Polygon outline;
    Polygon rightHalf;
};

// Icon "V": two four-point arms, the right one mirrored from the left
struct IconGlyph {
    Polygon leftArm;
    Polygon rightArm;
    double centerX;
};

// Every coordinate is size * constant, so glyphs are similar across sizes
FaviconGlyph computeFaviconGlyph(int size);
IconGlyph computeIconGlyph(int size);

// Reflect every point across the vertical line x = centerX
Polygon mirrorPolygon(const Polygon& poly, double centerX);

#endif // GEOMETRY_H
