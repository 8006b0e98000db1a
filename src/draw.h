#ifndef DRAW_H
#define DRAW_H

#include "geometry.h"
#include "image.h"

// Inclusive pixel bounds
struct Rect {
    int x0;
    int y0;
    int x1;
    int y1;
};

// Drawing primitives write the colour straight into the canvas (no blending).
// Coordinates are pixel indices: the point (x, y) is the pixel x, y.

// Even-odd scanline fill
void drawPolygon(Image& img, const Polygon& poly, const Color& color);

// outlineWidth == 0 fills the shape, otherwise draws an outline that many pixels wide
void drawRoundedRect(Image& img, const Rect& bounds, int radius, const Color& color, int outlineWidth = 0);

bool insideRoundedRect(int x, int y, const Rect& bounds, int radius);

// L-mode mask: 255 inside a rounded square covering the canvas, 0 outside
Image roundedRectMask(int size, double radiusFraction);

// RGB image, each row top + (bottom - top) * y / (size - 1), truncated per channel
Image verticalGradient(int size, const Color& top, const Color& bottom);

#endif // DRAW_H
