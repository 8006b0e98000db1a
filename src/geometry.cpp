#include "geometry.h"

// Favicon proportions (fractions of the canvas size)
static const double FAVICON_MARGIN = 0.18;
static const double FAVICON_TOP = 0.22;
static const double FAVICON_BOTTOM = 0.78;
static const double FAVICON_THICKNESS = 0.13;   // half-width of each arm
static const double FAVICON_INNER_OFFSET = 1.6;
static const double FAVICON_NOTCH = 0.9;

// Icon proportions
static const double ICON_PAD = 0.16;
static const double ICON_TIP_X = 0.50;
static const double ICON_TIP_Y = 0.74;
static const double ICON_THICKNESS = 0.175;
static const double ICON_APEX_OUTER = 0.38;
static const double ICON_APEX_INNER = 0.55;

FaviconGlyph computeFaviconGlyph(int size) {
    double s = size;
    double margin = s * FAVICON_MARGIN;
    double topY = s * FAVICON_TOP;
    double botY = s * FAVICON_BOTTOM;
    double midX = s / 2;
    double thick = s * FAVICON_THICKNESS;

    double leftOuterX = margin;
    double leftInnerX = margin + thick * FAVICON_INNER_OFFSET;
    double rightOuterX = s - margin;
    double rightInnerX = s - margin - thick * FAVICON_INNER_OFFSET;

    FaviconGlyph glyph;
    glyph.outline = {
        {leftOuterX, topY},
        {leftInnerX, topY},
        {midX, botY - thick * FAVICON_NOTCH},   // bottom inner
        {rightInnerX, topY},
        {rightOuterX, topY},
        {midX, botY}                            // bottom tip
    };
    glyph.rightHalf = {
        {midX, topY},
        {rightInnerX, topY},
        {rightOuterX, topY},
        {midX, botY}
    };
    return glyph;
}

IconGlyph computeIconGlyph(int size) {
    double s = size;
    double pad = s * ICON_PAD;
    double tipX = s * ICON_TIP_X;
    double tipY = s * ICON_TIP_Y;
    double thick = s * ICON_THICKNESS;

    IconGlyph glyph;
    glyph.centerX = tipX;
    glyph.leftArm = {
        {pad, pad},                                  // outer top-left
        {pad + thick, pad},                          // inner top-left
        {tipX, tipY - thick * ICON_APEX_INNER},      // apex inner
        {tipX - thick * ICON_APEX_OUTER, tipY}       // apex outer
    };
    glyph.rightArm = mirrorPolygon(glyph.leftArm, tipX);
    return glyph;
}

Polygon mirrorPolygon(const Polygon& poly, double centerX) {
    Polygon mirrored;
    mirrored.reserve(poly.size());
    for (const Point& p : poly) {
        mirrored.push_back({2 * centerX - p.x, p.y});
    }
    return mirrored;
}
