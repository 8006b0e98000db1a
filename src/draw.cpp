#include "draw.h"

#include <algorithm>
#include <cmath>

void drawPolygon(Image& img, const Polygon& poly, const Color& color) {
    if (poly.size() < 3) return;

    double minY = poly[0].y;
    double maxY = poly[0].y;
    for (const Point& p : poly) {
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }

    int yStart = std::max(0, static_cast<int>(std::ceil(minY)));
    int yEnd = std::min(img.height - 1, static_cast<int>(std::floor(maxY)));
    std::vector<double> crossings;

    for (int y = yStart; y <= yEnd; y++) {
        crossings.clear();

        // Half-open edges so shared vertices are counted once
        for (size_t i = 0; i < poly.size(); i++) {
            const Point& a = poly[i];
            const Point& b = poly[(i + 1) % poly.size()];
            if (a.y == b.y) continue;

            bool crosses = (a.y <= y && y < b.y) || (b.y <= y && y < a.y);
            if (!crosses) continue;

            crossings.push_back(a.x + (y - a.y) * (b.x - a.x) / (b.y - a.y));
        }

        std::sort(crossings.begin(), crossings.end());
        for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
            int xa = std::max(0, static_cast<int>(std::ceil(crossings[i])));
            int xb = std::min(img.width - 1, static_cast<int>(std::floor(crossings[i + 1])));
            for (int x = xa; x <= xb; x++) {
                setPixel(img, x, y, color);
            }
        }
    }
}

bool insideRoundedRect(int x, int y, const Rect& bounds, int radius) {
    if (x < bounds.x0 || x > bounds.x1 || y < bounds.y0 || y > bounds.y1) return false;

    int r = std::min(radius, std::min((bounds.x1 - bounds.x0) / 2, (bounds.y1 - bounds.y0) / 2));
    if (r <= 0) return true;

    // Nearest point of the inner rectangle spanned by the four corner centres
    int cx = std::min(std::max(x, bounds.x0 + r), bounds.x1 - r);
    int cy = std::min(std::max(y, bounds.y0 + r), bounds.y1 - r);
    long dx = x - cx;
    long dy = y - cy;
    return dx * dx + dy * dy <= static_cast<long>(r) * r;
}

void drawRoundedRect(Image& img, const Rect& bounds, int radius, const Color& color, int outlineWidth) {
    Rect inner = {bounds.x0 + outlineWidth, bounds.y0 + outlineWidth,
                  bounds.x1 - outlineWidth, bounds.y1 - outlineWidth};
    int innerRadius = std::max(0, radius - outlineWidth);

    int yStart = std::max(0, bounds.y0);
    int yEnd = std::min(img.height - 1, bounds.y1);
    int xStart = std::max(0, bounds.x0);
    int xEnd = std::min(img.width - 1, bounds.x1);

    for (int y = yStart; y <= yEnd; y++) {
        for (int x = xStart; x <= xEnd; x++) {
            if (!insideRoundedRect(x, y, bounds, radius)) continue;
            if (outlineWidth > 0 && inner.x0 <= inner.x1 && inner.y0 <= inner.y1 &&
                insideRoundedRect(x, y, inner, innerRadius)) {
                continue;
            }
            setPixel(img, x, y, color);
        }
    }
}

Image roundedRectMask(int size, double radiusFraction) {
    Image mask = newCanvas(size, ColorMode::L);
    int radius = std::max(1, static_cast<int>(size * radiusFraction));
    drawRoundedRect(mask, Rect{0, 0, size - 1, size - 1}, radius, Color{255, 255, 255, 255});
    return mask;
}

Image verticalGradient(int size, const Color& top, const Color& bottom) {
    Image img = newCanvas(size, ColorMode::RGB);

    #pragma omp parallel for if(useOpenMP)
    for (int y = 0; y < size; y++) {
        double t = size > 1 ? static_cast<double>(y) / (size - 1) : 0.0;
        Color row = {
            static_cast<unsigned char>(top.r + (bottom.r - top.r) * t),
            static_cast<unsigned char>(top.g + (bottom.g - top.g) * t),
            static_cast<unsigned char>(top.b + (bottom.b - top.b) * t),
            255
        };
        for (int x = 0; x < size; x++) {
            setPixel(img, x, y, row);
        }
    }
    return img;
}
