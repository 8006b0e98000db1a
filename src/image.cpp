#include "image.h"

bool useOpenMP = false;

Image newCanvas(int size, ColorMode mode, Color fill) {
    Image img;
    img.width = size;
    img.height = size;
    img.channels = static_cast<int>(mode);
    img.data.resize(size * size * img.channels);

    for (int i = 0; i < size * size; i++) {
        unsigned char* p = &img.data[i * img.channels];
        if (mode == ColorMode::L) {
            p[0] = fill.r;
            continue;
        }
        p[0] = fill.r;
        p[1] = fill.g;
        p[2] = fill.b;
        if (mode == ColorMode::RGBA) p[3] = fill.a;
    }
    return img;
}

void setPixel(Image& img, int x, int y, const Color& color) {
    if (x < 0 || y < 0 || x >= img.width || y >= img.height) return;

    unsigned char* p = &img.data[(y * img.width + x) * img.channels];
    if (img.channels == 1) {
        p[0] = color.r;
        return;
    }
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
    if (img.channels == 4) p[3] = color.a;
}

Color getPixel(const Image& img, int x, int y) {
    const unsigned char* p = &img.data[(y * img.width + x) * img.channels];
    if (img.channels == 1) return Color{p[0], p[0], p[0], 255};
    if (img.channels == 3) return Color{p[0], p[1], p[2], 255};
    return Color{p[0], p[1], p[2], p[3]};
}
