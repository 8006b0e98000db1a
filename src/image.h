#ifndef IMAGE_H
#define IMAGE_H

#include <vector>

// Run the per-row pixel loops with OpenMP
extern bool useOpenMP;

// Channel layout of a canvas
enum class ColorMode {
    L = 1,      // single channel, used for masks
    RGB = 3,
    RGBA = 4
};

struct Color {
    unsigned char r;
    unsigned char g;
    unsigned char b;
    unsigned char a;
};

// Structure to represent an image, rows stored top to bottom, channels interleaved
struct Image {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<unsigned char> data;

    unsigned char at(int x, int y, int c = 0) const {
        return data[(y * width + x) * channels + c];
    }

    bool empty() const {
        return data.empty();
    }
};

// Square canvas of the given size, every pixel set to fill
Image newCanvas(int size, ColorMode mode, Color fill = {0, 0, 0, 0});

// Writes color as is, no blending. Out of range coordinates are ignored.
void setPixel(Image& img, int x, int y, const Color& color);

// Pixel as RGBA; L and RGB canvases report alpha 255
Color getPixel(const Image& img, int x, int y);

#endif // IMAGE_H
