#include "compositing.h"
#include <iostream>

static unsigned char toByte(float v) {
    int i = static_cast<int>(v * 255.0f + 0.5f);
    return static_cast<unsigned char>(i < 0 ? 0 : (i > 255 ? 255 : i));
}

Image compositeOver(const Image& base, const Image& overlay) {
    if (base.channels != 4 || overlay.channels != 4 ||
        base.width != overlay.width || base.height != overlay.height) {
        std::cerr << "Cannot composite " << overlay.width << "x" << overlay.height << "x" << overlay.channels
                  << " over " << base.width << "x" << base.height << "x" << base.channels << std::endl;
        return base;
    }

    Image result = base;
    int width = base.width;
    int height = base.height;

    #pragma omp parallel for if(useOpenMP)
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            int idx = (y * width + x) * 4;
            const unsigned char* src = &overlay.data[idx];
            const unsigned char* dst = &base.data[idx];

            // Nothing to blend, keep the base pixel untouched
            if (src[3] == 0) continue;

            float srcA = src[3] / 255.0f;
            float dstA = dst[3] / 255.0f;
            float outA = srcA + dstA * (1.0f - srcA);

            unsigned char* out = &result.data[idx];
            for (int c = 0; c < 3; c++) {
                float s = src[c] / 255.0f;
                float d = dst[c] / 255.0f;
                out[c] = toByte((s * srcA + d * dstA * (1.0f - srcA)) / outA);
            }
            out[3] = toByte(outA);
        }
    }
    return result;
}

void pasteWithMask(Image& base, const Image& src, const Image& mask) {
    int width = base.width;
    int height = base.height;

    #pragma omp parallel for if(useOpenMP)
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            int m = mask.at(x, y);
            if (m == 0) continue;

            Color s = getPixel(src, x, y);
            const unsigned char sc[4] = {s.r, s.g, s.b, s.a};
            unsigned char* d = &base.data[(y * width + x) * 4];
            for (int c = 0; c < 4; c++) {
                d[c] = static_cast<unsigned char>((sc[c] * m + d[c] * (255 - m) + 127) / 255);
            }
        }
    }
}
