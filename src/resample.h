#ifndef RESAMPLE_H
#define RESAMPLE_H

#include <vector>
#include "image.h"

// Lanczos (a = 3) filter weights for one axis. Output pixel i reads
// bounds[2*i + 1] input pixels starting at bounds[2*i], with weights
// weights[i * kernelSize + k]. Weights of each output pixel sum to 1.
struct ResampleCoefficients {
    int inSize;
    int outSize;
    int kernelSize;
    std::vector<int> bounds;
    std::vector<float> weights;
};

ResampleCoefficients computeLanczosCoefficients(int inSize, int outSize);

// L, RGB or RGBA bytes to premultiplied RGBA floats (colour scaled by alpha, 0..255 range)
std::vector<float> premultiply(const Image& img);

// Premultiplied floats back to an RGBA image, clamped and rounded
Image unpremultiply(const std::vector<float>& pixels, int width, int height);

// Downsample (or upsample) an RGBA image with a separable Lanczos filter on the CPU
Image resizeLanczos(const Image& src, int dstWidth, int dstHeight);

#endif // RESAMPLE_H
