#include "resample.h"

#include <algorithm>
#include <cmath>

static const double PI = 3.14159265358979323846;
static const double LANCZOS_SUPPORT = 3.0;

static double sinc(double x) {
    if (x == 0.0) return 1.0;
    x *= PI;
    return std::sin(x) / x;
}

static double lanczos(double x) {
    if (x > -LANCZOS_SUPPORT && x < LANCZOS_SUPPORT) {
        return sinc(x) * sinc(x / LANCZOS_SUPPORT);
    }
    return 0.0;
}

ResampleCoefficients computeLanczosCoefficients(int inSize, int outSize) {
    ResampleCoefficients coeffs;
    coeffs.inSize = inSize;
    coeffs.outSize = outSize;

    // Widen the filter when shrinking so every input pixel contributes
    double scale = static_cast<double>(inSize) / outSize;
    double filterScale = std::max(scale, 1.0);
    double support = LANCZOS_SUPPORT * filterScale;

    coeffs.kernelSize = static_cast<int>(std::ceil(support)) * 2 + 1;
    coeffs.bounds.resize(outSize * 2);
    coeffs.weights.assign(outSize * coeffs.kernelSize, 0.0f);

    for (int xx = 0; xx < outSize; xx++) {
        double center = (xx + 0.5) * scale;
        int xmin = std::max(static_cast<int>(center - support + 0.5), 0);
        int xmax = std::min(static_cast<int>(center + support + 0.5), inSize) - xmin;
        xmax = std::min(xmax, coeffs.kernelSize);

        std::vector<double> k(xmax);
        double total = 0.0;
        for (int x = 0; x < xmax; x++) {
            k[x] = lanczos((x + xmin - center + 0.5) / filterScale);
            total += k[x];
        }
        for (int x = 0; x < xmax; x++) {
            coeffs.weights[xx * coeffs.kernelSize + x] = static_cast<float>(total != 0.0 ? k[x] / total : k[x]);
        }
        coeffs.bounds[xx * 2] = xmin;
        coeffs.bounds[xx * 2 + 1] = xmax;
    }
    return coeffs;
}

std::vector<float> premultiply(const Image& img) {
    std::vector<float> pixels(img.width * img.height * 4);
    // L and RGB sources read as opaque
    for (int y = 0; y < img.height; y++) {
        for (int x = 0; x < img.width; x++) {
            Color c = getPixel(img, x, y);
            float a = c.a;
            float* p = &pixels[(y * img.width + x) * 4];
            p[0] = c.r * a / 255.0f;
            p[1] = c.g * a / 255.0f;
            p[2] = c.b * a / 255.0f;
            p[3] = a;
        }
    }
    return pixels;
}

static unsigned char clampByte(float v) {
    int i = static_cast<int>(std::floor(v + 0.5f));
    return static_cast<unsigned char>(i < 0 ? 0 : (i > 255 ? 255 : i));
}

Image unpremultiply(const std::vector<float>& pixels, int width, int height) {
    Image img;
    img.width = width;
    img.height = height;
    img.channels = 4;
    img.data.resize(width * height * 4);

    for (int i = 0; i < width * height; i++) {
        const float* p = &pixels[i * 4];
        unsigned char a = clampByte(p[3]);
        unsigned char* out = &img.data[i * 4];
        out[3] = a;
        if (a == 0) {
            out[0] = out[1] = out[2] = 0;
            continue;
        }
        for (int c = 0; c < 3; c++) {
            out[c] = clampByte(p[c] * 255.0f / a);
        }
    }
    return img;
}

// One separable pass. Horizontal when the rows are kept, vertical otherwise.
static std::vector<float> resamplePass(const std::vector<float>& input, int inWidth, int inHeight,
                                       const ResampleCoefficients& coeffs, bool horizontal) {
    int outWidth = horizontal ? coeffs.outSize : inWidth;
    int outHeight = horizontal ? inHeight : coeffs.outSize;
    std::vector<float> output(outWidth * outHeight * 4, 0.0f);

    #pragma omp parallel for if(useOpenMP)
    for (int y = 0; y < outHeight; y++) {
        for (int x = 0; x < outWidth; x++) {
            int i = horizontal ? x : y;
            int start = coeffs.bounds[i * 2];
            int count = coeffs.bounds[i * 2 + 1];
            const float* w = &coeffs.weights[i * coeffs.kernelSize];

            float sum[4] = {0.0f, 0.0f, 0.0f, 0.0f};
            for (int k = 0; k < count; k++) {
                int sx = horizontal ? start + k : x;
                int sy = horizontal ? y : start + k;
                const float* p = &input[(sy * inWidth + sx) * 4];
                for (int c = 0; c < 4; c++) {
                    sum[c] += p[c] * w[k];
                }
            }
            float* out = &output[(y * outWidth + x) * 4];
            for (int c = 0; c < 4; c++) {
                out[c] = sum[c];
            }
        }
    }
    return output;
}

Image resizeLanczos(const Image& src, int dstWidth, int dstHeight) {
    if (src.width == dstWidth && src.height == dstHeight) return src;

    ResampleCoefficients horizontal = computeLanczosCoefficients(src.width, dstWidth);
    ResampleCoefficients vertical = computeLanczosCoefficients(src.height, dstHeight);

    std::vector<float> pixels = premultiply(src);
    std::vector<float> rows = resamplePass(pixels, src.width, src.height, horizontal, true);
    std::vector<float> resized = resamplePass(rows, dstWidth, src.height, vertical, false);

    return unpremultiply(resized, dstWidth, dstHeight);
}
