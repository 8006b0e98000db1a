#ifndef GLYPH_ICON_H
#define GLYPH_ICON_H

#include <string>
#include <vector>
#include "image.h"
#include "resample_opencl.h"

enum class BackgroundStyle {
    FlatRoundedRect,    // solid fill of a rounded square
    GradientMask        // vertical gradient clipped by a rounded-square mask
};

enum class GlyphStyle {
    SinglePolygon,      // six-point "V" filled straight onto the canvas
    MirroredArms        // two mirrored arms on their own layer, composited over
};

enum class OutputMode {
    MultiResolutionContainer,   // one ICO embedding every size
    MultiFile                   // one PNG per size
};

// One configuration of the "V" icon pipeline
struct GlyphIconConfig {
    std::string name;
    BackgroundStyle background;
    GlyphStyle glyph;
    int supersample;            // 1 draws at the target size directly
    bool highlightRing;
    bool twoTone;
    OutputMode output;
    std::vector<int> sizes;
    std::string outputPath;     // ICO file, or the directory receiving icon-{size}.png

    Color backgroundTop;        // flat fill, or first gradient colour
    Color backgroundBottom;
    double cornerFraction;      // gradient mask radius as a fraction of the size
    Color glyphColor;
    Color accentColor;          // highlight ring and two-tone overlay
};

// web/app/favicon.ico: flat slate square, highlight ring, indigo V with violet right half
GlyphIconConfig faviconConfig();

// extension/icons/icon-{size}.png: indigo gradient square, white V, 4x supersampled
GlyphIconConfig extensionIconConfig();

// Fully composited RGBA canvas of size x size. Empty image for size <= 0.
Image renderGlyphIcon(const GlyphIconConfig& config, int size, const OpenCLResources* cl = nullptr);

// Render and write every artifact of config under outputRoot. Stops at the first failure.
bool generateGlyphIcons(const GlyphIconConfig& config, const std::string& outputRoot,
                        const OpenCLResources* cl = nullptr);

// Re-read the artifacts of config and check their sizes
bool verifyGlyphIcons(const GlyphIconConfig& config, const std::string& outputRoot);

// Path of the PNG written for one size in multi-file mode
std::string iconFilePath(const GlyphIconConfig& config, const std::string& outputRoot, int size);

#endif // GLYPH_ICON_H
