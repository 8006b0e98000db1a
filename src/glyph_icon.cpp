#include "glyph_icon.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>
#include "compositing.h"
#include "draw.h"
#include "geometry.h"
#include "icon_writer.h"
#include "palette.h"

// Highlight ring: RING_STEPS outlines, inset by one pixel each, alpha fading by RING_FADE
static const int RING_STEPS = 4;
static const int RING_ALPHA = 60;
static const int RING_FADE = 15;

static const unsigned char TWO_TONE_ALPHA = 200;

GlyphIconConfig faviconConfig() {
    GlyphIconConfig config;
    config.name = "Favicon";
    config.background = BackgroundStyle::FlatRoundedRect;
    config.glyph = GlyphStyle::SinglePolygon;
    config.supersample = 1;
    config.highlightRing = true;
    config.twoTone = true;
    config.output = OutputMode::MultiResolutionContainer;
    config.sizes = {16, 32, 48, 64};
    config.outputPath = "web/app/favicon.ico";
    config.backgroundTop = SLATE_900;
    config.backgroundBottom = SLATE_900;
    config.cornerFraction = 0.2;
    config.glyphColor = INDIGO_500;
    config.accentColor = VIOLET_500;
    return config;
}

GlyphIconConfig extensionIconConfig() {
    GlyphIconConfig config;
    config.name = "Extension icon";
    config.background = BackgroundStyle::GradientMask;
    config.glyph = GlyphStyle::MirroredArms;
    config.supersample = 4;
    config.highlightRing = false;
    config.twoTone = false;
    config.output = OutputMode::MultiFile;
    config.sizes = {16, 32, 48, 128};
    config.outputPath = "extension/icons";
    config.backgroundTop = INDIGO_TOP;
    config.backgroundBottom = INDIGO_BOTTOM;
    config.cornerFraction = 0.22;
    config.glyphColor = WHITE;
    config.accentColor = VIOLET_500;
    return config;
}

static void drawHighlightRing(Image& canvas, int radius, const Color& accent) {
    int s = canvas.width;
    for (int i = 0; i < RING_STEPS; i++) {
        int alpha = std::max(0, RING_ALPHA - i * RING_FADE);
        Image overlay = newCanvas(s, ColorMode::RGBA, TRANSPARENT);
        Color ring = {accent.r, accent.g, accent.b, static_cast<unsigned char>(alpha)};
        drawRoundedRect(overlay, Rect{i, i, s - 1 - i, s - 1 - i}, radius, ring, 1);
        canvas = compositeOver(canvas, overlay);
    }
}

Image renderGlyphIcon(const GlyphIconConfig& config, int size, const OpenCLResources* cl) {
    if (size <= 0) {
        std::cerr << "Invalid icon size: " << size << std::endl;
        return Image();
    }

    int s = size * std::max(1, config.supersample);
    Image canvas = newCanvas(s, ColorMode::RGBA, TRANSPARENT);
    int radius;

    // Background
    if (config.background == BackgroundStyle::FlatRoundedRect) {
        radius = static_cast<int>(s * config.cornerFraction);
        drawRoundedRect(canvas, Rect{0, 0, s - 1, s - 1}, radius, config.backgroundTop);
    } else {
        radius = std::max(1, static_cast<int>(s * config.cornerFraction));
        Image gradient = verticalGradient(s, config.backgroundTop, config.backgroundBottom);
        Image mask = roundedRectMask(s, config.cornerFraction);
        pasteWithMask(canvas, gradient, mask);
    }

    if (config.highlightRing) {
        drawHighlightRing(canvas, radius, config.accentColor);
    }

    // Glyph, then the lighter right half for the two-tone look
    Polygon lighterPart;
    if (config.glyph == GlyphStyle::SinglePolygon) {
        FaviconGlyph glyph = computeFaviconGlyph(s);
        drawPolygon(canvas, glyph.outline, config.glyphColor);
        lighterPart = glyph.rightHalf;
    } else {
        IconGlyph glyph = computeIconGlyph(s);
        Image layer = newCanvas(s, ColorMode::RGBA, TRANSPARENT);
        drawPolygon(layer, glyph.leftArm, config.glyphColor);
        drawPolygon(layer, glyph.rightArm, config.glyphColor);
        canvas = compositeOver(canvas, layer);
        lighterPart = glyph.rightArm;
    }

    if (config.twoTone) {
        Image overlay = newCanvas(s, ColorMode::RGBA, TRANSPARENT);
        Color tone = {config.accentColor.r, config.accentColor.g, config.accentColor.b, TWO_TONE_ALPHA};
        drawPolygon(overlay, lighterPart, tone);
        canvas = compositeOver(canvas, overlay);
    }

    if (s != size) {
        canvas = resizeImage(canvas, size, size, cl);
    }
    return canvas;
}

static std::string resolvePath(const std::string& outputRoot, const std::string& relative) {
    if (outputRoot.empty() || outputRoot == ".") return relative;
    return (std::filesystem::path(outputRoot) / relative).string();
}

std::string iconFilePath(const GlyphIconConfig& config, const std::string& outputRoot, int size) {
    return resolvePath(outputRoot, config.outputPath + "/icon-" + std::to_string(size) + ".png");
}

static std::string formatSizes(const std::vector<int>& sizes) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < sizes.size(); i++) {
        if (i) ss << ", ";
        ss << sizes[i];
    }
    ss << "]";
    return ss.str();
}

bool generateGlyphIcons(const GlyphIconConfig& config, const std::string& outputRoot,
                        const OpenCLResources* cl) {
    if (config.sizes.empty()) {
        std::cerr << "No sizes configured for " << config.name << std::endl;
        return false;
    }

    if (config.output == OutputMode::MultiResolutionContainer) {
        std::string path = resolvePath(outputRoot, config.outputPath);
        if (!ensureParentDirectory(path)) return false;

        // The writer derives the smaller entries from the largest rendering
        int largest = *std::max_element(config.sizes.begin(), config.sizes.end());
        Image icon = renderGlyphIcon(config, largest, cl);
        if (icon.empty()) return false;
        if (!writeIco(path, icon, config.sizes, cl)) return false;

        std::cout << "✓ " << config.name << " saved → " << path << std::endl;
        std::cout << "  Sizes embedded: " << formatSizes(config.sizes) << std::endl;
        return true;
    }

    for (int size : config.sizes) {
        Image icon = renderGlyphIcon(config, size, cl);
        if (icon.empty()) return false;

        std::string path = iconFilePath(config, outputRoot, size);
        if (!ensureParentDirectory(path)) return false;
        if (!savePng(path, icon)) return false;
        std::cout << "  ✓  " << path << "  (" << size << "×" << size << ")" << std::endl;
    }
    std::cout << "\nDone. All icons written to " << resolvePath(outputRoot, config.outputPath) << std::endl;
    return true;
}

bool verifyGlyphIcons(const GlyphIconConfig& config, const std::string& outputRoot) {
    if (config.output == OutputMode::MultiResolutionContainer) {
        std::string path = resolvePath(outputRoot, config.outputPath);
        std::vector<IcoEntry> entries;
        if (!readIco(path, entries)) return false;

        std::vector<int> expected = config.sizes;
        std::sort(expected.begin(), expected.end());
        expected.erase(std::unique(expected.begin(), expected.end()), expected.end());

        if (entries.size() != expected.size()) {
            std::cerr << path << ": expected " << expected.size() << " entries, found " << entries.size() << std::endl;
            return false;
        }
        for (size_t i = 0; i < entries.size(); i++) {
            const IcoEntry& e = entries[i];
            if (e.width != expected[i] || e.height != expected[i] ||
                e.image.width != expected[i] || e.image.height != expected[i]) {
                std::cerr << path << ": entry " << i << " is " << e.image.width << "x" << e.image.height
                          << ", expected " << expected[i] << "x" << expected[i] << std::endl;
                return false;
            }
        }
        std::cout << "  verified " << path << " " << formatSizes(expected) << std::endl;
        return true;
    }

    for (int size : config.sizes) {
        std::string path = iconFilePath(config, outputRoot, size);
        Image icon = loadPng(path);
        if (icon.empty()) return false;
        if (icon.width != size || icon.height != size) {
            std::cerr << path << ": " << icon.width << "x" << icon.height << ", expected "
                      << size << "x" << size << std::endl;
            return false;
        }
        std::cout << "  verified " << path << std::endl;
    }
    return true;
}
