#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "compositing.h"
#include "draw.h"
#include "geometry.h"
#include "glyph_icon.h"
#include "icon_writer.h"
#include "image.h"
#include "palette.h"
#include "resample.h"
#include "resample_opencl.h"

#ifndef VAULTY_KERNEL_DIR
#define VAULTY_KERNEL_DIR "src/kernels"
#endif

static bool Near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

static std::filesystem::path FreshTempDir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir;
}

static double ColorDistance(const double avg[3], const Color& c) {
    double dr = avg[0] - c.r;
    double dg = avg[1] - c.g;
    double db = avg[2] - c.b;
    return dr * dr + dg * dg + db * db;
}

// Alpha-weighted average colour of one row
static void RowAverage(const Image& img, int y, double avg[3]) {
    double sum[3] = {0, 0, 0};
    double weight = 0;
    for (int x = 0; x < img.width; x++) {
        Color c = getPixel(img, x, y);
        sum[0] += c.r * c.a;
        sum[1] += c.g * c.a;
        sum[2] += c.b * c.a;
        weight += c.a;
    }
    assert(weight > 0);
    for (int i = 0; i < 3; i++) avg[i] = sum[i] / weight;
}

static void TestFaviconGlyphVertices() {
    FaviconGlyph g = computeFaviconGlyph(64);
    assert(g.outline.size() == 6);
    assert(g.rightHalf.size() == 4);

    assert(Near(g.outline[0].x, 11.52) && Near(g.outline[0].y, 14.08));
    assert(Near(g.outline[1].x, 24.832) && Near(g.outline[1].y, 14.08));
    assert(Near(g.outline[2].x, 32.0) && Near(g.outline[2].y, 42.432));
    assert(Near(g.outline[3].x, 39.168) && Near(g.outline[3].y, 14.08));
    assert(Near(g.outline[4].x, 52.48) && Near(g.outline[4].y, 14.08));
    assert(Near(g.outline[5].x, 32.0) && Near(g.outline[5].y, 49.92));

    assert(Near(g.rightHalf[0].x, 32.0));
    assert(Near(g.rightHalf[3].y, 49.92));
}

static void TestIconArmsAreMirrored() {
    IconGlyph g = computeIconGlyph(512);
    assert(g.leftArm.size() == 4);
    assert(g.rightArm.size() == g.leftArm.size());
    assert(Near(g.centerX, 256.0));

    for (size_t i = 0; i < g.leftArm.size(); i++) {
        assert(g.rightArm[i].x == 2 * g.centerX - g.leftArm[i].x);
        assert(g.rightArm[i].y == g.leftArm[i].y);
    }

    // Left arm starts at the outer pad corner, ends at the apex outer point
    assert(Near(g.leftArm[0].x, 512 * 0.16) && Near(g.leftArm[0].y, 512 * 0.16));
    assert(Near(g.leftArm[3].x, 256 - 512 * 0.175 * 0.38));
    assert(Near(g.leftArm[3].y, 512 * 0.74));
}

static void TestGlyphScalesWithSize() {
    const int sizes[][2] = {{16, 32}, {16, 128}, {48, 64}, {64, 512}};
    for (const auto& pair : sizes) {
        double k = static_cast<double>(pair[1]) / pair[0];
        double c1 = pair[0] / 2.0;
        double c2 = pair[1] / 2.0;

        FaviconGlyph f1 = computeFaviconGlyph(pair[0]);
        FaviconGlyph f2 = computeFaviconGlyph(pair[1]);
        for (size_t i = 0; i < f1.outline.size(); i++) {
            assert(Near(f2.outline[i].x, c2 + (f1.outline[i].x - c1) * k, 1e-6));
            assert(Near(f2.outline[i].y, c2 + (f1.outline[i].y - c1) * k, 1e-6));
        }

        IconGlyph i1 = computeIconGlyph(pair[0]);
        IconGlyph i2 = computeIconGlyph(pair[1]);
        for (size_t i = 0; i < i1.leftArm.size(); i++) {
            assert(Near(i2.leftArm[i].x, c2 + (i1.leftArm[i].x - c1) * k, 1e-6));
            assert(Near(i2.leftArm[i].y, c2 + (i1.leftArm[i].y - c1) * k, 1e-6));
            assert(Near(i2.rightArm[i].x, c2 + (i1.rightArm[i].x - c1) * k, 1e-6));
            assert(Near(i2.rightArm[i].y, c2 + (i1.rightArm[i].y - c1) * k, 1e-6));
        }
    }
}

static void TestCompositeWithTransparentOverlayKeepsBase() {
    Image base = newCanvas(8, ColorMode::RGBA, Color{10, 20, 30, 255});
    setPixel(base, 1, 1, Color{200, 100, 50, 128});
    setPixel(base, 2, 2, Color{77, 88, 99, 0});
    setPixel(base, 3, 3, Color{0, 0, 0, 0});

    Image overlay = newCanvas(8, ColorMode::RGBA, TRANSPARENT);
    Image result = compositeOver(base, overlay);
    assert(result.data == base.data);
}

static void TestCompositeOverOpaqueBase() {
    Image base = newCanvas(4, ColorMode::RGBA, Color{10, 20, 30, 255});
    Image overlay = newCanvas(4, ColorMode::RGBA, Color{200, 100, 50, 128});
    Image result = compositeOver(base, overlay);

    double a = 128 / 255.0;
    Color c = getPixel(result, 2, 2);
    assert(Near(c.r, 200 * a + 10 * (1 - a), 1.0));
    assert(Near(c.g, 100 * a + 20 * (1 - a), 1.0));
    assert(Near(c.b, 50 * a + 30 * (1 - a), 1.0));
    assert(c.a == 255);

    // Fully opaque overlay replaces the base
    Image solid = newCanvas(4, ColorMode::RGBA, Color{1, 2, 3, 255});
    assert(compositeOver(base, solid).data == solid.data);
}

static void TestCompositeRejectsMismatchedOverlay() {
    Image base = newCanvas(8, ColorMode::RGBA, Color{10, 20, 30, 255});
    Image smaller = newCanvas(4, ColorMode::RGBA, Color{200, 100, 50, 255});
    assert(compositeOver(base, smaller).data == base.data);

    Image rgb = newCanvas(8, ColorMode::RGB, Color{200, 100, 50, 255});
    assert(compositeOver(base, rgb).data == base.data);
}

static void TestVerticalGradientRows() {
    Image g = verticalGradient(5, Color{0, 0, 0, 255}, Color{100, 200, 40, 255});
    assert(g.channels == 3);

    Color top = getPixel(g, 3, 0);
    assert(top.r == 0 && top.g == 0 && top.b == 0);
    Color quarter = getPixel(g, 0, 1);
    assert(quarter.r == 25 && quarter.g == 50 && quarter.b == 10);
    Color middle = getPixel(g, 4, 2);
    assert(middle.r == 50 && middle.g == 100 && middle.b == 20);
    Color bottom = getPixel(g, 2, 4);
    assert(bottom.r == 100 && bottom.g == 200 && bottom.b == 40);

    // Truncation towards zero, as with a decreasing channel
    Image down = verticalGradient(4, INDIGO_TOP, INDIGO_BOTTOM);
    Color row1 = getPixel(down, 0, 1);
    assert(row1.r == 88);
    assert(row1.g == 86);
}

static void TestRoundedRectMaskCorners() {
    Image mask = roundedRectMask(64, 0.22);
    assert(mask.channels == 1);
    assert(mask.at(0, 0) == 0);
    assert(mask.at(63, 0) == 0);
    assert(mask.at(0, 63) == 0);
    assert(mask.at(63, 63) == 0);
    assert(mask.at(32, 32) == 255);
    assert(mask.at(32, 0) == 255);
    assert(mask.at(0, 32) == 255);
    assert(mask.at(63, 32) == 255);
    assert(mask.at(32, 63) == 255);
}

static void TestRoundedRectOutline() {
    Image img = newCanvas(32, ColorMode::RGBA, TRANSPARENT);
    drawRoundedRect(img, Rect{0, 0, 31, 31}, 6, Color{255, 0, 0, 255}, 1);
    assert(getPixel(img, 16, 0).a == 255);
    assert(getPixel(img, 0, 16).a == 255);
    assert(getPixel(img, 16, 1).a == 0);
    assert(getPixel(img, 16, 16).a == 0);
    assert(getPixel(img, 0, 0).a == 0);
}

static void TestPolygonFill() {
    Image img = newCanvas(10, ColorMode::RGBA, TRANSPARENT);
    Polygon square = {{2, 2}, {7, 2}, {7, 7}, {2, 7}};
    drawPolygon(img, square, WHITE);

    assert(getPixel(img, 4, 4).a == 255);
    assert(getPixel(img, 2, 2).a == 255);
    assert(getPixel(img, 0, 0).a == 0);
    assert(getPixel(img, 9, 9).a == 0);
    assert(getPixel(img, 8, 4).a == 0);

    // Concave favicon V leaves the notch between the arms open
    Image v = newCanvas(64, ColorMode::RGBA, TRANSPARENT);
    drawPolygon(v, computeFaviconGlyph(64).outline, INDIGO_500);
    assert(getPixel(v, 20, 20).a == 255);
    assert(getPixel(v, 44, 20).a == 255);
    assert(getPixel(v, 32, 20).a == 0);
    assert(getPixel(v, 32, 46).a == 255);
}

static void TestResizeFlatColor() {
    Image flat = newCanvas(64, ColorMode::RGBA, Color{99, 102, 241, 255});
    Image small = resizeLanczos(flat, 16, 16);
    assert(small.width == 16 && small.height == 16 && small.channels == 4);
    for (int y = 0; y < 16; y++) {
        for (int x = 0; x < 16; x++) {
            Color c = getPixel(small, x, y);
            assert(Near(c.r, 99, 1) && Near(c.g, 102, 1) && Near(c.b, 241, 1));
            assert(c.a == 255);
        }
    }

    ResampleCoefficients coeffs = computeLanczosCoefficients(128, 32);
    for (int i = 0; i < coeffs.outSize; i++) {
        double total = 0;
        for (int k = 0; k < coeffs.bounds[i * 2 + 1]; k++) total += coeffs.weights[i * coeffs.kernelSize + k];
        assert(Near(total, 1.0, 1e-5));
    }
}

static void TestResizeOpaqueRgbSource() {
    Image rgb = newCanvas(32, ColorMode::RGB, Color{30, 27, 75, 255});
    Image small = resizeLanczos(rgb, 8, 8);
    assert(small.width == 8 && small.height == 8 && small.channels == 4);
    Color c = getPixel(small, 3, 5);
    assert(Near(c.r, 30, 1) && Near(c.g, 27, 1) && Near(c.b, 75, 1));
    assert(c.a == 255);
}

static bool WithinOne(const Image& a, const Image& b) {
    if (a.width != b.width || a.height != b.height || a.channels != b.channels) return false;
    for (size_t i = 0; i < a.data.size(); i++) {
        if (std::abs(static_cast<int>(a.data[i]) - static_cast<int>(b.data[i])) > 1) return false;
    }
    return true;
}

static void TestGpuResampleMatchesCpu() {
    Image favicon = renderGlyphIcon(faviconConfig(), 64);
    Image cpu = resizeLanczos(favicon, 16, 16);

    // Resources that never came up fall back to the CPU filter
    OpenCLResources idle;
    assert(resizeImage(favicon, 16, 16, &idle).data == cpu.data);
    assert(resizeImage(favicon, 16, 16, nullptr).data == cpu.data);
    Image unused;
    assert(!resizeLanczosGPU(idle, favicon, 16, 16, unused));

    OpenCLResources cl;
    if (!initializeOpenCL(cl, std::string(VAULTY_KERNEL_DIR) + "/resample_kernel.cl")) return;
    assert(cl.ready);

    Image gpu;
    assert(resizeLanczosGPU(cl, favicon, 16, 16, gpu));
    assert(WithinOne(gpu, cpu));

    Image icon = renderGlyphIcon(extensionIconConfig(), 32, &cl);
    assert(WithinOne(icon, renderGlyphIcon(extensionIconConfig(), 32)));

    releaseOpenCL(cl);
    assert(!cl.ready);
}

static void TestFaviconColours() {
    Image icon = renderGlyphIcon(faviconConfig(), 64);
    assert(icon.width == 64 && icon.height == 64 && icon.channels == 4);

    // Outside the rounded square
    assert(getPixel(icon, 0, 0).a == 0);

    // Background below the glyph, inside the innermost ring
    Color bg = getPixel(icon, 32, 56);
    assert(bg.r == SLATE_900.r && bg.g == SLATE_900.g && bg.b == SLATE_900.b && bg.a == 255);

    // Left arm: plain indigo
    Color left = getPixel(icon, 20, 20);
    assert(left.r == INDIGO_500.r && left.g == INDIGO_500.g && left.b == INDIGO_500.b);

    // Right arm: violet at 200/255 over indigo
    Color right = getPixel(icon, 44, 20);
    double a = 200 / 255.0;
    assert(Near(right.r, 139 * a + 99 * (1 - a), 1.0));
    assert(Near(right.g, 92 * a + 102 * (1 - a), 1.0));
    assert(Near(right.b, 246 * a + 241 * (1 - a), 1.0));
}

static void TestIndigoIconGradient() {
    Image icon = renderGlyphIcon(extensionIconConfig(), 32);
    assert(icon.width == 32 && icon.height == 32 && icon.channels == 4);

    double top[3];
    double bottom[3];
    RowAverage(icon, 0, top);
    RowAverage(icon, 31, bottom);

    assert(ColorDistance(top, INDIGO_TOP) < ColorDistance(top, INDIGO_BOTTOM));
    assert(ColorDistance(bottom, INDIGO_BOTTOM) < ColorDistance(bottom, INDIGO_TOP));

    // Corners fall outside the rounded mask
    assert(getPixel(icon, 0, 0).a < 64);
}

static void TestInvalidSizeRejected() {
    assert(renderGlyphIcon(faviconConfig(), 0).empty());
    assert(renderGlyphIcon(extensionIconConfig(), -4).empty());
}

static void TestParallelMatchesSerial() {
    useOpenMP = false;
    Image serialFavicon = renderGlyphIcon(faviconConfig(), 48);
    Image serialIcon = renderGlyphIcon(extensionIconConfig(), 32);

    useOpenMP = true;
    Image parallelFavicon = renderGlyphIcon(faviconConfig(), 48);
    Image parallelIcon = renderGlyphIcon(extensionIconConfig(), 32);
    useOpenMP = false;

    assert(serialFavicon.data == parallelFavicon.data);
    assert(serialIcon.data == parallelIcon.data);
}

static void TestFaviconContainerEntries() {
    const auto root = FreshTempDir("vaulty_icons_test_favicon");
    GlyphIconConfig config = faviconConfig();
    assert(generateGlyphIcons(config, root.string()));

    const auto path = root / "web" / "app" / "favicon.ico";
    assert(std::filesystem::exists(path));

    std::vector<IcoEntry> entries;
    assert(readIco(path.string(), entries));
    assert(entries.size() == 4);

    const int expected[] = {16, 32, 48, 64};
    for (size_t i = 0; i < entries.size(); i++) {
        assert(entries[i].width == expected[i]);
        assert(entries[i].height == expected[i]);
        assert(entries[i].bitCount == 32);
        assert(entries[i].image.width == expected[i]);
        assert(entries[i].image.height == expected[i]);
    }

    assert(verifyGlyphIcons(config, root.string()));
    std::filesystem::remove_all(root);
}

static void TestExtensionIconFiles() {
    const auto root = FreshTempDir("vaulty_icons_test_extension");
    GlyphIconConfig config = extensionIconConfig();
    assert(generateGlyphIcons(config, root.string()));

    for (int size : {16, 32, 48, 128}) {
        const auto path = root / "extension" / "icons" / ("icon-" + std::to_string(size) + ".png");
        assert(std::filesystem::exists(path));
        assert(iconFilePath(config, root.string(), size) == path.string());

        Image png = loadPng(path.string());
        assert(png.width == size && png.height == size);
        assert(png.channels == 4);
    }

    assert(verifyGlyphIcons(config, root.string()));
    std::filesystem::remove_all(root);
}

static void TestVerifyRejectsWrongSize() {
    const auto root = FreshTempDir("vaulty_icons_test_verify");
    GlyphIconConfig config = extensionIconConfig();
    config.sizes = {16};

    const std::string path = iconFilePath(config, root.string(), 16);
    assert(ensureParentDirectory(path));
    assert(savePng(path, newCanvas(20, ColorMode::RGBA, WHITE)));
    assert(!verifyGlyphIcons(config, root.string()));

    assert(generateGlyphIcons(config, root.string()));
    assert(verifyGlyphIcons(config, root.string()));
    std::filesystem::remove_all(root);
}

static void TestIcoWriterSkipsOversizedEntries() {
    const auto root = FreshTempDir("vaulty_icons_test_ico");
    const std::string path = (root / "nested" / "dir" / "small.ico").string();
    assert(ensureParentDirectory(path));

    Image icon = renderGlyphIcon(faviconConfig(), 32);
    assert(writeIco(path, icon, {64, 16, 32, 16}, nullptr));

    std::vector<IcoEntry> entries;
    assert(readIco(path, entries));
    assert(entries.size() == 2);
    assert(entries[0].width == 16 && entries[1].width == 32);
    std::filesystem::remove_all(root);
}

static void TestReadIcoRejectsGarbage() {
    const auto root = FreshTempDir("vaulty_icons_test_garbage");
    std::filesystem::create_directories(root);
    const auto path = root / "bad.ico";
    {
        std::ofstream out(path, std::ios::binary);
        out << "not an icon";
    }
    std::vector<IcoEntry> entries;
    assert(!readIco(path.string(), entries));

    // One empty entry whose payload would start exactly at end of file
    const unsigned char emptyEntry[22] = {
        0, 0, 1, 0, 1, 0,
        16, 16, 0, 0, 1, 0, 32, 0,
        0, 0, 0, 0,
        22, 0, 0, 0,
    };
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(emptyEntry), sizeof(emptyEntry));
    }
    assert(std::filesystem::file_size(path) == 22);
    assert(!readIco(path.string(), entries));
    std::filesystem::remove_all(root);
}

int main() {
    TestFaviconGlyphVertices();
    TestIconArmsAreMirrored();
    TestGlyphScalesWithSize();
    TestCompositeWithTransparentOverlayKeepsBase();
    TestCompositeOverOpaqueBase();
    TestCompositeRejectsMismatchedOverlay();
    TestVerticalGradientRows();
    TestRoundedRectMaskCorners();
    TestRoundedRectOutline();
    TestPolygonFill();
    TestResizeFlatColor();
    TestResizeOpaqueRgbSource();
    TestGpuResampleMatchesCpu();
    TestFaviconColours();
    TestIndigoIconGradient();
    TestInvalidSizeRejected();
    TestParallelMatchesSerial();
    TestFaviconContainerEntries();
    TestExtensionIconFiles();
    TestVerifyRejectsWrongSize();
    TestIcoWriterSkipsOversizedEntries();
    TestReadIcoRejectsGarbage();
    return 0;
}
