#ifndef ICON_WRITER_H
#define ICON_WRITER_H

#include <string>
#include <vector>
#include "image.h"
#include "resample_opencl.h"

// One image of a multi-resolution ICO file
struct IcoEntry {
    int width;
    int height;
    int bitCount;
    unsigned int bytes;
    unsigned int offset;
    Image image;        // decoded PNG payload
};

// Create the directories above path if they do not exist yet
bool ensureParentDirectory(const std::string& path);

// 8-bit RGBA PNG file (stb_image_write)
bool savePng(const std::string& path, const Image& img);

// 8-bit RGBA PNG in memory (lodepng)
bool encodePng(const Image& img, std::vector<unsigned char>& png);

// ICO with one 32-bit PNG entry per size, smallest first. Each entry is the
// largest image resampled to that size; sizes above largest.width are skipped.
bool writeIco(const std::string& path, const Image& largest, const std::vector<int>& sizes,
              const OpenCLResources* cl);

// PNG file as 4-channel RGBA (stb_image). Empty image on error.
Image loadPng(const std::string& path);

// Parse the ICO directory and decode every entry
bool readIco(const std::string& path, std::vector<IcoEntry>& entries);

#endif // ICON_WRITER_H
