#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"
#include "lodepng.h"

#include "icon_writer.h"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

static const unsigned int ICO_HEADER_SIZE = 6;
static const unsigned int ICO_ENTRY_SIZE = 16;

static void writeU16(std::ofstream& out, uint16_t v) {
    out.put((char)(v & 0xFF));
    out.put((char)((v >> 8) & 0xFF));
}

static void writeU32(std::ofstream& out, uint32_t v) {
    out.put((char)(v & 0xFF));
    out.put((char)((v >> 8) & 0xFF));
    out.put((char)((v >> 16) & 0xFF));
    out.put((char)((v >> 24) & 0xFF));
}

static uint16_t readU16(const std::vector<unsigned char>& b, size_t pos) {
    return (uint16_t)(b[pos] | (b[pos + 1] << 8));
}

static uint32_t readU32(const std::vector<unsigned char>& b, size_t pos) {
    return (uint32_t)b[pos] | ((uint32_t)b[pos + 1] << 8) |
           ((uint32_t)b[pos + 2] << 16) | ((uint32_t)b[pos + 3] << 24);
}

bool ensureParentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::cerr << "Error creating directory " << parent.string() << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool savePng(const std::string& path, const Image& img) {
    if (img.channels != 4) {
        std::cerr << "Error saving " << path << ": expected an RGBA image" << std::endl;
        return false;
    }
    if (!stbi_write_png(path.c_str(), img.width, img.height, 4, img.data.data(), img.width * 4)) {
        std::cerr << "Error writing PNG: " << path << std::endl;
        return false;
    }
    return true;
}

bool encodePng(const Image& img, std::vector<unsigned char>& png) {
    unsigned error = lodepng::encode(png, img.data, img.width, img.height, LCT_RGBA, 8);
    if (error) {
        std::cerr << "encoder error " << error << ": " << lodepng_error_text(error) << std::endl;
        return false;
    }
    return true;
}

bool writeIco(const std::string& path, const Image& largest, const std::vector<int>& sizes,
              const OpenCLResources* cl) {
    std::vector<int> ordered;
    for (int size : sizes) {
        if (size <= 0 || size > 256 || size > largest.width) {
            std::cerr << "Skipping ICO size " << size << " (source is " << largest.width << "x"
                      << largest.height << ")" << std::endl;
            continue;
        }
        ordered.push_back(size);
    }
    std::sort(ordered.begin(), ordered.end());
    ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());
    if (ordered.empty()) {
        std::cerr << "Error writing " << path << ": no usable sizes" << std::endl;
        return false;
    }

    std::vector<std::vector<unsigned char>> payloads(ordered.size());
    for (size_t i = 0; i < ordered.size(); i++) {
        Image frame = resizeImage(largest, ordered[i], ordered[i], cl);
        if (!encodePng(frame, payloads[i])) return false;
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "Error opening " << path << " for writing" << std::endl;
        return false;
    }

    uint16_t count = (uint16_t)ordered.size();
    writeU16(out, 0);       // reserved
    writeU16(out, 1);       // type: icon
    writeU16(out, count);

    uint32_t offset = ICO_HEADER_SIZE + count * ICO_ENTRY_SIZE;
    for (size_t i = 0; i < ordered.size(); i++) {
        uint8_t dim = ordered[i] >= 256 ? 0 : (uint8_t)ordered[i];
        out.put((char)dim);     // width
        out.put((char)dim);     // height
        out.put(0);             // colour count
        out.put(0);             // reserved
        writeU16(out, 1);       // planes
        writeU16(out, 32);      // bits per pixel
        writeU32(out, (uint32_t)payloads[i].size());
        writeU32(out, offset);
        offset += (uint32_t)payloads[i].size();
    }
    for (const auto& payload : payloads) {
        out.write((const char*)payload.data(), (std::streamsize)payload.size());
    }

    out.close();
    if (!out) {
        std::cerr << "Error writing ICO: " << path << std::endl;
        return false;
    }
    return true;
}

Image loadPng(const std::string& path) {
    Image img;
    int channels;
    unsigned char* data = stbi_load(path.c_str(), &img.width, &img.height, &channels, 4);

    if (!data) {
        std::cerr << "Error loading image: " << path << " (" << stbi_failure_reason() << ")" << std::endl;
        return Image();
    }

    img.channels = 4;
    img.data.assign(data, data + img.width * img.height * 4);
    stbi_image_free(data);
    return img;
}

bool readIco(const std::string& path, std::vector<IcoEntry>& entries) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "Error opening " << path << std::endl;
        return false;
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (bytes.size() < ICO_HEADER_SIZE || readU16(bytes, 0) != 0 || readU16(bytes, 2) != 1) {
        std::cerr << "Not an ICO file: " << path << std::endl;
        return false;
    }
    uint16_t count = readU16(bytes, 4);
    if (bytes.size() < ICO_HEADER_SIZE + (size_t)count * ICO_ENTRY_SIZE) {
        std::cerr << "Truncated ICO directory: " << path << std::endl;
        return false;
    }

    entries.clear();
    for (uint16_t i = 0; i < count; i++) {
        size_t pos = ICO_HEADER_SIZE + (size_t)i * ICO_ENTRY_SIZE;
        IcoEntry entry;
        entry.width = bytes[pos] == 0 ? 256 : bytes[pos];
        entry.height = bytes[pos + 1] == 0 ? 256 : bytes[pos + 1];
        entry.bitCount = readU16(bytes, pos + 6);
        entry.bytes = readU32(bytes, pos + 8);
        entry.offset = readU32(bytes, pos + 12);

        if (entry.bytes == 0 || entry.offset >= bytes.size() ||
            (size_t)entry.offset + entry.bytes > bytes.size()) {
            std::cerr << "ICO entry " << i << " runs past the end of " << path << std::endl;
            return false;
        }

        unsigned width, height;
        std::vector<unsigned char> pixels;
        unsigned error = lodepng::decode(pixels, width, height, bytes.data() + entry.offset, entry.bytes);
        if (error) {
            std::cerr << "decoder error " << error << ": " << lodepng_error_text(error) << std::endl;
            return false;
        }

        entry.image.width = (int)width;
        entry.image.height = (int)height;
        entry.image.channels = 4;
        entry.image.data = pixels;
        entries.push_back(entry);
    }
    return true;
}
