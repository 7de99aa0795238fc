#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace auroscuro::io {

/// Decoded 8-bit image, always RGBA
struct ImageData {
    std::vector<uint8_t> pixels;  ///< RGBA pixel data, row-major, top row first
    int width = 0;
    int height = 0;
    int channels = 0;             ///< Original channels before forced RGBA

    bool valid() const {
        return width > 0 && height > 0 &&
               pixels.size() == static_cast<size_t>(width) * height * 4;
    }
};

/// Load an LDR image (PNG, JPG, BMP, TGA, etc.)
/// @param path Path to the image file
/// @return ImageData with RGBA pixels, or empty ImageData on failure
ImageData loadImage(const std::string& path);

/// Load an LDR image from an encoded in-memory buffer
/// @return ImageData with RGBA pixels, or empty on failure
ImageData loadImageFromMemory(const uint8_t* data, size_t size);

/// Write RGBA pixels as a PNG file
/// @return true on success
bool writePNG(const std::string& path, const ImageData& image);

/// Check if a file exists and is a regular file
bool fileExists(const std::string& path);

} // namespace auroscuro::io
