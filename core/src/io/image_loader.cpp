// Auroscuro I/O - Image Loader Implementation

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <auroscuro/io/image_loader.h>
#include <filesystem>
#include <iostream>
#include <limits>

namespace fs = std::filesystem;

namespace auroscuro::io {

static ImageData fromStb(unsigned char* data, int width, int height, int channels) {
    ImageData result;
    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(data, data + static_cast<size_t>(width) * height * 4);
    stbi_image_free(data);
    return result;
}

ImageData loadImage(const std::string& path) {
    if (!fileExists(path)) {
        std::cerr << "[Image] Not found: " << path << std::endl;
        return {};
    }

    // Force RGBA output
    int width, height, channels;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);

    if (!data) {
        std::cerr << "[Image] Failed to load: " << path
                  << " - " << stbi_failure_reason() << std::endl;
        return {};
    }

    return fromStb(data, width, height, channels);
}

ImageData loadImageFromMemory(const uint8_t* data, size_t size) {
    if (!data || size == 0 || size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return {};
    }

    int width, height, channels;
    unsigned char* pixels = stbi_load_from_memory(data, static_cast<int>(size),
                                                  &width, &height, &channels, 4);
    if (!pixels) {
        std::cerr << "[Image] Failed to decode from memory - "
                  << stbi_failure_reason() << std::endl;
        return {};
    }

    return fromStb(pixels, width, height, channels);
}

bool writePNG(const std::string& path, const ImageData& image) {
    if (!image.valid()) {
        std::cerr << "[Image] Refusing to write empty image: " << path << std::endl;
        return false;
    }

    int ok = stbi_write_png(path.c_str(), image.width, image.height, 4,
                            image.pixels.data(), image.width * 4);
    if (!ok) {
        std::cerr << "[Image] Failed to write: " << path << std::endl;
        return false;
    }
    return true;
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

} // namespace auroscuro::io
