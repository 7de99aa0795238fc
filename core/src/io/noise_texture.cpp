#include <auroscuro/io/noise_texture.h>
#include <algorithm>
#include <iostream>
#include <random>

namespace auroscuro::io {

bool parseNoiseStyle(const std::string& name, NoiseStyle& out) {
    if (name == "white") {
        out = NoiseStyle::White;
        return true;
    }
    if (name == "warm") {
        out = NoiseStyle::Warm;
        return true;
    }
    return false;
}

ImageData makeNoiseTexture(int size, NoiseStyle style, uint32_t seed) {
    if (size > MAX_NOISE_SIZE) {
        std::cerr << "[NoiseTexture] Size " << size << " too large, using " << MAX_NOISE_SIZE
                  << std::endl;
    }
    size = std::clamp(size, 1, MAX_NOISE_SIZE);

    ImageData img;
    img.width = size;
    img.height = size;
    img.channels = 4;
    img.pixels.resize(static_cast<size_t>(size) * size * 4);

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);

    for (size_t i = 0; i < img.pixels.size(); i += 4) {
        if (style == NoiseStyle::White) {
            uint8_t n = static_cast<uint8_t>(dist(rng) * 255.0f);
            img.pixels[i + 0] = n;
            img.pixels[i + 1] = n;
            img.pixels[i + 2] = n;
        } else {
            float base = dist(rng) * 200.0f;
            img.pixels[i + 0] = static_cast<uint8_t>(base);
            img.pixels[i + 1] = static_cast<uint8_t>(base * 0.8f);
            img.pixels[i + 2] = static_cast<uint8_t>(base * 0.4f);
        }
        img.pixels[i + 3] = 255;
    }

    return img;
}

} // namespace auroscuro::io
