#pragma once

/**
 * @file noise_texture.h
 * @brief Procedural grain textures
 *
 * Per-pixel independent noise, so any tile size repeats without seams.
 */

#include <auroscuro/io/image_loader.h>
#include <cstdint>
#include <string>

namespace auroscuro::io {

/// Largest generated texture edge, in pixels
constexpr int MAX_NOISE_SIZE = 8192;

enum class NoiseStyle {
    White,  ///< Grey, uniform 0-255
    Warm    ///< Base 0-200 tinted toward amber (R 1.0, G 0.8, B 0.4)
};

/// @brief Parse "white" / "warm" (case-sensitive), false if unknown
bool parseNoiseStyle(const std::string& name, NoiseStyle& out);

/**
 * @brief Generate an opaque square noise texture
 * @param size Edge length in pixels (clamped to [1, MAX_NOISE_SIZE])
 * @param style Color style
 * @param seed RNG seed; equal seeds give identical textures
 */
ImageData makeNoiseTexture(int size = 512, NoiseStyle style = NoiseStyle::White,
                           uint32_t seed = 1);

} // namespace auroscuro::io
