#pragma once

/**
 * @file blend.h
 * @brief Separable and non-separable blend modes with source-over compositing
 *
 * Colors are straight (non-premultiplied) RGBA in 0-1. Formulas follow the
 * W3C Compositing and Blending spec so results match a browser canvas.
 */

#include <glm/glm.hpp>

namespace auroscuro::effects {

/**
 * @brief Blend modes for canvas drawing
 */
enum class BlendMode {
    Over,       ///< Normal alpha compositing
    Add,        ///< Linear dodge, min(1, Cb + Cs)
    Multiply,   ///< Cb * Cs - darkens
    Screen,     ///< 1 - (1-Cb)(1-Cs) - lightens
    SoftLight,  ///< Gentle contrast, used for grain
    Saturation  ///< Backdrop hue/luminosity with source saturation
};

/// @brief Mix function B(Cb, Cs) for a blend mode
glm::vec3 blendColor(BlendMode mode, const glm::vec3& backdrop, const glm::vec3& source);

/**
 * @brief Composite @p src over @p dst using @p mode
 * @param dst Backdrop (straight alpha)
 * @param src Source with alpha already multiplied by global alpha
 * @return Result (straight alpha)
 */
glm::vec4 compositeOver(BlendMode mode, const glm::vec4& dst, const glm::vec4& src);

/// @brief Rec. 601 luminosity used by the non-separable modes
inline float luminosity(const glm::vec3& c) {
    return 0.3f * c.r + 0.59f * c.g + 0.11f * c.b;
}

} // namespace auroscuro::effects
