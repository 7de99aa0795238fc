#pragma once

/**
 * @file mapping.h
 * @brief Pure mappings from visual levels to layer intensities
 *
 * Each layer reads the same three inputs (bass, mid, beat boost) through its
 * own weight set. Nothing here holds state.
 */

#include <auroscuro/audio/beat_detect.h>

namespace auroscuro {

/// @brief Per-input weights for one layer
struct LayerWeights {
    float bass = 0.0f;
    float mid = 0.0f;
    float beat = 0.0f;
};

/// Bass-led ring glow at the frame boundary
inline constexpr LayerWeights DEFAULT_EDGE_WEIGHTS{0.6f, 0.2f, 1.0f};

/// Mid-led glow at the center
inline constexpr LayerWeights DEFAULT_CENTER_WEIGHTS{0.15f, 0.9f, 0.7f};

/// @brief Grain opacity model: floor plus weighted levels, capped
struct GrainWeights {
    float baseOpacity = 0.05f;  ///< Opacity at silence
    float maxOpacity = 0.4f;    ///< Hard cap
    float bass = 0.2f;
    float mid = 0.8f;
    float beat = 0.7f;
};

/// @brief Background transform and filter weights
struct TransformWeights {
    float rotationDeg = 1.5f;       ///< Degrees per unit mid level
    float beatRotationDeg = 2.0f;   ///< Degrees per unit mid level on a beat
    float beatScale = 1.03f;        ///< Uniform scale on a beat
    float brightnessBass = 0.35f;
    float brightnessBeat = 0.45f;
    float contrastMid = 0.25f;
    float contrastBeat = 0.25f;
};

/// @brief Background image transform for one frame
struct BackgroundTransform {
    float angleRadians = 0.0f;
    float scale = 1.0f;
    float brightness = 1.0f;
    float contrast = 1.0f;
};

/// @brief Everything the renderer needs for one frame
struct FrameParams {
    float edgeIntensity = 0.0f;
    float centerIntensity = 0.0f;
    float grainOpacity = 0.0f;
    BackgroundTransform background;
};

/// @brief Weight sets for all layers
struct MapperConfig {
    LayerWeights edge = DEFAULT_EDGE_WEIGHTS;
    LayerWeights center = DEFAULT_CENTER_WEIGHTS;
    GrainWeights grain;
    TransformWeights transform;
};

/// @brief clamp(bass*wB + mid*wM + beat*wBeat, 0, 1)
float layerIntensity(const audio::VisualLevels& levels, const LayerWeights& weights);

inline float edgeIntensity(const audio::VisualLevels& levels,
                           const LayerWeights& weights = DEFAULT_EDGE_WEIGHTS) {
    return layerIntensity(levels, weights);
}

inline float centerIntensity(const audio::VisualLevels& levels,
                             const LayerWeights& weights = DEFAULT_CENTER_WEIGHTS) {
    return layerIntensity(levels, weights);
}

/**
 * @brief clamp(base + mid*wM + bass*wB + beat*wBeat, 0, max)
 *
 * Never below baseOpacity (unless the cap is lower). The cap itself is
 * limited to 1.
 */
float grainOpacity(const audio::VisualLevels& levels, const GrainWeights& weights = {});

/// @brief Rotation, scale and brightness/contrast for the background image
BackgroundTransform backgroundTransform(const audio::VisualLevels& levels,
                                        const TransformWeights& weights = {});

/// @brief Run every mapping for one frame
FrameParams mapFrame(const audio::VisualLevels& levels, const MapperConfig& config);

} // namespace auroscuro
