#include <auroscuro/mapping.h>
#include <algorithm>
#include <cmath>

namespace auroscuro {

static constexpr float PI = 3.14159265358979323846f;

// NaN weights fall through to 0
static float clampRange(float v, float lo, float hi) {
    if (!(v > lo)) return lo;
    return std::min(v, hi);
}

float layerIntensity(const audio::VisualLevels& levels, const LayerWeights& weights) {
    float raw = levels.bassLevel * weights.bass +
                levels.midLevel * weights.mid +
                levels.beatBoost * weights.beat;
    return clampRange(raw, 0.0f, 1.0f);
}

float grainOpacity(const audio::VisualLevels& levels, const GrainWeights& weights) {
    float tonal = levels.midLevel * weights.mid + levels.bassLevel * weights.bass;
    float punch = levels.beatBoost * weights.beat;
    float cap = clampRange(weights.maxOpacity, 0.0f, 1.0f);
    return clampRange(weights.baseOpacity + tonal + punch, 0.0f, cap);
}

BackgroundTransform backgroundTransform(const audio::VisualLevels& levels,
                                        const TransformWeights& weights) {
    BackgroundTransform t;

    float degPerMid = levels.isBeat ? weights.beatRotationDeg : weights.rotationDeg;
    t.angleRadians = levels.midLevel * degPerMid * PI / 180.0f;
    t.scale = levels.isBeat ? weights.beatScale : 1.0f;
    t.brightness = 1.0f + levels.bassLevel * weights.brightnessBass +
                   levels.beatBoost * weights.brightnessBeat;
    t.contrast = 1.0f + levels.midLevel * weights.contrastMid +
                 levels.beatBoost * weights.contrastBeat;
    return t;
}

FrameParams mapFrame(const audio::VisualLevels& levels, const MapperConfig& config) {
    FrameParams p;
    p.edgeIntensity = edgeIntensity(levels, config.edge);
    p.centerIntensity = centerIntensity(levels, config.center);
    p.grainOpacity = grainOpacity(levels, config.grain);
    p.background = backgroundTransform(levels, config.transform);
    return p;
}

} // namespace auroscuro
