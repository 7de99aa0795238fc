#include <auroscuro/audio/beat_detect.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace auroscuro::audio {

namespace {

// Out-of-range or non-finite tunables fall back to their defaults
void sanitize(const char* name, float& value, float lo, float hi, bool hiOpen, float fallback) {
    bool ok = std::isfinite(value) && value >= lo && (hiOpen ? value < hi : value <= hi);
    if (!ok) {
        std::cerr << "[BeatDetector] Invalid " << name << " " << value
                  << ", using " << fallback << std::endl;
        value = fallback;
    }
}

} // namespace

BeatDetector::BeatDetector(const BeatDetectorConfig& config)
    : m_config(config)
{
    const BeatDetectorConfig defaults;
    const float inf = std::numeric_limits<float>::infinity();
    const float tiny = std::numeric_limits<float>::min();

    sanitize("smoothingFactor", m_config.smoothingFactor, 0.0f, 1.0f, false, defaults.smoothingFactor);
    sanitize("envelopeSmoothing", m_config.envelopeSmoothing, 0.0f, 1.0f, false, defaults.envelopeSmoothing);
    sanitize("beatDecay", m_config.beatDecay, 0.0f, 1.0f, true, defaults.beatDecay);
    sanitize("compressionGamma", m_config.compressionGamma, tiny, inf, true, defaults.compressionGamma);
    sanitize("rampDurationMs", m_config.rampDurationMs, -inf, inf, true, defaults.rampDurationMs);
    sanitize("signalEpsilon", m_config.signalEpsilon, 0.0f, inf, true, defaults.signalEpsilon);
    sanitize("bassWeight", m_config.bassWeight, 0.0f, inf, true, defaults.bassWeight);
    sanitize("midWeight", m_config.midWeight, 0.0f, inf, true, defaults.midWeight);
    sanitize("relativeEpsilon", m_config.relativeEpsilon, tiny, inf, true, defaults.relativeEpsilon);
    sanitize("beatThresholdMultiplier", m_config.beatThresholdMultiplier, 0.0f, inf, true,
             defaults.beatThresholdMultiplier);
    sanitize("beatCooldownMs", m_config.beatCooldownMs, 0.0f, inf, true, defaults.beatCooldownMs);
    sanitize("boostSnapThreshold", m_config.boostSnapThreshold, 0.0f, 1.0f, false,
             defaults.boostSnapThreshold);
}

const VisualLevels& BeatDetector::process(const SpectrumFrame& frame, double nowMs) {
    if (frame.empty()) {
        return m_levels;
    }

    float bass = bandAverage(frame, m_config.bassRange, m_config.ignoreSilentBins);
    float mid = bandAverage(frame, m_config.midRange, m_config.ignoreSilentBins);
    return update(bass, mid, nowMs);
}

float BeatDetector::rampAt(double nowMs) const {
    if (!m_state.rampStartMs) return 0.0f;
    if (m_config.rampDurationMs <= 0.0f) return 1.0f;

    double t = (nowMs - *m_state.rampStartMs) / m_config.rampDurationMs;
    return static_cast<float>(std::clamp(t, 0.0, 1.0));
}

const VisualLevels& BeatDetector::update(float bassNorm, float midNorm, double nowMs) {
    const BeatDetectorConfig& cfg = m_config;
    bassNorm = std::clamp(bassNorm, 0.0f, 1.0f);
    midNorm = std::clamp(midNorm, 0.0f, 1.0f);

    bool hasSignal = bassNorm > cfg.signalEpsilon || midNorm > cfg.signalEpsilon;

    // Cold start: fade in from the first tick that carries signal
    if (!m_state.rampStartMs && hasSignal) {
        m_state.rampStartMs = nowMs;
    }
    float ramp = rampAt(nowMs);

    // Visual levels: gamma curve, scaled by the ramp
    m_levels.bassLevel = std::min(1.0f, std::pow(bassNorm, cfg.compressionGamma) * ramp);
    m_levels.midLevel = std::min(1.0f, std::pow(midNorm, cfg.compressionGamma) * ramp);

    // Baselines start at the first real signal, not at zero
    bool priming = !m_state.primed && hasSignal;
    if (priming) {
        m_state.smoothedBass = bassNorm;
        m_state.smoothedMid = midNorm;
        m_state.primed = true;
    }
    m_state.smoothedBass += (bassNorm - m_state.smoothedBass) * cfg.smoothingFactor;
    m_state.smoothedMid += (midNorm - m_state.smoothedMid) * cfg.smoothingFactor;

    float bassRel = bassNorm / (m_state.smoothedBass + cfg.relativeEpsilon);
    float midRel = midNorm / (m_state.smoothedMid + cfg.relativeEpsilon);
    float combined = bassRel * cfg.bassWeight + midRel * cfg.midWeight;
    m_combined = combined;

    if (priming) {
        m_state.beatEnvelope = combined;
    } else {
        m_state.beatEnvelope += (combined - m_state.beatEnvelope) * cfg.envelopeSmoothing;
    }

    bool cooledDown = !m_state.lastBeatMs ||
                      (nowMs - *m_state.lastBeatMs) > cfg.beatCooldownMs;
    bool beat = m_state.primed &&
                combined > m_state.beatEnvelope * cfg.beatThresholdMultiplier &&
                cooledDown;

    if (beat) {
        m_state.lastBeatMs = nowMs;
        m_levels.isBeat = true;
        // A stronger hit overrides a decaying one, a weaker one never lowers it
        float impulse = std::clamp(combined - m_state.beatEnvelope, 0.0f, 1.0f);
        m_levels.beatBoost = std::max(m_levels.beatBoost, impulse);
    } else {
        m_levels.isBeat = false;
        m_levels.beatBoost *= cfg.beatDecay;
        if (m_levels.beatBoost < cfg.boostSnapThreshold) {
            m_levels.beatBoost = 0.0f;
        }
    }

    return m_levels;
}

} // namespace auroscuro::audio
