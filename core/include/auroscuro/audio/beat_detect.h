#pragma once

/**
 * @file beat_detect.h
 * @brief Band level smoothing and adaptive beat detection
 *
 * BeatDetector provides:
 * - Bass/mid visual levels (gamma compressed, faded in after first signal)
 * - Beat onsets relative to a slow-moving envelope
 * - A decaying beat boost impulse
 */

#include <auroscuro/audio/spectrum.h>
#include <optional>

namespace auroscuro::audio {

/// @brief Tunables for BeatDetector (read-only once the detector is built)
struct BeatDetectorConfig {
    BandRange bassRange{0.0f, 0.12f};   ///< Bass band as fraction of bins
    BandRange midRange{0.12f, 0.5f};    ///< Mid band as fraction of bins
    bool ignoreSilentBins = false;      ///< Average only non-zero bins

    float smoothingFactor = 0.05f;      ///< Baseline follow rate per tick
    float rampDurationMs = 1000.0f;     ///< Fade-in after first signal
    float compressionGamma = 0.7f;      ///< < 1 lifts quiet passages
    float signalEpsilon = 0.001f;       ///< Energy that counts as "signal"

    float bassWeight = 0.7f;            ///< Bass share of combined energy
    float midWeight = 0.3f;             ///< Mid share of combined energy
    float relativeEpsilon = 1e-4f;      ///< Guards norm / baseline
    float envelopeSmoothing = 0.1f;     ///< Envelope follow rate per tick

    float beatThresholdMultiplier = 1.3f; ///< combined must exceed envelope * this
    float beatCooldownMs = 110.0f;      ///< Minimum gap between beats
    float beatDecay = 0.9f;             ///< Boost multiplier per non-beat tick
    float boostSnapThreshold = 0.01f;   ///< Boost below this snaps to 0
};

/// @brief Internal detector state, owned by one BeatDetector
struct DetectorState {
    float smoothedBass = 0.0f;
    float smoothedMid = 0.0f;
    float beatEnvelope = 0.0f;
    std::optional<double> lastBeatMs;   ///< Empty until the first beat
    std::optional<double> rampStartMs;  ///< Empty until signal is observed
    bool primed = false;                ///< Baselines initialized from signal
};

/// @brief Per-tick detector output
struct VisualLevels {
    float bassLevel = 0.0f;   ///< 0-1, compressed and ramped bass
    float midLevel = 0.0f;    ///< 0-1, compressed and ramped mids
    float beatBoost = 0.0f;   ///< 0-1, decaying beat impulse
    bool isBeat = false;      ///< True only on the tick a beat fires
};

/**
 * @brief Turns per-tick band energies into visual levels and beats
 *
 * Beats are detected when the weighted relative energy exceeds a smoothed
 * envelope by a threshold factor, with a cooldown between beats. State is
 * reset only by constructing a new detector.
 *
 * @par Example
 * @code
 * BeatDetector detector;
 * SpectrumFrame frame;
 * analyser.getSpectrum(frame);
 * const VisualLevels& lv = detector.process(frame, clock.nowMs());
 * if (lv.isBeat) flash();
 * @endcode
 */
class BeatDetector {
public:
    explicit BeatDetector(const BeatDetectorConfig& config = {});

    /**
     * @brief Extract bands from a frame and advance one tick
     *
     * An empty frame is a no-op and the previous levels are held.
     */
    const VisualLevels& process(const SpectrumFrame& frame, double nowMs);

    /**
     * @brief Advance one tick from already-normalized band energies
     * @param bassNorm Bass energy 0-1
     * @param midNorm Mid energy 0-1
     * @param nowMs Tick timestamp
     */
    const VisualLevels& update(float bassNorm, float midNorm, double nowMs);

    const VisualLevels& levels() const { return m_levels; }
    const DetectorState& state() const { return m_state; }
    const BeatDetectorConfig& config() const { return m_config; }

    /// @brief Weighted relative energy computed on the last tick
    float combinedEnergy() const { return m_combined; }

private:
    float rampAt(double nowMs) const;

    BeatDetectorConfig m_config;
    DetectorState m_state;
    VisualLevels m_levels;
    float m_combined = 0.0f;
};

} // namespace auroscuro::audio
