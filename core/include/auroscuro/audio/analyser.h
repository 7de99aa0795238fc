#pragma once

/**
 * @file analyser.h
 * @brief Byte-scaled FFT spectrum of the audio under the playhead
 *
 * Analyser provides:
 * - Blackman-windowed FFT over the fftSize samples ending at the playhead
 * - Per-bin smoothing across frames
 * - Decibel mapping to 0-255 bytes between minDecibels and maxDecibels
 */

#include <auroscuro/audio/spectrum.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace auroscuro::audio {

class Transport;

/// @brief Analyser tunables
struct AnalyserConfig {
    uint32_t fftSize = 2048;              ///< Power of two, 32-32768
    float smoothingTimeConstant = 0.8f;   ///< 0 = no smoothing, <1
    float minDecibels = -100.0f;          ///< Maps to byte 0
    float maxDecibels = -30.0f;           ///< Maps to byte 255
};

/**
 * @brief SpectrumSource reading from a Transport's buffer
 *
 * While the transport is stopped or paused the input is silence, so the
 * smoothed spectrum decays instead of freezing.
 *
 * @par Example
 * @code
 * Analyser analyser;
 * analyser.connect(&transport);
 * SpectrumFrame frame;
 * analyser.getSpectrum(frame);  // frame.size() == 1024
 * @endcode
 */
class Analyser : public SpectrumSource {
public:
    explicit Analyser(const AnalyserConfig& config = {});
    ~Analyser() override;

    Analyser(const Analyser&) = delete;
    Analyser& operator=(const Analyser&) = delete;

    /**
     * @brief Set the FFT size
     * @return false (and no change) if @p size is not a power of two in range
     */
    bool setFftSize(uint32_t size);
    uint32_t fftSize() const { return m_config.fftSize; }
    uint32_t binCount() const override { return m_config.fftSize / 2; }

    const AnalyserConfig& config() const { return m_config; }

    /// @brief Read samples from @p transport (not owned, may be null)
    void connect(const Transport* transport) { m_transport = transport; }
    bool connected() const { return m_transport != nullptr; }

    void getSpectrum(SpectrumFrame& frame) override;

    /**
     * @brief Analyse an explicit window instead of the transport
     * @param samples Mono samples; the last fftSize are used, zero-padded in front
     * @param count Number of samples
     * @param frame Output, resized to binCount()
     */
    void analyze(const float* samples, size_t count, SpectrumFrame& frame);

    /// @brief Smoothed linear magnitudes from the last analysis
    const std::vector<float>& magnitudes() const { return m_smoothed; }

    static bool isValidFftSize(uint32_t size);

private:
    void allocateBuffers();

    struct Impl;
    std::unique_ptr<Impl> m_impl;

    AnalyserConfig m_config;
    const Transport* m_transport = nullptr;
    std::vector<float> m_window;      ///< Blackman coefficients
    std::vector<float> m_smoothed;    ///< Per-bin smoothed magnitudes
    std::vector<float> m_scratch;     ///< Input samples for one analysis
};

} // namespace auroscuro::audio
