#pragma once

/**
 * @file spectrum.h
 * @brief Spectrum frames, band ranges and band energy extraction
 *
 * A spectrum frame is the byte-scaled magnitude of each frequency bin for the
 * current audio frame (0-255, like an analyser node's byte frequency data).
 * Bands are described as fractions of the bin count so the same config works
 * for any FFT size.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace auroscuro::audio {

/// Byte magnitudes for one audio frame, N = fftSize / 2 bins
using SpectrumFrame = std::vector<uint8_t>;

/**
 * @brief Pull-based producer of spectrum frames
 *
 * Called at most once per tick. binCount() is fixed for a session and only
 * changes when the analysis configuration changes, in which case callers
 * must reallocate their frame.
 */
class SpectrumSource {
public:
    virtual ~SpectrumSource() = default;

    /// @brief Number of bins in each frame
    virtual uint32_t binCount() const = 0;

    /**
     * @brief Overwrite @p frame with the current magnitudes
     * @param frame Resized to binCount() if needed, then filled in place
     */
    virtual void getSpectrum(SpectrumFrame& frame) = 0;
};

/// @brief Half-open window of bin indices [start, end)
struct BinWindow {
    size_t start = 0;
    size_t end = 0;

    size_t count() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
};

/**
 * @brief Contiguous band of bins as fractions of the bin count
 *
 * Fractions are clamped to [0, 1]. For any non-empty frame the resulting
 * window always holds at least one bin.
 */
struct BandRange {
    float startFrac = 0.0f;
    float endFrac = 1.0f;

    /// @brief Map fractions to a clamped bin window for @p binCount bins
    BinWindow window(size_t binCount) const;
};

/**
 * @brief Mean magnitude of a band, normalized to [0, 1]
 * @param bins Pointer to @p binCount byte magnitudes
 * @param binCount Number of bins
 * @param range Band to average
 * @param ignoreSilentBins Average only non-zero bins
 * @return Mean / 255, or 0 for an empty window
 */
float bandAverage(const uint8_t* bins, size_t binCount, const BandRange& range,
                  bool ignoreSilentBins = false);

/// @brief Convenience overload for a whole frame
inline float bandAverage(const SpectrumFrame& frame, const BandRange& range,
                         bool ignoreSilentBins = false) {
    return bandAverage(frame.data(), frame.size(), range, ignoreSilentBins);
}

} // namespace auroscuro::audio
