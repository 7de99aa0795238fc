#include <auroscuro/audio/spectrum.h>
#include <algorithm>
#include <cmath>

namespace auroscuro::audio {

static float clampFraction(float f) {
    if (!(f > 0.0f)) return 0.0f;  // also catches NaN
    return std::min(f, 1.0f);
}

BinWindow BandRange::window(size_t binCount) const {
    BinWindow w;
    if (binCount == 0) {
        return w;
    }

    const double n = static_cast<double>(binCount);
    size_t start = static_cast<size_t>(std::floor(clampFraction(startFrac) * n));
    size_t end = static_cast<size_t>(std::floor(clampFraction(endFrac) * n));

    // startFrac == 1 would leave nothing to sample
    start = std::min(start, binCount - 1);
    end = std::min(std::max(start + 1, end), binCount);

    w.start = start;
    w.end = end;
    return w;
}

float bandAverage(const uint8_t* bins, size_t binCount, const BandRange& range,
                  bool ignoreSilentBins) {
    if (!bins) return 0.0f;

    BinWindow w = range.window(binCount);
    if (w.empty()) return 0.0f;

    uint32_t sum = 0;
    uint32_t count = 0;
    for (size_t i = w.start; i < w.end; ++i) {
        if (ignoreSilentBins && bins[i] == 0) continue;
        sum += bins[i];
        count++;
    }

    if (count == 0) return 0.0f;
    return (static_cast<float>(sum) / static_cast<float>(count)) / 255.0f;
}

} // namespace auroscuro::audio
