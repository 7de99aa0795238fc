#include <auroscuro/audio/analyser.h>
#include <auroscuro/audio/transport.h>
#include <kiss_fft.h>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace auroscuro::audio {

static constexpr float PI = 3.14159265358979323846f;

struct Analyser::Impl {
    kiss_fft_cfg cfg = nullptr;
    std::vector<kiss_fft_cpx> fftIn;
    std::vector<kiss_fft_cpx> fftOut;

    ~Impl() {
        if (cfg) {
            kiss_fft_free(cfg);
        }
    }
};

Analyser::Analyser(const AnalyserConfig& config)
    : m_impl(std::make_unique<Impl>())
    , m_config(config)
{
    if (!isValidFftSize(m_config.fftSize)) {
        std::cerr << "[Analyser] Invalid fftSize " << m_config.fftSize
                  << ", using 2048" << std::endl;
        m_config.fftSize = 2048;
    }
    m_config.smoothingTimeConstant = std::clamp(m_config.smoothingTimeConstant, 0.0f, 1.0f);
    if (m_config.maxDecibels <= m_config.minDecibels) {
        std::cerr << "[Analyser] maxDecibels must exceed minDecibels, using -100/-30" << std::endl;
        m_config.minDecibels = -100.0f;
        m_config.maxDecibels = -30.0f;
    }
    allocateBuffers();
}

Analyser::~Analyser() = default;

bool Analyser::isValidFftSize(uint32_t size) {
    return size >= 32 && size <= 32768 && (size & (size - 1)) == 0;
}

bool Analyser::setFftSize(uint32_t size) {
    if (!isValidFftSize(size)) {
        return false;
    }
    if (size != m_config.fftSize) {
        m_config.fftSize = size;
        allocateBuffers();
    }
    return true;
}

void Analyser::allocateBuffers() {
    const uint32_t n = m_config.fftSize;

    if (m_impl->cfg) {
        kiss_fft_free(m_impl->cfg);
        m_impl->cfg = nullptr;
    }
    m_impl->cfg = kiss_fft_alloc(static_cast<int>(n), 0, nullptr, nullptr);
    m_impl->fftIn.assign(n, kiss_fft_cpx{0.0f, 0.0f});
    m_impl->fftOut.assign(n, kiss_fft_cpx{0.0f, 0.0f});

    // Blackman window (a = 0.16)
    const float a0 = 0.42f, a1 = 0.5f, a2 = 0.08f;
    m_window.resize(n);
    for (uint32_t i = 0; i < n; ++i) {
        float x = static_cast<float>(i) / n;
        m_window[i] = a0 - a1 * std::cos(2.0f * PI * x) + a2 * std::cos(4.0f * PI * x);
    }

    m_smoothed.assign(n / 2, 0.0f);
    m_scratch.assign(n, 0.0f);
}

void Analyser::getSpectrum(SpectrumFrame& frame) {
    const uint32_t n = m_config.fftSize;
    std::fill(m_scratch.begin(), m_scratch.end(), 0.0f);

    if (m_transport && m_transport->isPlaying() && m_transport->hasBuffer()) {
        const DecodedAudio& audio = *m_transport->audio();
        uint64_t end = m_transport->positionFrames();
        uint64_t begin = end > n ? end - n : 0;
        size_t count = static_cast<size_t>(end - begin);
        // Right-align so the newest sample is last
        std::copy(audio.samples.begin() + static_cast<std::ptrdiff_t>(begin),
                  audio.samples.begin() + static_cast<std::ptrdiff_t>(end),
                  m_scratch.begin() + (n - count));
    }

    analyze(m_scratch.data(), m_scratch.size(), frame);
}

void Analyser::analyze(const float* samples, size_t count, SpectrumFrame& frame) {
    const uint32_t n = m_config.fftSize;
    const uint32_t bins = n / 2;

    if (!m_impl->cfg) {
        frame.assign(bins, 0);
        return;
    }

    size_t used = std::min<size_t>(count, n);
    size_t pad = n - used;
    const float* src = samples ? samples + (count - used) : nullptr;

    for (uint32_t i = 0; i < n; ++i) {
        float s = (src && i >= pad) ? src[i - pad] : 0.0f;
        m_impl->fftIn[i].r = s * m_window[i];
        m_impl->fftIn[i].i = 0.0f;
    }

    kiss_fft(m_impl->cfg, m_impl->fftIn.data(), m_impl->fftOut.data());

    frame.resize(bins);

    const float tau = m_config.smoothingTimeConstant;
    const float range = m_config.maxDecibels - m_config.minDecibels;
    const float scale = 1.0f / n;

    for (uint32_t k = 0; k < bins; ++k) {
        const kiss_fft_cpx& c = m_impl->fftOut[k];
        float mag = std::sqrt(c.r * c.r + c.i * c.i) * scale;

        float smoothed = tau * m_smoothed[k] + (1.0f - tau) * mag;
        if (!std::isfinite(smoothed)) {
            smoothed = 0.0f;
        }
        m_smoothed[k] = smoothed;

        float db = smoothed > 0.0f ? 20.0f * std::log10(smoothed) : -INFINITY;
        float scaled = 255.0f * (db - m_config.minDecibels) / range;
        if (!(scaled > 0.0f)) {
            frame[k] = 0;
        } else {
            frame[k] = static_cast<uint8_t>(std::min(255.0f, std::floor(scaled)));
        }
    }
}

} // namespace auroscuro::audio
