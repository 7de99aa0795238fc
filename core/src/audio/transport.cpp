#include <auroscuro/audio/transport.h>
#include <algorithm>

namespace auroscuro::audio {

Transport::Transport(std::shared_ptr<const Clock> clock)
    : m_clock(std::move(clock)) {
}

void Transport::setAudio(std::shared_ptr<const DecodedAudio> audio) {
    m_audio = std::move(audio);
    m_playing = false;
    m_pauseOffset = 0.0;
}

void Transport::play() {
    if (!hasBuffer() || m_playing) {
        return;
    }
    m_startMs = m_clock->nowMs() - m_pauseOffset * 1000.0;
    m_playing = true;
}

void Transport::pause() {
    if (!m_playing) {
        return;
    }
    m_pauseOffset = position();
    m_playing = false;
}

void Transport::stop() {
    m_playing = false;
    m_pauseOffset = 0.0;
}

void Transport::toggle() {
    if (m_playing) {
        pause();
    } else {
        play();
    }
}

void Transport::seek(double seconds) {
    double target = std::clamp(seconds, 0.0, duration());
    if (m_playing) {
        m_startMs = m_clock->nowMs() - target * 1000.0;
    } else {
        m_pauseOffset = target;
    }
}

bool Transport::update() {
    if (!m_playing) {
        return false;
    }
    double elapsed = (m_clock->nowMs() - m_startMs) / 1000.0;
    if (elapsed < duration()) {
        return false;
    }
    stop();
    return true;
}

double Transport::position() const {
    if (!m_playing) {
        return m_pauseOffset;
    }
    double elapsed = (m_clock->nowMs() - m_startMs) / 1000.0;
    return std::clamp(elapsed, 0.0, duration());
}

uint64_t Transport::positionFrames() const {
    if (!hasBuffer()) {
        return 0;
    }
    auto frame = static_cast<uint64_t>(position() * m_audio->sampleRate);
    return std::min(frame, m_audio->frameCount());
}

} // namespace auroscuro::audio
