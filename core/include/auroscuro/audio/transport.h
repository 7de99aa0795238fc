#pragma once

/**
 * @file transport.h
 * @brief Play/pause/stop position tracking over decoded audio
 *
 * Output routing is somebody else's job; the transport only answers "where
 * in the buffer are we right now", driven by a Clock.
 */

#include <auroscuro/audio/audio_file.h>
#include <auroscuro/clock.h>
#include <memory>

namespace auroscuro::audio {

class Transport {
public:
    explicit Transport(std::shared_ptr<const Clock> clock);

    /// @brief Replace the buffer; stops and rewinds
    void setAudio(std::shared_ptr<const DecodedAudio> audio);

    bool hasBuffer() const { return m_audio && m_audio->valid(); }
    const std::shared_ptr<const DecodedAudio>& audio() const { return m_audio; }

    // -------------------------------------------------------------------------
    /// @name Playback Control
    /// @{

    /// @brief Start or resume from the paused offset; no-op without a buffer
    void play();

    /// @brief Freeze the position
    void pause();

    /// @brief Halt and rewind to 0
    void stop();

    void toggle();

    /// @brief Jump to a position, clamped to [0, duration]
    void seek(double seconds);

    /**
     * @brief Handle the natural end of the buffer
     *
     * Call once per tick. When playback runs past the end the transport
     * stops and rewinds.
     * @return true if playback ended on this call
     */
    bool update();

    /// @}

    bool isPlaying() const { return m_playing; }

    /// @brief Position in seconds
    double position() const;

    /// @brief Position in sample frames, clamped to the buffer
    uint64_t positionFrames() const;

    double duration() const { return m_audio ? m_audio->duration() : 0.0; }

private:
    std::shared_ptr<const Clock> m_clock;
    std::shared_ptr<const DecodedAudio> m_audio;
    bool m_playing = false;
    double m_startMs = 0.0;      ///< Clock time corresponding to position 0
    double m_pauseOffset = 0.0;  ///< Seconds into the buffer while not playing
};

} // namespace auroscuro::audio
