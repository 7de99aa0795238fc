#pragma once

/**
 * @file recorder.h
 * @brief Samples the rendered surface into a FrameSink at a fixed rate
 *
 * The capture rate is independent of the tick rate: frames are captured
 * whenever a tick crosses the next capture time, so a 60 Hz pipeline can
 * feed a 30 fps recording. A tick that falls behind by several capture
 * times writes its frame once per missed slot.
 */

#include <auroscuro/effects/canvas.h>
#include <auroscuro/io/frame_writer.h>
#include <cstdint>
#include <memory>

namespace auroscuro {

class FrameRecorder {
public:
    FrameRecorder(std::shared_ptr<io::FrameSink> sink, double fps = 60.0);

    /// @brief Begin capturing; the first frame is due at @p nowMs
    void start(double nowMs);
    void stop();

    bool isRecording() const { return m_recording; }

    /**
     * @brief Offer the surface after a tick
     * @return true if at least one frame was captured
     */
    bool capture(const effects::Canvas& canvas, double nowMs);

    uint64_t frameCount() const { return m_frameCount; }
    uint64_t failedFrames() const { return m_failed; }
    double fps() const { return m_fps; }

    /// @brief Duration covered by the captured frames, in seconds
    double duration() const { return m_frameCount / m_fps; }

private:
    std::shared_ptr<io::FrameSink> m_sink;
    double m_fps;
    double m_startMs = 0.0;
    bool m_recording = false;
    uint64_t m_frameCount = 0;
    uint64_t m_failed = 0;
};

} // namespace auroscuro
