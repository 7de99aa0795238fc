#include <auroscuro/recorder.h>
#include <iostream>

namespace auroscuro {

FrameRecorder::FrameRecorder(std::shared_ptr<io::FrameSink> sink, double fps)
    : m_sink(std::move(sink))
    , m_fps(fps > 0.0 ? fps : 60.0) {
}

void FrameRecorder::start(double nowMs) {
    if (!m_sink) {
        std::cerr << "[FrameRecorder] No frame sink, not recording" << std::endl;
        return;
    }
    m_startMs = nowMs;
    m_frameCount = 0;
    m_failed = 0;
    m_recording = true;
}

void FrameRecorder::stop() {
    if (m_recording) {
        std::cout << "[FrameRecorder] Stopped after " << m_frameCount << " frames ("
                  << duration() << "s)" << std::endl;
    }
    m_recording = false;
}

bool FrameRecorder::capture(const effects::Canvas& canvas, double nowMs) {
    if (!m_recording || canvas.empty()) {
        return false;
    }

    // Next frame is due at start + frameCount / fps; small slack absorbs float drift
    auto due = [this] { return m_startMs + m_frameCount * 1000.0 / m_fps; };
    if (nowMs + 1e-6 < due()) {
        return false;
    }

    // Ticks slower than the capture rate repeat the frame so the sequence keeps wall time
    io::ImageData frame = canvas.snapshot();
    while (nowMs + 1e-6 >= due()) {
        if (!m_sink->writeFrame(frame, m_frameCount)) {
            m_failed++;
        }
        m_frameCount++;
    }
    return true;
}

} // namespace auroscuro
