#pragma once

/**
 * @file session.h
 * @brief One audio-reactive visualizer: playback, analysis, detection, rendering
 *
 * A session owns the whole pipeline and every piece of state it touches.
 * Destroying it stops the tick loop and drops any load still in flight.
 *
 * Lifecycle:
 * 1. Construct with a config (read-only from then on)
 * 2. attachSurface() and loadAudio(); the tick loop starts on its own once a
 *    surface is attached and analysis is active
 * 3. Each tick: adopt finished loads, then, if audio is loaded, spectrum ->
 *    detector -> mapper -> renderer -> recorder, strictly in that order
 * 4. detachSurface() or setAnalysisActive(false) stops the loop
 */

#include <auroscuro/async_resource.h>
#include <auroscuro/audio/analyser.h>
#include <auroscuro/audio/beat_detect.h>
#include <auroscuro/audio/transport.h>
#include <auroscuro/clock.h>
#include <auroscuro/config.h>
#include <auroscuro/effects/frame_renderer.h>
#include <auroscuro/recorder.h>
#include <auroscuro/scheduler.h>
#include <memory>
#include <mutex>
#include <string>

namespace auroscuro {

/// @brief Who drives tick()
enum class TickMode {
    Scheduled,  ///< Internal FrameScheduler thread at config.tickRate
    Manual      ///< Caller invokes tick() (offline rendering, tests)
};

class VisualizerSession {
public:
    /**
     * @param config Tunables, copied
     * @param clock Time source; a SteadyClock if null
     * @param mode Whether the session runs its own tick loop
     */
    explicit VisualizerSession(const VisualizerConfig& config = {},
                               std::shared_ptr<const Clock> clock = nullptr,
                               TickMode mode = TickMode::Scheduled);
    ~VisualizerSession();

    VisualizerSession(const VisualizerSession&) = delete;
    VisualizerSession& operator=(const VisualizerSession&) = delete;

    // -------------------------------------------------------------------------
    /// @name Surface
    /// @{

    /// @brief Attach a logical surface at the current device pixel ratio
    void attachSurface(int width, int height);

    /// @brief Attach a named preset ("9:16", "1:1", "16:9"), false if unknown
    bool attachPreset(const std::string& name);

    void detachSurface();
    void setDevicePixelRatio(float ratio);

    effects::SurfaceSize surface() const;
    bool hasSurface() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Analysis
    /// @{

    /// @brief Whether the spectrum analyser is in the graph; inactive stops the loop
    void setAnalysisActive(bool active);
    bool analysisActive() const;

    /// @brief Change the FFT size; the spectrum buffer follows on the next tick
    bool setFftSize(uint32_t size);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Resources
    /// @{

    /// @brief Decode an audio file in the background
    void loadAudio(const std::string& path);
    void setAudio(std::shared_ptr<const audio::DecodedAudio> audio);

    /// @brief Load a background image in the background; failures keep the old one
    void loadBackground(const std::string& path);
    void setBackground(std::shared_ptr<const io::ImageData> image);
    void clearBackground();

    void loadNoiseTexture(const std::string& path);
    void setNoiseTexture(std::shared_ptr<const io::ImageData> image);
    void clearNoiseTexture();

    /// @brief Adopt finished loads without running the pipeline
    void pollResources();

    /// @brief Any load started and not yet adopted
    bool resourcesPending() const;

    bool hasAudio() const;
    bool hasBackground() const;
    bool hasNoiseTexture() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Playback
    /// @{

    void play();
    void pause();
    void stop();
    void toggle();
    void seek(double seconds);

    bool isPlaying() const;
    double position() const;
    double duration() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Recording
    /// @{

    /// @brief Capture rendered frames into @p sink at config.recordFps
    void startRecording(std::shared_ptr<io::FrameSink> sink);
    void stopRecording();
    bool isRecording() const;

    /// @brief Frames captured by the current or last recording
    uint64_t recordedFrames() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Ticking
    /// @{

    /**
     * @brief One pipeline pass
     * @return true if a frame was drawn
     */
    bool tick();

    /// @brief Tick loop is running
    bool isRunning() const { return m_scheduler.isRunning(); }

    uint64_t tickCount() const;

    /// @}

    /// @name Inspection
    /// @{
    audio::VisualLevels levels() const;
    FrameParams params() const;
    const audio::SpectrumFrame& spectrum() const { return m_spectrum; }
    const effects::FrameRenderer& renderer() const { return m_renderer; }
    const VisualizerConfig& config() const { return m_config; }
    /// @}

private:
    bool readyLocked() const;
    void adoptAudioLocked();
    void syncScheduler();

    VisualizerConfig m_config;
    TickMode m_mode;
    std::shared_ptr<const Clock> m_clock;

    mutable std::mutex m_mutex;   ///< Guards everything the tick touches
    audio::Transport m_transport;
    audio::Analyser m_analyser;
    std::unique_ptr<audio::BeatDetector> m_detector;
    effects::FrameRenderer m_renderer;
    audio::SpectrumFrame m_spectrum;
    FrameParams m_params;

    effects::SurfaceSize m_surface;
    float m_pixelRatio = 1.0f;
    bool m_analysisActive = true;

    AsyncResource<audio::DecodedAudio> m_audio{LoadFailurePolicy::Clear};
    AsyncResource<io::ImageData> m_background{LoadFailurePolicy::KeepPrevious};
    AsyncResource<io::ImageData> m_noise{LoadFailurePolicy::Clear};

    std::unique_ptr<FrameRecorder> m_recorder;
    uint64_t m_ticks = 0;

    std::mutex m_schedulerMutex;  ///< Serializes start/stop; never taken by the tick
    FrameScheduler m_scheduler;
};

} // namespace auroscuro
