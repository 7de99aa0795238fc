#include <auroscuro/session.h>
#include <auroscuro/io/noise_texture.h>
#include <iostream>

namespace auroscuro {

VisualizerSession::VisualizerSession(const VisualizerConfig& config,
                                     std::shared_ptr<const Clock> clock,
                                     TickMode mode)
    : m_config(config)
    , m_mode(mode)
    , m_clock(clock ? std::move(clock) : std::make_shared<SteadyClock>())
    , m_transport(m_clock)
    , m_analyser(config.analyser)
    , m_detector(std::make_unique<audio::BeatDetector>(config.detector))
    , m_renderer(config.render)
    , m_pixelRatio(config.devicePixelRatio > 0.0f ? config.devicePixelRatio : 1.0f)
    , m_scheduler(config.tickRate)
{
    m_analyser.connect(&m_transport);

    if (m_config.noiseTexture.empty()) {
        m_noise.set(std::make_shared<const io::ImageData>(
            io::makeNoiseTexture(m_config.noiseSize, m_config.noiseStyle, m_config.noiseSeed)));
    } else {
        loadNoiseTexture(m_config.noiseTexture);
    }
}

VisualizerSession::~VisualizerSession() {
    {
        std::lock_guard<std::mutex> lock(m_schedulerMutex);
        m_scheduler.stop();
    }
    stopRecording();
}

// -----------------------------------------------------------------------------
// Surface
// -----------------------------------------------------------------------------

void VisualizerSession::attachSurface(int width, int height) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_surface = {width, height, m_pixelRatio};
        if (!m_surface.valid()) {
            std::cerr << "[Session] Ignoring surface " << width << "x" << height << std::endl;
            m_surface = {};
        }
    }
    syncScheduler();
}

bool VisualizerSession::attachPreset(const std::string& name) {
    SurfacePreset preset;
    if (!findSurfacePreset(name, preset)) {
        std::cerr << "[Session] Unknown surface preset: " << name << std::endl;
        return false;
    }
    attachSurface(preset.width, preset.height);
    return true;
}

void VisualizerSession::detachSurface() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_surface = {};
    }
    syncScheduler();
}

void VisualizerSession::setDevicePixelRatio(float ratio) {
    if (!(ratio > 0.0f)) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pixelRatio = ratio;
    if (m_surface.valid()) {
        m_surface.pixelRatio = ratio;
    }
}

effects::SurfaceSize VisualizerSession::surface() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_surface;
}

bool VisualizerSession::hasSurface() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_surface.valid();
}

// -----------------------------------------------------------------------------
// Analysis
// -----------------------------------------------------------------------------

void VisualizerSession::setAnalysisActive(bool active) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_analysisActive = active;
    }
    syncScheduler();
}

bool VisualizerSession::analysisActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_analysisActive;
}

bool VisualizerSession::setFftSize(uint32_t size) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_analyser.setFftSize(size)) {
        std::cerr << "[Session] Invalid FFT size " << size << std::endl;
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Resources
// -----------------------------------------------------------------------------

void VisualizerSession::loadAudio(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_audio.load([path] { return audio::loadAudioFile(path); });
}

void VisualizerSession::setAudio(std::shared_ptr<const audio::DecodedAudio> audio) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (audio && !audio->valid()) {
        audio.reset();
    }
    m_audio.set(std::move(audio));
    adoptAudioLocked();
}

void VisualizerSession::loadBackground(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_background.load([path] { return io::loadImage(path); });
}

void VisualizerSession::setBackground(std::shared_ptr<const io::ImageData> image) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_background.set(std::move(image));
}

void VisualizerSession::clearBackground() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_background.clear();
}

void VisualizerSession::loadNoiseTexture(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_noise.load([path] { return io::loadImage(path); });
}

void VisualizerSession::setNoiseTexture(std::shared_ptr<const io::ImageData> image) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_noise.set(std::move(image));
}

void VisualizerSession::clearNoiseTexture() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_noise.clear();
}

void VisualizerSession::pollResources() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_background.poll();
    m_noise.poll();
    if (m_audio.poll()) {
        adoptAudioLocked();
    }
}

bool VisualizerSession::resourcesPending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_audio.pending() || m_background.pending() || m_noise.pending();
}

bool VisualizerSession::hasAudio() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transport.hasBuffer();
}

bool VisualizerSession::hasBackground() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_background.current() != nullptr;
}

bool VisualizerSession::hasNoiseTexture() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_noise.current() != nullptr;
}

void VisualizerSession::adoptAudioLocked() {
    m_transport.setAudio(m_audio.current());

    // New track, new baselines
    m_detector = std::make_unique<audio::BeatDetector>(m_config.detector);
    m_params = {};

    if (m_transport.hasBuffer()) {
        std::cout << "[Session] Audio ready: " << m_transport.duration() << "s @ "
                  << m_transport.audio()->sampleRate << " Hz" << std::endl;
    }
}

// -----------------------------------------------------------------------------
// Playback
// -----------------------------------------------------------------------------

void VisualizerSession::play() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transport.play();
}

void VisualizerSession::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transport.pause();
}

void VisualizerSession::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transport.stop();
}

void VisualizerSession::toggle() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transport.toggle();
}

void VisualizerSession::seek(double seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transport.seek(seconds);
}

bool VisualizerSession::isPlaying() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transport.isPlaying();
}

double VisualizerSession::position() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transport.position();
}

double VisualizerSession::duration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transport.duration();
}

// -----------------------------------------------------------------------------
// Recording
// -----------------------------------------------------------------------------

void VisualizerSession::startRecording(std::shared_ptr<io::FrameSink> sink) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_recorder) {
        m_recorder->stop();
    }
    m_recorder = std::make_unique<FrameRecorder>(std::move(sink), m_config.recordFps);
    m_recorder->start(m_clock->nowMs());
}

void VisualizerSession::stopRecording() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_recorder) {
        m_recorder->stop();
    }
}

bool VisualizerSession::isRecording() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recorder && m_recorder->isRecording();
}

uint64_t VisualizerSession::recordedFrames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recorder ? m_recorder->frameCount() : 0;
}

// -----------------------------------------------------------------------------
// Ticking
// -----------------------------------------------------------------------------

bool VisualizerSession::readyLocked() const {
    return m_surface.valid() && m_analysisActive;
}

bool VisualizerSession::tick() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ticks++;

    m_background.poll();
    m_noise.poll();
    if (m_audio.poll()) {
        adoptAudioLocked();
    }

    if (!readyLocked() || !m_transport.hasBuffer()) {
        return false;
    }

    if (m_transport.update()) {
        std::cout << "[Session] Playback ended" << std::endl;
    }

    const double now = m_clock->nowMs();

    if (m_spectrum.size() != m_analyser.binCount()) {
        m_spectrum.assign(m_analyser.binCount(), 0);
    }
    m_analyser.getSpectrum(m_spectrum);

    const audio::VisualLevels& levels = m_detector->process(m_spectrum, now);
    m_params = mapFrame(levels, m_config.mapper);

    effects::FrameInputs inputs;
    inputs.params = m_params;
    inputs.background = m_background.current();
    inputs.noise = m_noise.current();
    m_renderer.render(m_surface, inputs);

    if (m_recorder) {
        m_recorder->capture(m_renderer.canvas(), now);
    }
    return true;
}

uint64_t VisualizerSession::tickCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ticks;
}

audio::VisualLevels VisualizerSession::levels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_detector->levels();
}

FrameParams VisualizerSession::params() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_params;
}

void VisualizerSession::syncScheduler() {
    if (m_mode != TickMode::Scheduled) {
        return;
    }

    std::lock_guard<std::mutex> schedulerLock(m_schedulerMutex);
    bool ready;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ready = readyLocked();
    }

    if (ready) {
        if (m_scheduler.start([this](double) { tick(); })) {
            std::cout << "[Session] Tick loop started at " << m_scheduler.fps() << " Hz" << std::endl;
        }
    } else if (m_scheduler.isRunning()) {
        m_scheduler.stop();
        std::cout << "[Session] Tick loop stopped after " << m_scheduler.tickCount()
                  << " ticks" << std::endl;
    }
}

} // namespace auroscuro
