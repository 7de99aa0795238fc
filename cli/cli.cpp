// Auroscuro CLI Commands
// Handles: auroscuro render, auroscuro noise, auroscuro config

#include <auroscuro/cli.h>
#include <auroscuro/config.h>
#include <auroscuro/io/frame_writer.h>
#include <auroscuro/io/noise_texture.h>
#include <auroscuro/session.h>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

namespace auroscuro::cli {

int renderAudio(const RenderOptions& options) {
    VisualizerConfig config;
    if (!options.configPath.empty() && !config.loadFile(options.configPath)) {
        return 1;
    }

    if (!options.preset.empty()) {
        config.surfacePreset = options.preset;
    }
    if (options.devicePixelRatio > 0.0f) {
        config.devicePixelRatio = options.devicePixelRatio;
    }
    if (options.fps > 0.0) {
        config.recordFps = options.fps;
        config.tickRate = options.fps;
    }
    if (!options.noisePath.empty()) {
        config.noiseTexture = options.noisePath;
    }

    SurfacePreset preset;
    if (!findSurfacePreset(config.surfacePreset, preset)) {
        std::cerr << "Error: Unknown preset '" << config.surfacePreset
                  << "' (expected 9:16, 1:1 or 16:9)\n";
        return 1;
    }

    auto clock = std::make_shared<ManualClock>();
    VisualizerSession session(config, clock, TickMode::Manual);

    session.loadAudio(options.audioPath);
    if (!options.backgroundPath.empty()) {
        session.loadBackground(options.backgroundPath);
    }

    // Offline: nothing to draw until every load has landed
    while (session.resourcesPending()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        session.pollResources();
    }

    if (!session.hasAudio()) {
        std::cerr << "Error: Could not decode " << options.audioPath << "\n";
        return 1;
    }
    if (!options.backgroundPath.empty() && !session.hasBackground()) {
        std::cerr << "Warning: Background not loaded, rendering without it\n";
    }
    if (!config.noiseTexture.empty() && !session.hasNoiseTexture()) {
        std::cerr << "Warning: Noise texture not loaded, rendering without grain\n";
    }

    session.attachPreset(config.surfacePreset);

    double seconds = session.duration();
    if (options.duration > 0.0) {
        seconds = std::min(seconds, options.duration);
    }
    const double frameMs = 1000.0 / config.recordFps;
    const uint64_t totalFrames = static_cast<uint64_t>(std::ceil(seconds * config.recordFps));

    auto writer = std::make_shared<io::PngSequenceWriter>(options.outputDir);
    session.startRecording(writer);
    session.play();

    std::cout << "Rendering " << totalFrames << " frames (" << seconds << "s @ "
              << config.recordFps << " fps) to " << options.outputDir << "\n";

    for (uint64_t frame = 0; frame < totalFrames; frame++) {
        if (!session.tick()) {
            break;
        }
        clock->advance(frameMs);

        if ((frame + 1) % 60 == 0 || frame + 1 == totalFrames) {
            std::cout << "\r  " << (frame + 1) << " / " << totalFrames << std::flush;
        }
    }
    std::cout << "\n";

    session.stopRecording();

    if (writer->framesWritten() != session.recordedFrames()) {
        std::cerr << "Error: " << (session.recordedFrames() - writer->framesWritten())
                  << " frames could not be written\n";
        return 1;
    }

    std::cout << "Wrote " << writer->framesWritten() << " frames\n";
    return 0;
}

int writeNoise(const std::string& path, int size, const std::string& style, uint32_t seed) {
    io::NoiseStyle noiseStyle;
    if (!io::parseNoiseStyle(style, noiseStyle)) {
        std::cerr << "Error: Unknown noise style '" << style << "' (expected white or warm)\n";
        return 1;
    }

    if (!io::writePNG(path, io::makeNoiseTexture(size, noiseStyle, seed))) {
        return 1;
    }
    std::cout << "Wrote " << size << "x" << size << " " << style << " noise to " << path << "\n";
    return 0;
}

int writeDefaultConfig(const std::string& path) {
    VisualizerConfig config;
    if (!config.saveFile(path)) {
        return 1;
    }
    std::cout << "Wrote default configuration to " << path << "\n";
    return 0;
}

int handleCommand(int argc, char** argv) {
    CLI::App app{"Auroscuro - Audio-reactive visual renderer"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    // 'render' subcommand
    RenderOptions render;
    auto* renderCmd = app.add_subcommand("render", "Render audio to a PNG frame sequence");
    renderCmd->add_option("audio", render.audioPath, "Audio file (wav, mp3, flac)")
             ->required()
             ->check(CLI::ExistingFile);
    renderCmd->add_option("-b,--background", render.backgroundPath, "Background image");
    renderCmd->add_option("-n,--noise", render.noisePath, "Grain texture (default: generated)");
    renderCmd->add_option("-c,--config", render.configPath, "Configuration JSON")
             ->check(CLI::ExistingFile);
    renderCmd->add_option("-p,--preset", render.preset, "Surface preset: 9:16, 1:1, 16:9");
    renderCmd->add_option("--dpr", render.devicePixelRatio, "Device pixel ratio");
    renderCmd->add_option("--fps", render.fps, "Frames per second");
    renderCmd->add_option("-o,--output", render.outputDir, "Output directory")
             ->default_val("frames");
    renderCmd->add_option("--duration", render.duration, "Seconds to render (default: whole track)");

    // 'noise' subcommand
    std::string noisePath;
    int noiseSize = 512;
    std::string noiseStyle = "white";
    uint32_t noiseSeed = 1;
    auto* noiseCmd = app.add_subcommand("noise", "Generate a tileable grain texture");
    noiseCmd->add_option("output", noisePath, "Output PNG")->required();
    noiseCmd->add_option("--size", noiseSize, "Edge length in pixels")
            ->default_val(512)
            ->check(CLI::Range(1, io::MAX_NOISE_SIZE));
    noiseCmd->add_option("--style", noiseStyle, "white or warm")->default_val("white");
    noiseCmd->add_option("--seed", noiseSeed, "Random seed")->default_val(1);

    // 'config' subcommand
    std::string configPath;
    auto* configCmd = app.add_subcommand("config", "Write the default configuration");
    configCmd->add_option("output", configPath, "Output JSON")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (renderCmd->parsed()) {
        return renderAudio(render);
    }

    if (noiseCmd->parsed()) {
        return writeNoise(noisePath, noiseSize, noiseStyle, noiseSeed);
    }

    if (configCmd->parsed()) {
        return writeDefaultConfig(configPath);
    }

    return 0;
}

} // namespace auroscuro::cli
