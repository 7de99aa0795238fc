// Auroscuro CLI Commands
// Handles: auroscuro render, auroscuro noise, auroscuro config, --help, --version

#pragma once

#include <cstdint>
#include <string>

namespace auroscuro::cli {

// Version info
constexpr const char* VERSION = "1.0.0";

// Offline render settings; empty / zero fields fall back to the config file
struct RenderOptions {
    std::string audioPath;
    std::string backgroundPath;
    std::string noisePath;
    std::string configPath;
    std::string preset;
    std::string outputDir = "frames";
    float devicePixelRatio = 0.0f;
    double fps = 0.0;
    double duration = 0.0;   // Seconds; 0 renders the whole track
};

// Parse argv and run the chosen subcommand, returning the exit code
int handleCommand(int argc, char** argv);

// Render audio to a PNG sequence on a stepped clock
int renderAudio(const RenderOptions& options);

// Write a tileable grain texture
int writeNoise(const std::string& path, int size, const std::string& style, uint32_t seed);

// Write the default configuration as JSON
int writeDefaultConfig(const std::string& path);

} // namespace auroscuro::cli
