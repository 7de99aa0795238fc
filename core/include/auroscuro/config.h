#pragma once

/**
 * @file config.h
 * @brief Every tunable of a visualizer session, with JSON persistence
 *
 * Missing keys keep their defaults and unknown keys are ignored, so a config
 * file only needs to name what it changes.
 *
 * @par Example
 * @code
 * VisualizerConfig config;
 * if (!config.loadFile("look.json")) {
 *     // defaults are still in place
 * }
 * VisualizerSession session(config);
 * @endcode
 */

#include <auroscuro/audio/analyser.h>
#include <auroscuro/audio/beat_detect.h>
#include <auroscuro/effects/frame_renderer.h>
#include <auroscuro/io/noise_texture.h>
#include <auroscuro/mapping.h>
#include <cstdint>
#include <string>
#include <vector>

namespace auroscuro {

/// @brief Named logical surface size
struct SurfacePreset {
    std::string name;   ///< Aspect label, e.g. "16:9"
    int width = 0;
    int height = 0;
};

/// @brief Built-in presets: 9:16, 1:1, 16:9
const std::vector<SurfacePreset>& surfacePresets();

/// @brief Look up a preset by name, false if unknown
bool findSurfacePreset(const std::string& name, SurfacePreset& out);

inline constexpr const char* DEFAULT_SURFACE_PRESET = "16:9";

struct VisualizerConfig {
    audio::AnalyserConfig analyser;
    audio::BeatDetectorConfig detector;
    MapperConfig mapper;
    effects::RenderConfig render;

    /// @name Surface
    /// @{
    std::string surfacePreset = DEFAULT_SURFACE_PRESET;
    float devicePixelRatio = 1.0f;
    /// @}

    /// @name Timing
    /// @{
    double tickRate = 60.0;     ///< Scheduler ticks per second
    double recordFps = 60.0;    ///< Captured frames per second
    /// @}

    /// @name Grain texture
    /// @{
    std::string noiseTexture;                   ///< Image path; empty generates one
    io::NoiseStyle noiseStyle = io::NoiseStyle::White;
    int noiseSize = 512;
    uint32_t noiseSeed = 1;
    /// @}

    /// @brief Logical surface for the configured preset and pixel ratio
    /// @return Invalid size if the preset name is unknown
    effects::SurfaceSize surfaceSize() const;

    /// @brief Apply values from a JSON document
    /// @return false on malformed input (the config is left unchanged)
    bool fromJsonString(const std::string& text);

    std::string toJsonString() const;

    bool loadFile(const std::string& path);
    bool saveFile(const std::string& path) const;
};

} // namespace auroscuro
