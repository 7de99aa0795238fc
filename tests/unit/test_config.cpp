/**
 * @file test_config.cpp
 * @brief Unit tests for VisualizerConfig defaults and JSON persistence
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auroscuro/config.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace auroscuro;
using Catch::Matchers::WithinAbs;

TEST_CASE("Surface presets", "[config]") {
    REQUIRE(surfacePresets().size() == 3);

    SurfacePreset p;
    REQUIRE(findSurfacePreset("9:16", p));
    REQUIRE(p.width == 1080);
    REQUIRE(p.height == 1920);

    REQUIRE(findSurfacePreset("1:1", p));
    REQUIRE(p.width == 1080);
    REQUIRE(p.height == 1080);

    REQUIRE(findSurfacePreset("16:9", p));
    REQUIRE(p.width == 1920);
    REQUIRE(p.height == 1080);

    REQUIRE_FALSE(findSurfacePreset("4:3", p));
}

TEST_CASE("VisualizerConfig defaults", "[config]") {
    VisualizerConfig config;

    REQUIRE(config.analyser.fftSize == 2048);
    REQUIRE_THAT(config.detector.beatThresholdMultiplier, WithinAbs(1.3f, 1e-6));
    REQUIRE_THAT(config.mapper.grain.baseOpacity, WithinAbs(0.05f, 1e-6));
    REQUIRE_THAT(config.render.overscan, WithinAbs(1.1f, 1e-6));
    REQUIRE(config.recordFps == 60.0);
    REQUIRE(config.noiseTexture.empty());

    effects::SurfaceSize size = config.surfaceSize();
    REQUIRE(size.width == 1920);
    REQUIRE(size.height == 1080);
    REQUIRE(size.pixelRatio == 1.0f);

    SECTION("unknown preset gives an invalid surface") {
        config.surfacePreset = "ultrawide";
        REQUIRE_FALSE(config.surfaceSize().valid());
    }
}

TEST_CASE("VisualizerConfig JSON parsing", "[config]") {
    VisualizerConfig config;

    SECTION("partial documents only change what they name") {
        REQUIRE(config.fromJsonString(R"({
            "detector": { "beatCooldownMs": 200, "bassRange": [0.0, 0.2] },
            "surface": { "preset": "9:16", "devicePixelRatio": 2 },
            "noise": { "style": "warm" }
        })"));

        REQUIRE_THAT(config.detector.beatCooldownMs, WithinAbs(200.0f, 1e-6));
        REQUIRE_THAT(config.detector.bassRange.endFrac, WithinAbs(0.2f, 1e-6));
        REQUIRE_THAT(config.detector.beatDecay, WithinAbs(0.9f, 1e-6));
        REQUIRE(config.surfacePreset == "9:16");
        REQUIRE(config.devicePixelRatio == 2.0f);
        REQUIRE(config.noiseStyle == io::NoiseStyle::Warm);
        REQUIRE(config.surfaceSize().height == 1920);
    }

    SECTION("colors accept rgb or rgba arrays") {
        REQUIRE(config.fromJsonString(R"({
            "render": { "centerGlow": { "color": [1, 0, 0] }, "desaturateColor": [0.1, 0.2, 0.3, 0.4] }
        })"));
        REQUIRE(config.render.centerGlow.color == glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        REQUIRE_THAT(config.render.desaturateColor.a, WithinAbs(0.4f, 1e-6));
    }

    SECTION("wrong types are ignored") {
        REQUIRE(config.fromJsonString(R"({ "detector": { "beatDecay": "fast" }, "mapper": 3 })"));
        REQUIRE_THAT(config.detector.beatDecay, WithinAbs(0.9f, 1e-6));
    }

    SECTION("unknown keys are ignored") {
        REQUIRE(config.fromJsonString(R"({ "future": { "thing": true } })"));
    }

    SECTION("malformed text is rejected and nothing changes") {
        REQUIRE_FALSE(config.fromJsonString(R"({ "detector": { "beatDecay": 0.5 )"));
        REQUIRE_THAT(config.detector.beatDecay, WithinAbs(0.9f, 1e-6));
    }

    SECTION("top level must be an object") {
        REQUIRE_FALSE(config.fromJsonString("[1, 2, 3]"));
    }
}

TEST_CASE("VisualizerConfig survives save and load", "[config]") {
    VisualizerConfig original;
    original.detector.beatThresholdMultiplier = 1.6f;
    original.mapper.edge = {0.1f, 0.2f, 0.3f};
    original.render.edgeGlow.strength = 0.75f;
    original.surfacePreset = "1:1";
    original.recordFps = 30.0;
    original.noiseSeed = 77;

    fs::path path = fs::temp_directory_path() / "auroscuro-test-config.json";
    REQUIRE(original.saveFile(path.string()));

    VisualizerConfig loaded;
    REQUIRE(loaded.loadFile(path.string()));
    fs::remove(path);

    REQUIRE_THAT(loaded.detector.beatThresholdMultiplier, WithinAbs(1.6f, 1e-6));
    REQUIRE_THAT(loaded.mapper.edge.beat, WithinAbs(0.3f, 1e-6));
    REQUIRE_THAT(loaded.render.edgeGlow.strength, WithinAbs(0.75f, 1e-6));
    REQUIRE(loaded.surfacePreset == "1:1");
    REQUIRE(loaded.recordFps == 30.0);
    REQUIRE(loaded.noiseSeed == 77);

    SECTION("missing files fail without touching the config") {
        VisualizerConfig untouched;
        REQUIRE_FALSE(untouched.loadFile("/nonexistent/auroscuro.json"));
        REQUIRE(untouched.surfacePreset == "16:9");
    }
}
