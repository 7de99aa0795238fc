/**
 * @file test_frame_writer.cpp
 * @brief Unit tests for PNG sequence output
 */

#include <catch2/catch_test_macros.hpp>
#include <auroscuro/io/frame_writer.h>
#include <auroscuro/io/noise_texture.h>

#include <filesystem>

namespace fs = std::filesystem;
using namespace auroscuro::io;

TEST_CASE("PngSequenceWriter", "[io][frames]") {
    fs::path dir = fs::temp_directory_path() / "auroscuro-test-frames";
    fs::remove_all(dir);

    PngSequenceWriter writer(dir.string(), "shot");

    SECTION("frame paths are zero padded") {
        REQUIRE(fs::path(writer.pathFor(7)).filename() == "shot_000007.png");
        REQUIRE(fs::path(writer.pathFor(123456)).filename() == "shot_123456.png");
    }

    SECTION("writes decodable PNGs into a new directory") {
        ImageData frame = makeNoiseTexture(8, NoiseStyle::Warm, 9);
        REQUIRE(writer.writeFrame(frame, 0));
        REQUIRE(writer.writeFrame(frame, 1));
        REQUIRE(writer.framesWritten() == 2);

        ImageData back = loadImage(writer.pathFor(1));
        REQUIRE(back.valid());
        REQUIRE(back.width == 8);
        REQUIRE(back.pixels == frame.pixels);
    }

    SECTION("invalid frames are rejected") {
        REQUIRE_FALSE(writer.writeFrame(ImageData{}, 0));
        REQUIRE(writer.framesWritten() == 0);
    }

    fs::remove_all(dir);
}

TEST_CASE("Image loading failures", "[io][image]") {
    REQUIRE_FALSE(loadImage("/nonexistent/auroscuro.png").valid());
    REQUIRE_FALSE(fileExists("/nonexistent/auroscuro.png"));

    const uint8_t garbage[] = {1, 2, 3, 4, 5, 6, 7, 8};
    REQUIRE_FALSE(loadImageFromMemory(garbage, sizeof(garbage)).valid());
    REQUIRE_FALSE(loadImageFromMemory(nullptr, 0).valid());
}
