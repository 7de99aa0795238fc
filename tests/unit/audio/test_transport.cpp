/**
 * @file test_transport.cpp
 * @brief Unit tests for Transport position tracking
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auroscuro/audio/transport.h>

using namespace auroscuro;
using namespace auroscuro::audio;
using Catch::Matchers::WithinAbs;

static std::shared_ptr<const DecodedAudio> makeBuffer(double seconds, uint32_t rate = 1000) {
    auto audio = std::make_shared<DecodedAudio>();
    audio->sampleRate = rate;
    audio->sourceChannels = 1;
    audio->samples.assign(static_cast<size_t>(seconds * rate), 0.0f);
    return audio;
}

TEST_CASE("Transport without a buffer", "[audio][transport]") {
    auto clock = std::make_shared<ManualClock>();
    Transport transport(clock);

    REQUIRE_FALSE(transport.hasBuffer());
    transport.play();
    REQUIRE_FALSE(transport.isPlaying());
    REQUIRE(transport.position() == 0.0);
    REQUIRE(transport.positionFrames() == 0);
    REQUIRE_FALSE(transport.update());

    SECTION("an invalid buffer does not count") {
        transport.setAudio(std::make_shared<DecodedAudio>());
        REQUIRE_FALSE(transport.hasBuffer());
    }
}

TEST_CASE("Transport play, pause and seek", "[audio][transport]") {
    auto clock = std::make_shared<ManualClock>(5000.0);
    Transport transport(clock);
    transport.setAudio(makeBuffer(1.0));

    REQUIRE(transport.hasBuffer());
    REQUIRE_THAT(transport.duration(), WithinAbs(1.0, 1e-9));

    transport.play();
    REQUIRE(transport.isPlaying());
    clock->advance(250.0);
    REQUIRE_THAT(transport.position(), WithinAbs(0.25, 1e-9));
    REQUIRE(transport.positionFrames() == 250);

    SECTION("pause freezes the position") {
        transport.pause();
        clock->advance(500.0);
        REQUIRE_FALSE(transport.isPlaying());
        REQUIRE_THAT(transport.position(), WithinAbs(0.25, 1e-9));

        transport.play();
        clock->advance(250.0);
        REQUIRE_THAT(transport.position(), WithinAbs(0.5, 1e-9));
    }

    SECTION("toggle alternates") {
        transport.toggle();
        REQUIRE_FALSE(transport.isPlaying());
        transport.toggle();
        REQUIRE(transport.isPlaying());
    }

    SECTION("seek clamps to the buffer") {
        transport.seek(-3.0);
        REQUIRE_THAT(transport.position(), WithinAbs(0.0, 1e-9));
        transport.seek(0.75);
        REQUIRE_THAT(transport.position(), WithinAbs(0.75, 1e-9));
        transport.seek(10.0);
        REQUIRE_THAT(transport.position(), WithinAbs(1.0, 1e-9));
    }

    SECTION("stop rewinds") {
        transport.stop();
        REQUIRE_FALSE(transport.isPlaying());
        REQUIRE(transport.position() == 0.0);
    }

    SECTION("natural end stops and rewinds") {
        clock->advance(700.0);
        REQUIRE_FALSE(transport.update());
        clock->advance(100.0);
        REQUIRE(transport.update());
        REQUIRE_FALSE(transport.isPlaying());
        REQUIRE(transport.position() == 0.0);
        REQUIRE_FALSE(transport.update());
    }

    SECTION("new audio stops and rewinds") {
        transport.setAudio(makeBuffer(2.0));
        REQUIRE_FALSE(transport.isPlaying());
        REQUIRE(transport.position() == 0.0);
    }
}
