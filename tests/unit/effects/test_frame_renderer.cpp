/**
 * @file test_frame_renderer.cpp
 * @brief Unit tests for FrameRenderer layering and resource caching
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auroscuro/effects/frame_renderer.h>
#include <auroscuro/io/noise_texture.h>

#include <memory>

using namespace auroscuro;
using namespace auroscuro::effects;
using Catch::Matchers::WithinAbs;

static std::shared_ptr<const io::ImageData> solidImage(int w, int h, uint8_t r, uint8_t g, uint8_t b) {
    auto img = std::make_shared<io::ImageData>();
    img->width = w;
    img->height = h;
    img->channels = 4;
    img->pixels.resize(static_cast<size_t>(w) * h * 4);
    for (size_t i = 0; i < img->pixels.size(); i += 4) {
        img->pixels[i + 0] = r;
        img->pixels[i + 1] = g;
        img->pixels[i + 2] = b;
        img->pixels[i + 3] = 255;
    }
    return img;
}

// Glows and grain only, no global desaturation
static RenderConfig plainConfig() {
    RenderConfig cfg;
    cfg.desaturateAlpha = 0.0f;
    return cfg;
}

TEST_CASE("FrameRenderer coverSize", "[effects][renderer]") {
    SECTION("wide image in a square box crops the sides") {
        glm::vec2 s = FrameRenderer::coverSize(200, 100, 100.0f, 100.0f);
        REQUIRE_THAT(s.x, WithinAbs(200.0f, 1e-4));
        REQUIRE_THAT(s.y, WithinAbs(100.0f, 1e-4));
    }

    SECTION("tall image in a wide box crops top and bottom") {
        glm::vec2 s = FrameRenderer::coverSize(100, 200, 160.0f, 90.0f);
        REQUIRE_THAT(s.x, WithinAbs(160.0f, 1e-4));
        REQUIRE_THAT(s.y, WithinAbs(320.0f, 1e-4));
    }

    SECTION("matching aspect fills exactly") {
        glm::vec2 s = FrameRenderer::coverSize(16, 9, 1920.0f, 1080.0f);
        REQUIRE_THAT(s.x, WithinAbs(1920.0f, 1e-2));
        REQUIRE_THAT(s.y, WithinAbs(1080.0f, 1e-2));
    }

    SECTION("degenerate inputs give zero") {
        REQUIRE(FrameRenderer::coverSize(0, 10, 10.0f, 10.0f) == glm::vec2(0.0f));
        REQUIRE(FrameRenderer::coverSize(10, 10, 0.0f, 10.0f) == glm::vec2(0.0f));
    }
}

TEST_CASE("FrameRenderer surface setup", "[effects][renderer]") {
    FrameRenderer renderer;
    FrameInputs inputs;

    SECTION("invalid surface draws nothing") {
        renderer.render({0, 0, 1.0f}, inputs);
        renderer.render({64, 36, 0.0f}, inputs);
        REQUIRE(renderer.canvas().empty());
        REQUIRE(renderer.gradientRebuilds() == 0);
    }

    SECTION("backing store is sized in device pixels") {
        renderer.render({64, 36, 2.0f}, inputs);
        REQUIRE(renderer.canvas().width() == 128);
        REQUIRE(renderer.canvas().height() == 72);
        REQUIRE(renderer.resources().centerGlow != nullptr);
        REQUIRE(renderer.resources().edgeGlow != nullptr);
    }

    SECTION("gradients are rebuilt only when size or ratio changes") {
        renderer.render({64, 36, 1.0f}, inputs);
        renderer.render({64, 36, 1.0f}, inputs);
        renderer.render({64, 36, 1.0f}, inputs);
        REQUIRE(renderer.gradientRebuilds() == 1);
        auto center = renderer.resources().centerGlow;

        renderer.render({36, 64, 1.0f}, inputs);
        REQUIRE(renderer.gradientRebuilds() == 2);
        REQUIRE(renderer.resources().centerGlow != center);

        renderer.render({36, 64, 1.5f}, inputs);
        renderer.render({36, 64, 1.5f}, inputs);
        REQUIRE(renderer.gradientRebuilds() == 3);
    }

    SECTION("intensity changes alone never rebuild") {
        for (int i = 0; i < 10; i++) {
            inputs.params.centerIntensity = i / 10.0f;
            inputs.params.edgeIntensity = 1.0f - i / 10.0f;
            renderer.render({64, 36, 1.0f}, inputs);
        }
        REQUIRE(renderer.gradientRebuilds() == 1);
    }
}

TEST_CASE("FrameRenderer glow layers", "[effects][renderer]") {
    FrameRenderer renderer(plainConfig());
    FrameInputs inputs;
    const SurfaceSize size{64, 36, 1.0f};

    SECTION("zero intensity leaves the surface clear") {
        renderer.render(size, inputs);
        REQUIRE(renderer.canvas().pixel(32, 18) == glm::vec4(0.0f));
        REQUIRE(renderer.canvas().pixel(0, 0) == glm::vec4(0.0f));
    }

    SECTION("center glow is strongest in the middle") {
        inputs.params.centerIntensity = 1.0f;
        renderer.render(size, inputs);

        glm::vec4 middle = renderer.canvas().pixel(32, 18);
        glm::vec4 corner = renderer.canvas().pixel(0, 0);
        REQUIRE_THAT(middle.a, WithinAbs(0.6f, 0.02f));
        REQUIRE(middle.a > corner.a);
        REQUIRE(middle.r > middle.b);
    }

    SECTION("edge glow is strongest at the boundary") {
        inputs.params.edgeIntensity = 1.0f;
        renderer.render(size, inputs);

        glm::vec4 middle = renderer.canvas().pixel(32, 18);
        glm::vec4 corner = renderer.canvas().pixel(0, 0);
        REQUIRE(middle.a == 0.0f);
        REQUIRE(corner.a > 0.0f);
    }

    SECTION("each frame starts from a cleared surface") {
        inputs.params.centerIntensity = 1.0f;
        renderer.render(size, inputs);
        inputs.params.centerIntensity = 0.0f;
        renderer.render(size, inputs);
        REQUIRE(renderer.canvas().pixel(32, 18) == glm::vec4(0.0f));
    }
}

TEST_CASE("FrameRenderer background", "[effects][renderer]") {
    FrameRenderer renderer(plainConfig());
    FrameInputs inputs;
    const SurfaceSize size{64, 36, 1.0f};

    SECTION("cover-fit with overscan reaches every corner, even rotated") {
        inputs.background = solidImage(4, 4, 255, 0, 0);
        inputs.params.background.angleRadians = 0.035f;
        renderer.render(size, inputs);

        for (auto p : {glm::ivec2(0, 0), glm::ivec2(63, 0), glm::ivec2(0, 35), glm::ivec2(63, 35)}) {
            glm::vec4 c = renderer.canvas().pixel(p.x, p.y);
            REQUIRE_THAT(c.a, WithinAbs(1.0f, 1e-5));
            REQUIRE_THAT(c.r, WithinAbs(1.0f, 1e-5));
        }
    }

    SECTION("brightness filter applies to the image") {
        inputs.background = solidImage(4, 4, 255, 255, 255);
        inputs.params.background.brightness = 0.5f;
        renderer.render(size, inputs);
        REQUIRE_THAT(renderer.canvas().pixel(32, 18).r, WithinAbs(0.5f, 1e-5));
    }

    SECTION("filter does not leak into later layers") {
        inputs.background = solidImage(4, 4, 0, 0, 0);
        inputs.params.background.brightness = 0.0f;
        inputs.params.centerIntensity = 1.0f;
        renderer.render(size, inputs);
        REQUIRE(renderer.canvas().pixel(32, 18).r > 0.3f);
    }

    SECTION("missing background skips the layer") {
        inputs.background = solidImage(4, 4, 255, 0, 0);
        renderer.render(size, inputs);
        inputs.background = nullptr;
        renderer.render(size, inputs);
        REQUIRE(renderer.canvas().pixel(0, 0) == glm::vec4(0.0f));

        inputs.background = std::make_shared<io::ImageData>();
        renderer.render(size, inputs);
        REQUIRE(renderer.canvas().pixel(0, 0) == glm::vec4(0.0f));
    }
}

TEST_CASE("FrameRenderer grain pattern cache", "[effects][renderer]") {
    FrameRenderer renderer(plainConfig());
    FrameInputs inputs;
    inputs.background = solidImage(4, 4, 128, 128, 128);
    inputs.params.grainOpacity = 0.3f;
    const SurfaceSize size{32, 32, 1.0f};

    auto noiseA = std::make_shared<const io::ImageData>(io::makeNoiseTexture(16, io::NoiseStyle::White, 1));
    auto noiseB = std::make_shared<const io::ImageData>(io::makeNoiseTexture(16, io::NoiseStyle::Warm, 2));

    SECTION("pattern built once per texture") {
        inputs.noise = noiseA;
        renderer.render(size, inputs);
        renderer.render(size, inputs);
        renderer.render(size, inputs);
        REQUIRE(renderer.patternRebuilds() == 1);

        inputs.noise = noiseB;
        renderer.render(size, inputs);
        renderer.render(size, inputs);
        REQUIRE(renderer.patternRebuilds() == 2);
        REQUIRE(renderer.resources().grainSource == noiseB.get());
    }

    SECTION("new backing store rebuilds the pattern") {
        inputs.noise = noiseA;
        renderer.render(size, inputs);
        renderer.render({32, 32, 2.0f}, inputs);
        REQUIRE(renderer.patternRebuilds() == 2);
    }

    SECTION("negligible opacity skips grain") {
        inputs.noise = noiseA;
        inputs.params.grainOpacity = 0.01f;
        renderer.render(size, inputs);
        REQUIRE(renderer.patternRebuilds() == 0);
        REQUIRE_THAT(renderer.canvas().pixel(5, 5).r, WithinAbs(128.0f / 255.0f, 1e-5));
    }

    SECTION("grain varies the image") {
        inputs.noise = noiseA;
        renderer.render(size, inputs);

        bool varied = false;
        float first = renderer.canvas().pixel(0, 0).r;
        for (int x = 1; x < 16 && !varied; x++) {
            varied = renderer.canvas().pixel(x, 0).r != first;
        }
        REQUIRE(varied);
    }

    SECTION("no texture means no grain") {
        renderer.render(size, inputs);
        REQUIRE(renderer.patternRebuilds() == 0);
        REQUIRE(renderer.resources().grain == nullptr);
    }
}

TEST_CASE("FrameRenderer desaturation pass", "[effects][renderer]") {
    FrameInputs inputs;
    inputs.background = solidImage(4, 4, 255, 0, 0);
    const SurfaceSize size{16, 16, 1.0f};

    FrameRenderer plain(plainConfig());
    FrameRenderer muted;
    plain.render(size, inputs);
    muted.render(size, inputs);

    glm::vec4 a = plain.canvas().pixel(8, 8);
    glm::vec4 b = muted.canvas().pixel(8, 8);

    // Less saturated, still opaque
    REQUIRE((b.r - b.b) < (a.r - a.b));
    REQUIRE_THAT(b.a, WithinAbs(1.0f, 1e-5));
}
