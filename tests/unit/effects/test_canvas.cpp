/**
 * @file test_canvas.cpp
 * @brief Unit tests for the software Canvas
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <auroscuro/effects/canvas.h>

#include <memory>

using namespace auroscuro;
using namespace auroscuro::effects;
using Catch::Matchers::WithinAbs;

static std::shared_ptr<io::ImageData> solidImage(int w, int h, uint8_t r, uint8_t g, uint8_t b) {
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

TEST_CASE("Canvas surface", "[effects][canvas]") {
    Canvas canvas;
    REQUIRE(canvas.empty());

    canvas.resize(8, 4);
    REQUIRE(canvas.width() == 8);
    REQUIRE(canvas.height() == 4);
    REQUIRE(canvas.pixels().size() == 32);
    uint64_t gen = canvas.generation();

    SECTION("resize clears pixels and state") {
        canvas.fillStyle(1.0f, 1.0f, 1.0f);
        canvas.fillRect(0, 0, 8, 4);
        canvas.scale(2.0f);
        canvas.globalAlpha(0.5f);

        canvas.resize(8, 4);
        REQUIRE(canvas.generation() == gen + 1);
        REQUIRE(canvas.pixel(0, 0) == glm::vec4(0.0f));
        REQUIRE(canvas.getTransform() == glm::mat3(1.0f));
        REQUIRE(canvas.globalAlpha() == 1.0f);
    }

    SECTION("out-of-range pixel reads are transparent") {
        REQUIRE(canvas.pixel(-1, 0) == glm::vec4(0.0f));
        REQUIRE(canvas.pixel(8, 0) == glm::vec4(0.0f));
    }
}

TEST_CASE("Canvas fill and clear", "[effects][canvas]") {
    Canvas canvas(4, 4);
    const glm::vec4 teal(0.0f, 0.5f, 0.5f, 1.0f);

    SECTION("fillRect covers exactly the rectangle") {
        canvas.fillStyle(teal);
        canvas.fillRect(1, 1, 2, 2);
        REQUIRE(canvas.pixel(1, 1) == teal);
        REQUIRE(canvas.pixel(2, 2) == teal);
        REQUIRE(canvas.pixel(0, 0) == glm::vec4(0.0f));
        REQUIRE(canvas.pixel(3, 3) == glm::vec4(0.0f));
    }

    SECTION("scale transform draws in logical pixels") {
        canvas.scale(2.0f);
        canvas.fillStyle(teal);
        canvas.fillRect(0, 0, 1, 1);
        REQUIRE(canvas.pixel(0, 0) == teal);
        REQUIRE(canvas.pixel(1, 1) == teal);
        REQUIRE(canvas.pixel(2, 2) == glm::vec4(0.0f));
    }

    SECTION("clearRect makes pixels transparent") {
        canvas.fillStyle(teal);
        canvas.fillRect(0, 0, 4, 4);
        canvas.clearRect(0, 0, 2, 4);
        REQUIRE(canvas.pixel(1, 3) == glm::vec4(0.0f));
        REQUIRE(canvas.pixel(2, 3) == teal);
    }

    SECTION("globalAlpha scales coverage and ignores out-of-range values") {
        canvas.globalAlpha(0.25f);
        canvas.globalAlpha(1.5f);
        canvas.globalAlpha(-0.1f);
        REQUIRE(canvas.globalAlpha() == 0.25f);

        canvas.fillStyle(teal);
        canvas.fillRect(0, 0, 4, 4);
        REQUIRE_THAT(canvas.pixel(0, 0).a, WithinAbs(0.25f, 1e-6));
    }

    SECTION("save and restore") {
        canvas.save();
        canvas.fillStyle(teal);
        canvas.globalAlpha(0.5f);
        canvas.blendMode(BlendMode::Screen);
        canvas.translate(1.0f, 1.0f);
        canvas.restore();

        REQUIRE(canvas.globalAlpha() == 1.0f);
        REQUIRE(canvas.blendMode() == BlendMode::Over);
        REQUIRE(canvas.getTransform() == glm::mat3(1.0f));
        REQUIRE(canvas.state().fillColor == glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));

        // Unbalanced restore is harmless
        canvas.restore();
    }

    SECTION("filter brightens what is drawn") {
        canvas.filter({2.0f, 1.0f});
        canvas.fillStyle(0.25f, 0.25f, 0.25f);
        canvas.fillRect(0, 0, 4, 4);
        REQUIRE_THAT(canvas.pixel(0, 0).r, WithinAbs(0.5f, 1e-6));
    }
}

TEST_CASE("Canvas transforms", "[effects][canvas]") {
    Canvas canvas(10, 10);

    SECTION("translate then scale composes") {
        canvas.translate(2.0f, 3.0f);
        canvas.scale(2.0f);
        glm::vec3 p = canvas.getTransform() * glm::vec3(1.0f, 1.0f, 1.0f);
        REQUIRE_THAT(p.x, WithinAbs(4.0f, 1e-6));
        REQUIRE_THAT(p.y, WithinAbs(5.0f, 1e-6));
    }

    SECTION("rotate a quarter turn") {
        canvas.rotate(3.14159265f * 0.5f);
        glm::vec3 p = canvas.getTransform() * glm::vec3(1.0f, 0.0f, 1.0f);
        REQUIRE_THAT(p.x, WithinAbs(0.0f, 1e-6));
        REQUIRE_THAT(p.y, WithinAbs(1.0f, 1e-6));
    }

    SECTION("zero scale draws nothing") {
        canvas.scale(0.0f);
        canvas.fillStyle(1.0f, 0.0f, 0.0f);
        canvas.fillRect(0, 0, 10, 10);
        REQUIRE(canvas.pixel(0, 0) == glm::vec4(0.0f));
    }
}

TEST_CASE("CanvasGradient", "[effects][canvas]") {
    Canvas canvas(4, 4);

    SECTION("linear gradient interpolates between stops") {
        CanvasGradient g = canvas.createLinearGradient(0, 0, 10, 0);
        g.addColorStop(1.0f, 0.0f, 0.0f, 1.0f);
        g.addColorStop(0.0f, 1.0f, 0.0f, 0.0f);
        REQUIRE(g.colorStops.front().offset == 0.0f);

        REQUIRE(g.sample({0, 0}) == glm::vec4(1, 0, 0, 1));
        REQUIRE(g.sample({20, 0}) == glm::vec4(0, 0, 1, 1));
        glm::vec4 mid = g.sample({5, 0});
        REQUIRE_THAT(mid.r, WithinAbs(0.5f, 1e-6));
        REQUIRE_THAT(mid.b, WithinAbs(0.5f, 1e-6));
    }

    SECTION("fading to transparent keeps the color") {
        CanvasGradient g = canvas.createRadialGradient(0, 0, 0, 0, 0, 10);
        g.addColorStop(0.0f, 1.0f, 0.5f, 0.0f, 1.0f);
        g.addColorStop(1.0f, 1.0f, 0.5f, 0.0f, 0.0f);

        glm::vec4 c = g.sample({5, 0});
        REQUIRE_THAT(c.r, WithinAbs(1.0f, 1e-6));
        REQUIRE_THAT(c.g, WithinAbs(0.5f, 1e-6));
        REQUIRE_THAT(c.a, WithinAbs(0.5f, 1e-6));
        REQUIRE(g.sample({0, 10}).a == 0.0f);
    }

    SECTION("extra stops beyond the limit are ignored") {
        CanvasGradient g;
        for (int i = 0; i < 12; i++) {
            g.addColorStop(i / 11.0f, 1.0f, 1.0f, 1.0f);
        }
        REQUIRE(g.colorStops.size() == CanvasGradient::MAX_COLOR_STOPS);
    }

    SECTION("gradient fill through the canvas") {
        auto g = std::make_shared<CanvasGradient>(canvas.createLinearGradient(0, 0, 4, 0));
        g->addColorStop(0.0f, 0.0f, 0.0f, 0.0f);
        g->addColorStop(1.0f, 1.0f, 1.0f, 1.0f);
        canvas.fillStyle(g);
        canvas.fillRect(0, 0, 4, 4);
        REQUIRE(canvas.pixel(0, 0).r < canvas.pixel(3, 0).r);
    }
}

TEST_CASE("CanvasPattern", "[effects][canvas]") {
    auto img = std::make_shared<io::ImageData>();
    img->width = 2;
    img->height = 1;
    img->channels = 4;
    img->pixels = {255, 0, 0, 255, 0, 0, 255, 255};

    Canvas canvas(4, 2);

    SECTION("repeat tiles in both directions") {
        CanvasPattern p(img, PatternRepeat::Repeat);
        REQUIRE(p.sample({0.5f, 0.5f}) == p.sample({2.5f, 0.5f}));
        REQUIRE(p.sample({1.5f, 0.5f}) == p.sample({-0.5f, 3.5f}));
        REQUIRE(p.sample({0.5f, 0.5f}).r == 1.0f);
        REQUIRE(p.sample({1.5f, 0.5f}).b == 1.0f);
    }

    SECTION("no-repeat is transparent outside the image") {
        CanvasPattern p(img, PatternRepeat::NoRepeat);
        REQUIRE(p.sample({2.5f, 0.5f}) == glm::vec4(0.0f));
    }

    SECTION("createPattern rejects missing images") {
        REQUIRE(canvas.createPattern(nullptr) == nullptr);
        REQUIRE(canvas.createPattern(std::make_shared<io::ImageData>()) == nullptr);
        REQUIRE(canvas.createPattern(img) != nullptr);
    }

    SECTION("pattern fill tiles across the surface") {
        canvas.fillStyle(std::shared_ptr<const CanvasPattern>(canvas.createPattern(img)));
        canvas.fillRect(0, 0, 4, 2);
        REQUIRE(canvas.pixel(0, 0) == canvas.pixel(2, 1));
        REQUIRE(canvas.pixel(1, 0) == canvas.pixel(3, 1));
    }
}

TEST_CASE("Canvas drawImage and snapshot", "[effects][canvas]") {
    Canvas canvas(6, 6);
    auto img = solidImage(2, 2, 255, 128, 0);

    SECTION("stretched solid image fills its rectangle") {
        canvas.drawImage(*img, 0, 0, 6, 6);
        glm::vec4 c = canvas.pixel(3, 3);
        REQUIRE_THAT(c.r, WithinAbs(1.0f, 1e-6));
        REQUIRE_THAT(c.g, WithinAbs(128.0f / 255.0f, 1e-6));
        REQUIRE(c.a == 1.0f);
    }

    SECTION("invalid image draws nothing") {
        canvas.drawImage(io::ImageData{}, 0, 0, 6, 6);
        REQUIRE(canvas.pixel(3, 3) == glm::vec4(0.0f));
    }

    SECTION("snapshot rounds to bytes") {
        canvas.drawImage(*img, 0, 0, 6, 6);
        io::ImageData out = canvas.snapshot();
        REQUIRE(out.valid());
        REQUIRE(out.width == 6);
        REQUIRE(out.pixels[0] == 255);
        REQUIRE(out.pixels[1] == 128);
        REQUIRE(out.pixels[2] == 0);
        REQUIRE(out.pixels[3] == 255);
    }

    SECTION("empty canvas snapshots to an invalid image") {
        Canvas empty;
        REQUIRE_FALSE(empty.snapshot().valid());
    }
}
