#include <auroscuro/effects/blend.h>
#include <algorithm>
#include <cmath>

namespace auroscuro::effects {

static float softLight(float cb, float cs) {
    if (cs <= 0.5f) {
        return cb - (1.0f - 2.0f * cs) * cb * (1.0f - cb);
    }
    float d = (cb <= 0.25f) ? ((16.0f * cb - 12.0f) * cb + 4.0f) * cb
                            : std::sqrt(cb);
    return cb + (2.0f * cs - 1.0f) * (d - cb);
}

static glm::vec3 clipColor(glm::vec3 c) {
    float l = luminosity(c);
    float n = std::min({c.r, c.g, c.b});
    float x = std::max({c.r, c.g, c.b});
    if (n < 0.0f && l - n > 1e-6f) {
        c = glm::vec3(l) + (c - glm::vec3(l)) * l / (l - n);
    }
    if (x > 1.0f && x - l > 1e-6f) {
        c = glm::vec3(l) + (c - glm::vec3(l)) * (1.0f - l) / (x - l);
    }
    return c;
}

static glm::vec3 setLum(const glm::vec3& c, float l) {
    float d = l - luminosity(c);
    return clipColor(c + glm::vec3(d));
}

static float saturation(const glm::vec3& c) {
    return std::max({c.r, c.g, c.b}) - std::min({c.r, c.g, c.b});
}

// Scale so max - min == s, keeping channel order
static glm::vec3 setSat(const glm::vec3& c, float s) {
    float mx = std::max({c.r, c.g, c.b});
    float mn = std::min({c.r, c.g, c.b});
    if (mx - mn <= 1e-6f) {
        return glm::vec3(0.0f);
    }
    return (c - glm::vec3(mn)) * s / (mx - mn);
}

glm::vec3 blendColor(BlendMode mode, const glm::vec3& cb, const glm::vec3& cs) {
    switch (mode) {
        case BlendMode::Over:
            return cs;
        case BlendMode::Add:
            return glm::min(cb + cs, glm::vec3(1.0f));
        case BlendMode::Multiply:
            return cb * cs;
        case BlendMode::Screen:
            return cb + cs - cb * cs;
        case BlendMode::SoftLight:
            return {softLight(cb.r, cs.r), softLight(cb.g, cs.g), softLight(cb.b, cs.b)};
        case BlendMode::Saturation:
            return setLum(setSat(cb, saturation(cs)), luminosity(cb));
    }
    return cs;
}

glm::vec4 compositeOver(BlendMode mode, const glm::vec4& dst, const glm::vec4& src) {
    float as = std::clamp(src.a, 0.0f, 1.0f);
    float ab = std::clamp(dst.a, 0.0f, 1.0f);
    if (as <= 0.0f) {
        return dst;
    }

    glm::vec3 cs(src);
    glm::vec3 cb(dst);

    // Blended source, weighted by how much backdrop is present
    glm::vec3 mixed = (1.0f - ab) * cs + ab * blendColor(mode, cb, cs);

    float ao = as + ab * (1.0f - as);
    glm::vec3 premul = as * mixed + ab * (1.0f - as) * cb;
    glm::vec3 co = ao > 0.0f ? premul / ao : glm::vec3(0.0f);

    return glm::vec4(glm::clamp(co, 0.0f, 1.0f), ao);
}

} // namespace auroscuro::effects
