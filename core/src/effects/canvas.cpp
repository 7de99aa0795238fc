#include <auroscuro/effects/canvas.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace auroscuro::effects {

// -------------------------------------------------------------------------
// CanvasGradient implementation
// -------------------------------------------------------------------------

void CanvasGradient::addColorStop(float offset, const glm::vec4& color) {
    offset = std::max(0.0f, std::min(1.0f, offset));

    if (colorStops.size() >= MAX_COLOR_STOPS) {
        std::cerr << "[Canvas] Warning: Maximum " << MAX_COLOR_STOPS
                  << " color stops allowed, ignoring additional stops\n";
        return;
    }

    // Insert after any stop at the same offset, like the browser does
    ColorStop stop{offset, color};
    auto it = std::upper_bound(colorStops.begin(), colorStops.end(), stop,
        [](const ColorStop& a, const ColorStop& b) { return a.offset < b.offset; });
    colorStops.insert(it, stop);
}

void CanvasGradient::addColorStop(float offset, float r, float g, float b, float a) {
    addColorStop(offset, {r, g, b, a});
}

// Interpolate in premultiplied space so "transparent" stops don't darken
static glm::vec4 mixPremultiplied(const glm::vec4& a, const glm::vec4& b, float t) {
    glm::vec4 pa(glm::vec3(a) * a.a, a.a);
    glm::vec4 pb(glm::vec3(b) * b.a, b.a);
    glm::vec4 m = glm::mix(pa, pb, t);
    if (m.a <= 0.0f) {
        return glm::vec4(0.0f);
    }
    return glm::vec4(glm::vec3(m) / m.a, m.a);
}

glm::vec4 CanvasGradient::sample(const glm::vec2& pos) const {
    if (colorStops.empty()) {
        return glm::vec4(0.0f);
    }
    if (colorStops.size() == 1) {
        return colorStops[0].color;
    }

    float t = 0.0f;

    switch (type) {
        case GradientType::Linear: {
            // Project position onto gradient line
            glm::vec2 dir = p1 - p0;
            float len2 = glm::dot(dir, dir);
            if (len2 > 0.0001f) {
                t = glm::dot(pos - p0, dir) / len2;
            }
            break;
        }
        case GradientType::Radial: {
            // Concentric approximation: distance from p0 mapped [r0, r1] to [0, 1]
            float dist = glm::length(pos - p0);
            float range = r1 - r0;
            if (std::abs(range) > 0.0001f) {
                t = (dist - r0) / range;
            } else {
                t = dist <= r0 ? 0.0f : 1.0f;
            }
            break;
        }
    }

    t = std::max(0.0f, std::min(1.0f, t));

    const auto& stops = colorStops;
    if (t <= stops.front().offset) {
        return stops.front().color;
    }
    if (t >= stops.back().offset) {
        return stops.back().color;
    }

    for (size_t i = 0; i + 1 < stops.size(); ++i) {
        if (t >= stops[i].offset && t <= stops[i + 1].offset) {
            float range = stops[i + 1].offset - stops[i].offset;
            float localT = (range > 0.0001f) ? (t - stops[i].offset) / range : 0.0f;
            return mixPremultiplied(stops[i].color, stops[i + 1].color, localT);
        }
    }

    return stops.back().color;
}

// -------------------------------------------------------------------------
// CanvasPattern implementation
// -------------------------------------------------------------------------

CanvasPattern::CanvasPattern(std::shared_ptr<const io::ImageData> image, PatternRepeat repeat)
    : m_image(std::move(image))
    , m_repeat(repeat)
{
}

glm::vec4 CanvasPattern::sample(const glm::vec2& pos) const {
    if (!m_image || !m_image->valid()) {
        return glm::vec4(0.0f);
    }

    const int w = m_image->width;
    const int h = m_image->height;
    int x = static_cast<int>(std::floor(pos.x));
    int y = static_cast<int>(std::floor(pos.y));

    if (m_repeat == PatternRepeat::Repeat) {
        x = ((x % w) + w) % w;
        y = ((y % h) + h) % h;
    } else if (x < 0 || y < 0 || x >= w || y >= h) {
        return glm::vec4(0.0f);
    }

    const uint8_t* p = &m_image->pixels[(static_cast<size_t>(y) * w + x) * 4];
    return glm::vec4(p[0], p[1], p[2], p[3]) / 255.0f;
}

// -------------------------------------------------------------------------
// Filter
// -------------------------------------------------------------------------

glm::vec4 Filter::apply(const glm::vec4& color) const {
    if (isIdentity()) {
        return color;
    }
    glm::vec3 c = glm::vec3(color) * brightness;
    c = glm::clamp(c, 0.0f, 1.0f);
    c = (c - glm::vec3(0.5f)) * contrast + glm::vec3(0.5f);
    return glm::vec4(glm::clamp(c, 0.0f, 1.0f), color.a);
}

// -------------------------------------------------------------------------
// Canvas implementation
// -------------------------------------------------------------------------

Canvas::Canvas(int width, int height) {
    resize(width, height);
}

void Canvas::resize(int width, int height) {
    m_width = std::max(0, width);
    m_height = std::max(0, height);
    m_pixels.assign(static_cast<size_t>(m_width) * m_height, glm::vec4(0.0f));
    m_state = CanvasState{};
    m_stateStack.clear();
    m_generation++;
}

void Canvas::save() {
    m_stateStack.push_back(m_state);
}

void Canvas::restore() {
    if (!m_stateStack.empty()) {
        m_state = m_stateStack.back();
        m_stateStack.pop_back();
    }
}

void Canvas::fillStyle(const glm::vec4& color) {
    m_state.fillColor = color;
    m_state.fillGradient = nullptr;
    m_state.fillPattern = nullptr;
}

void Canvas::fillStyle(float r, float g, float b, float a) {
    fillStyle(glm::vec4(r, g, b, a));
}

void Canvas::fillStyle(std::shared_ptr<const CanvasGradient> gradient) {
    m_state.fillGradient = std::move(gradient);
    m_state.fillPattern = nullptr;
}

void Canvas::fillStyle(std::shared_ptr<const CanvasPattern> pattern) {
    m_state.fillPattern = std::move(pattern);
    m_state.fillGradient = nullptr;
}

void Canvas::globalAlpha(float alpha) {
    // Out-of-range values are ignored, as in the browser
    if (alpha >= 0.0f && alpha <= 1.0f) {
        m_state.globalAlpha = alpha;
    }
}

// -------------------------------------------------------------------------
// Transforms
// -------------------------------------------------------------------------

void Canvas::translate(float x, float y) {
    glm::mat3 translation(1.0f);
    translation[2][0] = x;
    translation[2][1] = y;
    m_state.transform = m_state.transform * translation;
}

void Canvas::rotate(float radians) {
    float c = std::cos(radians);
    float s = std::sin(radians);
    glm::mat3 rotation(1.0f);
    rotation[0][0] = c;  rotation[1][0] = -s;
    rotation[0][1] = s;  rotation[1][1] = c;
    m_state.transform = m_state.transform * rotation;
}

void Canvas::scale(float x, float y) {
    glm::mat3 scaling(1.0f);
    scaling[0][0] = x;
    scaling[1][1] = y;
    m_state.transform = m_state.transform * scaling;
}

void Canvas::scale(float uniform) {
    scale(uniform, uniform);
}

void Canvas::setTransform(const glm::mat3& matrix) {
    m_state.transform = matrix;
}

void Canvas::resetTransform() {
    m_state.transform = glm::mat3(1.0f);
}

// -------------------------------------------------------------------------
// Styles
// -------------------------------------------------------------------------

CanvasGradient Canvas::createLinearGradient(float x0, float y0, float x1, float y1) const {
    CanvasGradient gradient;
    gradient.type = GradientType::Linear;
    gradient.p0 = {x0, y0};
    gradient.p1 = {x1, y1};
    return gradient;
}

CanvasGradient Canvas::createRadialGradient(float x0, float y0, float r0,
                                            float x1, float y1, float r1) const {
    CanvasGradient gradient;
    gradient.type = GradientType::Radial;
    gradient.p0 = {x0, y0};
    gradient.r0 = r0;
    gradient.p1 = {x1, y1};
    gradient.r1 = r1;
    return gradient;
}

std::shared_ptr<CanvasPattern> Canvas::createPattern(std::shared_ptr<const io::ImageData> image,
                                                     PatternRepeat repeat) const {
    if (!image || !image->valid()) {
        return nullptr;
    }
    return std::make_shared<CanvasPattern>(std::move(image), repeat);
}

// -------------------------------------------------------------------------
// Rasterization
// -------------------------------------------------------------------------

Canvas::DeviceBounds Canvas::boundsOf(float x, float y, float w, float h) const {
    DeviceBounds b;
    if (empty()) {
        return b;
    }

    const glm::vec2 corners[4] = {{x, y}, {x + w, y}, {x, y + h}, {x + w, y + h}};
    float minX = INFINITY, minY = INFINITY, maxX = -INFINITY, maxY = -INFINITY;
    for (const auto& c : corners) {
        glm::vec3 p = m_state.transform * glm::vec3(c, 1.0f);
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }

    if (!std::isfinite(minX) || !std::isfinite(minY) ||
        !std::isfinite(maxX) || !std::isfinite(maxY)) {
        return b;
    }

    b.x0 = std::max(0, static_cast<int>(std::floor(minX)));
    b.y0 = std::max(0, static_cast<int>(std::floor(minY)));
    b.x1 = std::min(m_width, static_cast<int>(std::ceil(maxX)));
    b.y1 = std::min(m_height, static_cast<int>(std::ceil(maxY)));
    return b;
}

template <typename Fn>
void Canvas::forEachCoveredPixel(float x, float y, float w, float h, Fn&& fn) {
    if (w < 0.0f) { x += w; w = -w; }
    if (h < 0.0f) { y += h; h = -h; }
    if (w <= 0.0f || h <= 0.0f) {
        return;
    }

    DeviceBounds b = boundsOf(x, y, w, h);
    if (b.empty()) {
        return;
    }

    // Singular transforms (zero scale) cover nothing
    if (std::abs(glm::determinant(m_state.transform)) < 1e-12f) {
        return;
    }
    const glm::mat3 inv = glm::inverse(m_state.transform);

    for (int py = b.y0; py < b.y1; ++py) {
        for (int px = b.x0; px < b.x1; ++px) {
            glm::vec3 u = inv * glm::vec3(px + 0.5f, py + 0.5f, 1.0f);
            if (u.x < x || u.y < y || u.x >= x + w || u.y >= y + h) {
                continue;
            }
            fn(static_cast<size_t>(py) * m_width + px, glm::vec2(u.x, u.y));
        }
    }
}

glm::vec4 Canvas::fillColorAt(const glm::vec2& pos) const {
    if (m_state.fillPattern) {
        return m_state.fillPattern->sample(pos);
    }
    if (m_state.fillGradient) {
        return m_state.fillGradient->sample(pos);
    }
    return m_state.fillColor;
}

void Canvas::blendPixel(size_t index, glm::vec4 src) {
    src = m_state.filter.apply(src);
    src.a *= m_state.globalAlpha;
    m_pixels[index] = compositeOver(m_state.blendMode, m_pixels[index], src);
}

void Canvas::clear() {
    std::fill(m_pixels.begin(), m_pixels.end(), glm::vec4(0.0f));
}

void Canvas::clearRect(float x, float y, float w, float h) {
    forEachCoveredPixel(x, y, w, h, [this](size_t index, const glm::vec2&) {
        m_pixels[index] = glm::vec4(0.0f);
    });
}

void Canvas::fillRect(float x, float y, float w, float h) {
    if (m_state.globalAlpha <= 0.0f) {
        return;
    }
    forEachCoveredPixel(x, y, w, h, [this](size_t index, const glm::vec2& pos) {
        blendPixel(index, fillColorAt(pos));
    });
}

static glm::vec4 texel(const io::ImageData& image, int x, int y) {
    x = std::clamp(x, 0, image.width - 1);
    y = std::clamp(y, 0, image.height - 1);
    const uint8_t* p = &image.pixels[(static_cast<size_t>(y) * image.width + x) * 4];
    return glm::vec4(p[0], p[1], p[2], p[3]);
}

static glm::vec4 sampleBilinear(const io::ImageData& image, float sx, float sy) {
    // Texel centers sit at +0.5
    float fx = sx - 0.5f;
    float fy = sy - 0.5f;
    int x0 = static_cast<int>(std::floor(fx));
    int y0 = static_cast<int>(std::floor(fy));
    float tx = fx - x0;
    float ty = fy - y0;

    glm::vec4 top = glm::mix(texel(image, x0, y0), texel(image, x0 + 1, y0), tx);
    glm::vec4 bottom = glm::mix(texel(image, x0, y0 + 1), texel(image, x0 + 1, y0 + 1), tx);
    return glm::mix(top, bottom, ty) / 255.0f;
}

void Canvas::drawImage(const io::ImageData& image, float dx, float dy, float dw, float dh) {
    if (!image.valid() || m_state.globalAlpha <= 0.0f) {
        return;
    }
    if (dw == 0.0f || dh == 0.0f) {
        return;
    }

    const float sx = image.width / dw;
    const float sy = image.height / dh;

    forEachCoveredPixel(dx, dy, dw, dh, [&](size_t index, const glm::vec2& pos) {
        glm::vec4 c = sampleBilinear(image, (pos.x - dx) * sx, (pos.y - dy) * sy);
        blendPixel(index, c);
    });
}

// -------------------------------------------------------------------------
// Readback
// -------------------------------------------------------------------------

glm::vec4 Canvas::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return glm::vec4(0.0f);
    }
    return m_pixels[static_cast<size_t>(y) * m_width + x];
}

io::ImageData Canvas::snapshot() const {
    io::ImageData out;
    if (empty()) {
        return out;
    }

    out.width = m_width;
    out.height = m_height;
    out.channels = 4;
    out.pixels.resize(m_pixels.size() * 4);

    for (size_t i = 0; i < m_pixels.size(); ++i) {
        glm::vec4 c = glm::clamp(m_pixels[i], 0.0f, 1.0f);
        out.pixels[i * 4 + 0] = static_cast<uint8_t>(c.r * 255.0f + 0.5f);
        out.pixels[i * 4 + 1] = static_cast<uint8_t>(c.g * 255.0f + 0.5f);
        out.pixels[i * 4 + 2] = static_cast<uint8_t>(c.b * 255.0f + 0.5f);
        out.pixels[i * 4 + 3] = static_cast<uint8_t>(c.a * 255.0f + 0.5f);
    }
    return out;
}

} // namespace auroscuro::effects
