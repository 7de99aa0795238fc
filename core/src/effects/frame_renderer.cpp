#include <auroscuro/effects/frame_renderer.h>
#include <algorithm>
#include <cmath>

namespace auroscuro::effects {

int SurfaceSize::deviceWidth() const {
    return static_cast<int>(std::lround(width * pixelRatio));
}

int SurfaceSize::deviceHeight() const {
    return static_cast<int>(std::lround(height * pixelRatio));
}

FrameRenderer::FrameRenderer(const RenderConfig& config)
    : m_config(config) {
}

glm::vec2 FrameRenderer::coverSize(int imageWidth, int imageHeight, float boxWidth, float boxHeight) {
    if (imageWidth <= 0 || imageHeight <= 0 || boxWidth <= 0.0f || boxHeight <= 0.0f) {
        return {0.0f, 0.0f};
    }

    float imgRatio = static_cast<float>(imageWidth) / imageHeight;
    float boxRatio = boxWidth / boxHeight;

    // Wider image: match height and crop the sides; otherwise match width
    if (imgRatio > boxRatio) {
        return {boxHeight * imgRatio, boxHeight};
    }
    return {boxWidth, boxWidth / imgRatio};
}

void FrameRenderer::setupSurfaceIfNeeded(const SurfaceSize& size) {
    if (size == m_resources.size && m_resources.canvasGeneration == m_canvas.generation() &&
        m_resources.centerGlow && m_resources.edgeGlow) {
        return;
    }

    m_canvas.resize(size.deviceWidth(), size.deviceHeight());

    glm::mat3 dpr(1.0f);
    dpr[0][0] = size.pixelRatio;
    dpr[1][1] = size.pixelRatio;
    m_canvas.setTransform(dpr);

    const float width = static_cast<float>(size.width);
    const float height = static_cast<float>(size.height);
    const float cx = width * 0.5f;
    const float cy = height * 0.5f;
    const float extent = std::max(width, height);

    glm::vec4 cc = m_config.centerGlow.color;
    auto center = std::make_shared<CanvasGradient>(
        m_canvas.createRadialGradient(cx, cy, 0.0f, cx, cy, extent * m_config.centerGlow.radiusScale));
    center->addColorStop(0.0f, cc);
    center->addColorStop(0.6f, {cc.r, cc.g, cc.b, cc.a * 0.5f});
    center->addColorStop(1.0f, {cc.r, cc.g, cc.b, 0.0f});

    glm::vec4 ec = m_config.edgeGlow.color;
    auto edge = std::make_shared<CanvasGradient>(
        m_canvas.createRadialGradient(cx, cy, 0.0f, cx, cy, extent * m_config.edgeGlow.radiusScale));
    edge->addColorStop(0.0f, {ec.r, ec.g, ec.b, 0.0f});
    edge->addColorStop(0.45f, {ec.r, ec.g, ec.b, 0.0f});
    edge->addColorStop(0.65f, {ec.r, ec.g, ec.b, ec.a * 0.5f});
    edge->addColorStop(1.0f, ec);

    m_resources.size = size;
    m_resources.canvasGeneration = m_canvas.generation();
    m_resources.centerGlow = std::move(center);
    m_resources.edgeGlow = std::move(edge);

    // New backing store, so the pattern has to be recreated against it
    m_resources.grain = nullptr;
    m_resources.grainSource = nullptr;

    m_gradientRebuilds++;
}

void FrameRenderer::render(const SurfaceSize& size, const FrameInputs& inputs) {
    if (!size.valid()) {
        return;
    }

    setupSurfaceIfNeeded(size);
    if (m_canvas.empty()) {
        return;
    }

    const float width = static_cast<float>(size.width);
    const float height = static_cast<float>(size.height);

    m_canvas.clearRect(0.0f, 0.0f, width, height);

    if (inputs.background && inputs.background->valid()) {
        drawBackground(*inputs.background, inputs.params.background);
    }

    drawGlows(inputs.params);
    drawGrain(inputs.noise, inputs.params.grainOpacity);
    drawDesaturate();
}

void FrameRenderer::drawBackground(const io::ImageData& image, const BackgroundTransform& t) {
    const SurfaceSize& size = m_resources.size;
    const float width = static_cast<float>(size.width);
    const float height = static_cast<float>(size.height);

    m_canvas.save();

    m_canvas.filter({t.brightness, t.contrast});
    m_canvas.translate(width * 0.5f, height * 0.5f);
    m_canvas.rotate(t.angleRadians);
    m_canvas.scale(t.scale);

    glm::vec2 draw = coverSize(image.width, image.height, width, height) * m_config.overscan;
    m_canvas.drawImage(image, -draw.x * 0.5f, -draw.y * 0.5f, draw.x, draw.y);

    m_canvas.restore();
}

void FrameRenderer::drawGlows(const FrameParams& params) {
    const SurfaceSize& size = m_resources.size;
    const float width = static_cast<float>(size.width);
    const float height = static_cast<float>(size.height);

    // One screen-blend scope for both glows
    m_canvas.save();
    m_canvas.blendMode(BlendMode::Screen);

    if (params.centerIntensity > 0.0f && m_resources.centerGlow) {
        m_canvas.globalAlpha(std::min(1.0f, params.centerIntensity * m_config.centerGlow.strength));
        m_canvas.fillStyle(m_resources.centerGlow);
        m_canvas.fillRect(0.0f, 0.0f, width, height);
    }

    if (params.edgeIntensity > 0.0f && m_resources.edgeGlow) {
        m_canvas.globalAlpha(std::min(1.0f, params.edgeIntensity * m_config.edgeGlow.strength));
        m_canvas.fillStyle(m_resources.edgeGlow);
        m_canvas.fillRect(0.0f, 0.0f, width, height);
    }

    m_canvas.restore();
}

void FrameRenderer::drawGrain(const std::shared_ptr<const io::ImageData>& noise, float opacity) {
    if (!noise || !noise->valid() || opacity <= m_config.grainThreshold) {
        return;
    }

    if (!m_resources.grain || m_resources.grainSource != noise.get()) {
        m_resources.grain = m_canvas.createPattern(noise, PatternRepeat::Repeat);
        m_resources.grainSource = noise.get();
        m_patternRebuilds++;
    }
    if (!m_resources.grain) {
        return;
    }

    const SurfaceSize& size = m_resources.size;

    m_canvas.save();
    m_canvas.blendMode(BlendMode::SoftLight);
    m_canvas.globalAlpha(std::min(1.0f, opacity));
    m_canvas.fillStyle(m_resources.grain);
    m_canvas.fillRect(0.0f, 0.0f, static_cast<float>(size.width), static_cast<float>(size.height));
    m_canvas.restore();
}

void FrameRenderer::drawDesaturate() {
    if (m_config.desaturateAlpha <= 0.0f) {
        return;
    }

    const SurfaceSize& size = m_resources.size;

    m_canvas.save();
    m_canvas.blendMode(BlendMode::Saturation);
    m_canvas.globalAlpha(std::min(1.0f, m_config.desaturateAlpha));
    m_canvas.fillStyle(m_config.desaturateColor);
    m_canvas.fillRect(0.0f, 0.0f, static_cast<float>(size.width), static_cast<float>(size.height));
    m_canvas.restore();
}

} // namespace auroscuro::effects
