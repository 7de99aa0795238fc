#pragma once

/**
 * @file frame_renderer.h
 * @brief Audio-reactive layered frame compositor
 *
 * Per frame: background image (rotated, scaled, brightness/contrast),
 * center and edge glows in screen mode, tiled grain in soft-light mode, and a
 * fixed mild desaturation pass. Glow gradients and the grain pattern are
 * cached and only rebuilt when the surface changes.
 */

#include <auroscuro/effects/canvas.h>
#include <auroscuro/mapping.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>

namespace auroscuro::effects {

/// @brief Logical surface size and the device pixel ratio it is shown at
struct SurfaceSize {
    int width = 0;             ///< Logical pixels
    int height = 0;            ///< Logical pixels
    float pixelRatio = 1.0f;   ///< Device pixels per logical pixel

    bool valid() const { return width > 0 && height > 0 && pixelRatio > 0.0f; }
    int deviceWidth() const;
    int deviceHeight() const;

    bool operator==(const SurfaceSize& o) const {
        return width == o.width && height == o.height && pixelRatio == o.pixelRatio;
    }
    bool operator!=(const SurfaceSize& o) const { return !(*this == o); }
};

/// @brief Shape and strength of one radial glow layer
struct GlowStyle {
    glm::vec4 color{227.0f / 255.0f, 165.0f / 255.0f, 58.0f / 255.0f, 1.0f};
    float radiusScale = 1.0f;   ///< Radius as a fraction of max(width, height)
    float strength = 0.5f;      ///< Alpha = intensity * strength
};

/// @brief Renderer tunables
struct RenderConfig {
    float overscan = 1.1f;      ///< Background oversize so rotation hides corners

    /// Peak at the center, fading out by ~60-70% radius
    GlowStyle centerGlow{{227.0f / 255.0f, 165.0f / 255.0f, 58.0f / 255.0f, 1.0f}, 0.6f, 0.6f};
    /// Transparent to 45% radius, peak at the boundary
    GlowStyle edgeGlow{{227.0f / 255.0f, 165.0f / 255.0f, 58.0f / 255.0f, 1.0f}, 1.0f, 0.5f};

    float grainThreshold = 0.01f;       ///< Grain skipped at or below this opacity

    glm::vec4 desaturateColor{0.5f, 0.5f, 0.5f, 1.0f};
    float desaturateAlpha = 0.2f;       ///< 0 disables the pass
};

/// @brief Cached per-surface drawing resources
struct RenderResources {
    SurfaceSize size;                                   ///< Size the cache was built for
    uint64_t canvasGeneration = 0;                      ///< Backing store the cache belongs to
    std::shared_ptr<const CanvasGradient> centerGlow;
    std::shared_ptr<const CanvasGradient> edgeGlow;
    std::shared_ptr<const CanvasPattern> grain;
    const io::ImageData* grainSource = nullptr;         ///< Identity of the texture behind grain
};

/// @brief Inputs for one frame, passed by value each tick
struct FrameInputs {
    FrameParams params;
    std::shared_ptr<const io::ImageData> background;    ///< May be null
    std::shared_ptr<const io::ImageData> noise;         ///< May be null
};

/**
 * @brief Draws one frame per call onto a canvas it owns
 *
 * Missing inputs skip their layer. Nothing here throws.
 *
 * @par Example
 * @code
 * FrameRenderer renderer;
 * renderer.render({1920, 1080, 2.0f}, inputs);
 * io::ImageData frame = renderer.canvas().snapshot();
 * @endcode
 */
class FrameRenderer {
public:
    explicit FrameRenderer(const RenderConfig& config = {});

    /**
     * @brief Draw one frame
     * @param size Target logical size and pixel ratio; invalid sizes draw nothing
     * @param inputs Mapped parameters and images for this frame
     */
    void render(const SurfaceSize& size, const FrameInputs& inputs);

    Canvas& canvas() { return m_canvas; }
    const Canvas& canvas() const { return m_canvas; }

    const RenderResources& resources() const { return m_resources; }
    const RenderConfig& config() const { return m_config; }

    /// @brief How many times the glow gradients were rebuilt
    uint64_t gradientRebuilds() const { return m_gradientRebuilds; }

    /// @brief How many times the grain pattern was rebuilt
    uint64_t patternRebuilds() const { return m_patternRebuilds; }

    /// @brief Cover-fit size of an image in a box, before overscan
    static glm::vec2 coverSize(int imageWidth, int imageHeight, float boxWidth, float boxHeight);

private:
    void setupSurfaceIfNeeded(const SurfaceSize& size);
    void drawBackground(const io::ImageData& image, const BackgroundTransform& t);
    void drawGlows(const FrameParams& params);
    void drawGrain(const std::shared_ptr<const io::ImageData>& noise, float opacity);
    void drawDesaturate();

    RenderConfig m_config;
    Canvas m_canvas;
    RenderResources m_resources;
    uint64_t m_gradientRebuilds = 0;
    uint64_t m_patternRebuilds = 0;
};

} // namespace auroscuro::effects
