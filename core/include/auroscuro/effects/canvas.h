#pragma once

/**
 * @file canvas.h
 * @brief Software 2D drawing surface with an HTML Canvas 2D-style API
 *
 * Pixels live in CPU memory (straight-alpha float RGBA, sized in device
 * pixels) so frames can be captured without a GPU. Drawing coordinates pass
 * through the current transform, which is how callers draw in logical pixels
 * on a high-DPI surface.
 */

#include <auroscuro/effects/blend.h>
#include <auroscuro/io/image_loader.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace auroscuro::effects {

// -------------------------------------------------------------------------
// Gradient Types
// -------------------------------------------------------------------------

/// @brief Gradient type
enum class GradientType {
    Linear,  ///< Linear gradient along a line
    Radial   ///< Radial gradient between two circles
};

/// @brief A color stop in a gradient
struct ColorStop {
    float offset;    ///< Position in gradient (0.0 to 1.0)
    glm::vec4 color; ///< Color at this position (RGBA)
};

/**
 * @brief Gradient fill style
 *
 * Create with Canvas::createLinearGradient() or createRadialGradient(), add
 * stops, then pass to Canvas::fillStyle(). Geometry is in user space and is
 * interpreted through the transform active when the fill happens.
 *
 * @par Example
 * @code
 * auto glow = std::make_shared<CanvasGradient>(
 *     canvas.createRadialGradient(cx, cy, 0, cx, cy, radius));
 * glow->addColorStop(0.0f, {1, 0.6f, 0.2f, 1});
 * glow->addColorStop(1.0f, {1, 0.6f, 0.2f, 0});
 * canvas.fillStyle(glow);
 * canvas.fillRect(0, 0, w, h);
 * @endcode
 */
class CanvasGradient {
public:
    /**
     * @brief Add a color stop to the gradient
     * @param offset Position in gradient (0.0 to 1.0)
     * @param color Color at this position (RGBA, 0-1 range)
     */
    void addColorStop(float offset, const glm::vec4& color);

    void addColorStop(float offset, float r, float g, float b, float a = 1.0f);

    /// @brief Color at a user-space position
    glm::vec4 sample(const glm::vec2& pos) const;

    GradientType type = GradientType::Linear;
    glm::vec2 p0 = {0, 0};  ///< Start point (linear) or start circle center (radial)
    glm::vec2 p1 = {0, 0};  ///< End point (linear) or end circle center (radial)
    float r0 = 0.0f;        ///< Start radius (radial only)
    float r1 = 0.0f;        ///< End radius (radial only)
    std::vector<ColorStop> colorStops;

    static constexpr int MAX_COLOR_STOPS = 8;
};

/// @brief Pattern tiling
enum class PatternRepeat {
    Repeat,   ///< Tile in both directions
    NoRepeat  ///< Single copy at the origin, transparent elsewhere
};

/**
 * @brief Image-based fill style, tiled in user space
 *
 * Keeps the source image alive through shared ownership.
 */
class CanvasPattern {
public:
    CanvasPattern(std::shared_ptr<const io::ImageData> image, PatternRepeat repeat);

    /// @brief Texel color at a user-space position (nearest)
    glm::vec4 sample(const glm::vec2& pos) const;

    const std::shared_ptr<const io::ImageData>& image() const { return m_image; }
    PatternRepeat repeat() const { return m_repeat; }

private:
    std::shared_ptr<const io::ImageData> m_image;
    PatternRepeat m_repeat;
};

/// @brief CSS-style color filter applied to everything drawn
struct Filter {
    float brightness = 1.0f;  ///< Linear multiplier
    float contrast = 1.0f;    ///< Scale around mid grey

    bool isIdentity() const { return brightness == 1.0f && contrast == 1.0f; }
    glm::vec4 apply(const glm::vec4& color) const;
};

/// @brief Drawing state (saved/restored with save()/restore())
struct CanvasState {
    glm::vec4 fillColor = {0.0f, 0.0f, 0.0f, 1.0f};
    std::shared_ptr<const CanvasGradient> fillGradient;
    std::shared_ptr<const CanvasPattern> fillPattern;
    float globalAlpha = 1.0f;
    BlendMode blendMode = BlendMode::Over;
    Filter filter;
    glm::mat3 transform = glm::mat3(1.0f);
};

/**
 * @brief Immediate-mode software canvas
 *
 * @par Example
 * @code
 * Canvas canvas;
 * canvas.resize(1920 * 2, 1080 * 2);
 * canvas.scale(2.0f);                 // draw in logical pixels
 * canvas.fillStyle({0.2f, 0.4f, 0.8f, 1.0f});
 * canvas.fillRect(0, 0, 1920, 1080);
 * io::ImageData frame = canvas.snapshot();
 * @endcode
 */
class Canvas {
public:
    Canvas() = default;
    Canvas(int width, int height);

    // -------------------------------------------------------------------------
    /// @name Surface
    /// @{

    /**
     * @brief Reallocate the backing store in device pixels
     *
     * Like assigning canvas.width/height in a browser: pixels are cleared,
     * the state stack and transform are reset, and generation() advances.
     */
    void resize(int width, int height);

    int width() const { return m_width; }
    int height() const { return m_height; }
    bool empty() const { return m_width <= 0 || m_height <= 0; }

    /// @brief Identity of the current backing store, bumped by resize()
    uint64_t generation() const { return m_generation; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    void save();
    void restore();

    void fillStyle(const glm::vec4& color);
    void fillStyle(float r, float g, float b, float a = 1.0f);
    void fillStyle(std::shared_ptr<const CanvasGradient> gradient);
    void fillStyle(std::shared_ptr<const CanvasPattern> pattern);

    void globalAlpha(float alpha);
    float globalAlpha() const { return m_state.globalAlpha; }

    void blendMode(BlendMode mode) { m_state.blendMode = mode; }
    BlendMode blendMode() const { return m_state.blendMode; }

    void filter(const Filter& f) { m_state.filter = f; }
    const Filter& filter() const { return m_state.filter; }

    const CanvasState& state() const { return m_state; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Transforms
    /// @{

    void translate(float x, float y);
    void rotate(float radians);
    void scale(float x, float y);
    void scale(float uniform);
    void setTransform(const glm::mat3& matrix);
    void resetTransform();
    glm::mat3 getTransform() const { return m_state.transform; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Styles
    /// @{

    CanvasGradient createLinearGradient(float x0, float y0, float x1, float y1) const;
    CanvasGradient createRadialGradient(float x0, float y0, float r0,
                                        float x1, float y1, float r1) const;

    /// @brief Pattern from an image, nullptr if the image is missing or invalid
    std::shared_ptr<CanvasPattern> createPattern(std::shared_ptr<const io::ImageData> image,
                                                 PatternRepeat repeat = PatternRepeat::Repeat) const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Drawing
    /// @{

    /// @brief Make every pixel transparent black, ignoring transform
    void clear();

    /// @brief Make a transformed rectangle transparent black
    void clearRect(float x, float y, float w, float h);

    /// @brief Fill a transformed rectangle with the current fill style
    void fillRect(float x, float y, float w, float h);

    /**
     * @brief Draw an image stretched into a transformed rectangle
     *
     * Bilinear sampling. Invalid images draw nothing.
     */
    void drawImage(const io::ImageData& image, float dx, float dy, float dw, float dh);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Readback
    /// @{

    /// @brief Straight-alpha RGBA at a device pixel, transparent if out of range
    glm::vec4 pixel(int x, int y) const;

    const std::vector<glm::vec4>& pixels() const { return m_pixels; }

    /// @brief 8-bit RGBA copy of the surface
    io::ImageData snapshot() const;

    /// @}

private:
    struct DeviceBounds {
        int x0 = 0, y0 = 0, x1 = 0, y1 = 0;  // [x0, x1) x [y0, y1)
        bool empty() const { return x1 <= x0 || y1 <= y0; }
    };

    DeviceBounds boundsOf(float x, float y, float w, float h) const;
    glm::vec4 fillColorAt(const glm::vec2& pos) const;

    // Visit device pixels whose centers fall inside the transformed rect,
    // passing the user-space position of each center
    template <typename Fn>
    void forEachCoveredPixel(float x, float y, float w, float h, Fn&& fn);

    void blendPixel(size_t index, glm::vec4 src);

    int m_width = 0;
    int m_height = 0;
    uint64_t m_generation = 0;
    std::vector<glm::vec4> m_pixels;

    CanvasState m_state;
    std::vector<CanvasState> m_stateStack;
};

} // namespace auroscuro::effects
