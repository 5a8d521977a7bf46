#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

using Clock = std::chrono::steady_clock;

using WindowId = uint64_t;
using OutputId = uint32_t;

constexpr WindowId NO_WINDOW = 0;
constexpr OutputId NO_OUTPUT = 0;

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
// ─────────────────────────────────────────────────────────────────────────────

struct Point
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(Point const&) const = default;
};

double distance(Point a, Point b);

/**
 * @brief Axis-aligned rectangle in logical pixels.
 *
 * Right and bottom edges are exclusive: a 10x10 rectangle at the origin
 * contains (9, 9) but not (10, 10), and two rectangles that only share an
 * edge do not intersect.
 */
struct Rectangle
{
    int32_t x = 0;
    int32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(Rectangle const&) const = default;

    int64_t right() const { return static_cast<int64_t>(x) + static_cast<int64_t>(width); }
    int64_t bottom() const { return static_cast<int64_t>(y) + static_cast<int64_t>(height); }
    uint64_t area() const { return static_cast<uint64_t>(width) * static_cast<uint64_t>(height); }
    bool empty() const { return width == 0 || height == 0; }

    bool contains(int32_t px, int32_t py) const
    {
        return px >= x && static_cast<int64_t>(px) < right() && py >= y && static_cast<int64_t>(py) < bottom();
    }

    bool contains(Point p) const
    {
        return p.x >= static_cast<double>(x) && p.x < static_cast<double>(right()) && p.y >= static_cast<double>(y)
            && p.y < static_cast<double>(bottom());
    }

    std::optional<Rectangle> intersect(Rectangle const& other) const;
    Rectangle united(Rectangle const& other) const;
    Rectangle translated(int32_t dx, int32_t dy) const;
};

enum class OutputRotation
{
    Normal,
    Rotate90,
    Rotate180,
    Rotate270
};

/**
 * @brief 2D affine transform stored as a row-major 3x3 matrix.
 *
 * Points are treated as column vectors, so `(a * b).apply(p)` applies `b`
 * first and `a` second.
 */
struct Transform
{
    std::array<std::array<double, 3>, 3> m = { { { 1.0, 0.0, 0.0 }, { 0.0, 1.0, 0.0 }, { 0.0, 0.0, 1.0 } } };

    static Transform identity() { return {}; }
    static Transform rotation(OutputRotation rotation);
    static Transform scale(double sx, double sy);
    static Transform translation(double tx, double ty);

    Transform operator*(Transform const& rhs) const;
    Point apply(Point p) const;
    bool is_identity() const;

    bool operator==(Transform const&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Surface content
// ─────────────────────────────────────────────────────────────────────────────

enum class PixelFormat
{
    ARGB8888,
    XRGB8888,
    RGBA8888,
    RGBX8888,
    ABGR8888,
    XBGR8888,
    RGB565
};

uint32_t bytes_per_pixel(PixelFormat format);

/**
 * @brief Pixel payload attached to a window.
 *
 * A buffer is immutable once submitted: content updates replace the whole
 * buffer through Compositor::submit_buffer(), never patch it in place.
 */
struct Buffer
{
    uint32_t width = 0;
    uint32_t height = 0;
    PixelFormat format = PixelFormat::ARGB8888;
    uint32_t stride = 0;
    std::shared_ptr<std::vector<uint8_t> const> data;
    std::optional<int> dmabuf_fd; ///< External memory descriptor, if the client shares GPU memory

    bool valid() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Outputs
// ─────────────────────────────────────────────────────────────────────────────

struct ColorProfile
{
    std::vector<uint8_t> icc_profile;
};

/**
 * @brief A physical or logical display the compositor presents to.
 *
 * Resolution is in device pixels; position is in the global logical space.
 */
struct OutputDevice
{
    OutputId id = NO_OUTPUT;
    std::string name;
    uint32_t width = 0;
    uint32_t height = 0;
    double refresh_rate = 60.0;
    double scale_factor = 1.0;
    bool enabled = true;
    bool primary = false;
    uint32_t physical_width_mm = 0;
    uint32_t physical_height_mm = 0;
    int32_t x = 0;
    int32_t y = 0;
    OutputRotation rotation = OutputRotation::Normal;
    Transform transform;
    std::optional<std::vector<uint16_t>> gamma_lut;
    std::optional<ColorProfile> color_profile;

    Rectangle logical_geometry() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Windows
// ─────────────────────────────────────────────────────────────────────────────

struct OpacityRegion
{
    Rectangle region; ///< Window-local
    float opacity = 1.0f;
};

/**
 * @brief Compositor-side record of one on-screen window.
 *
 * Windows live in the compositor's id-indexed arena. Parent and children are
 * referenced by id: the parent owns its children (removing it removes them),
 * and the child's parent id is a weak back-reference by construction.
 *
 * Damage, input regions and opacity regions are in window-local coordinates.
 * z_order always equals the window's index in the render queue.
 */
struct Window
{
    WindowId id = NO_WINDOW;
    std::string title;
    std::string app_id;
    Rectangle geometry;

    bool visible = true;
    bool focused = false;
    bool minimized = false;
    bool maximized = false;
    bool fullscreen = false;

    bool resizable = true;
    bool movable = true;
    bool closable = true;

    float opacity = 1.0f;
    float effect_scale = 1.0f; ///< Driven by transition effects, 1.0 when idle
    int32_t z_order = 0;

    std::optional<WindowId> parent;
    std::vector<WindowId> children;

    std::shared_ptr<Buffer const> buffer;
    std::vector<Rectangle> damage;
    std::vector<Rectangle> input_region;
    std::vector<OpacityRegion> opacity_regions;

    std::optional<Rectangle> restore_geometry; ///< Geometry before maximize/fullscreen
    std::optional<Clock::time_point> last_frame_time;

    Rectangle local_bounds() const { return { 0, 0, geometry.width, geometry.height }; }
    bool renderable() const { return visible && !minimized; }
};

} // namespace lumen
