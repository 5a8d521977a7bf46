#pragma once

#include "lumen/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lumen {

enum class InputEventType
{
    PointerPress,
    PointerRelease,
    PointerMove,
    TouchBegin,
    TouchUpdate,
    TouchEnd,
    Idle, ///< Clock tick with no position change
};

enum class PointerButton
{
    None,
    Left,
    Middle,
    Right,
};

namespace modifier {
constexpr uint32_t SHIFT = 1u << 0;
constexpr uint32_t CONTROL = 1u << 1;
constexpr uint32_t ALT = 1u << 2;
constexpr uint32_t SUPER = 1u << 3;
} // namespace modifier

/**
 * @brief One raw input sample from a pointer or touch device.
 *
 * Timestamps are milliseconds on a per-device monotonic clock. `touch_id` is
 * only meaningful for Touch* events.
 */
struct InputEvent
{
    InputEventType type = InputEventType::PointerMove;
    PointerButton button = PointerButton::None;
    Point position;
    uint32_t modifiers = 0;
    uint64_t timestamp_ms = 0;
    std::optional<WindowId> target;
    std::string source_device;
    uint32_t touch_id = 0;

    bool is_touch() const
    {
        return type == InputEventType::TouchBegin || type == InputEventType::TouchUpdate
            || type == InputEventType::TouchEnd;
    }

    bool is_press() const
    {
        return type == InputEventType::PointerPress || type == InputEventType::TouchBegin;
    }

    bool is_release() const
    {
        return type == InputEventType::PointerRelease || type == InputEventType::TouchEnd;
    }

    bool is_motion() const
    {
        return type == InputEventType::PointerMove || type == InputEventType::TouchUpdate;
    }
};

enum class GestureKind
{
    Tap,
    DoubleTap,
    LongPress,
    Swipe,
    Pinch,
    Rotate,
    EdgeSwipe,
};

enum class GestureState
{
    Began,
    Changed,
    Ended,
    Cancelled,
    Failed,
};

enum class SwipeDirection
{
    Right,
    DownRight,
    Down,
    DownLeft,
    Left,
    UpLeft,
    Up,
    UpRight,
};

enum class ScreenEdge
{
    Top,
    Bottom,
    Left,
    Right,
};

enum class PinchDirection
{
    In,
    Out,
};

/// Identity of one physical press: the pointer, or a single touch point.
struct Contact
{
    bool touch = false;
    uint32_t touch_id = 0;

    static Contact of(InputEvent const& event) { return { event.is_touch(), event.is_touch() ? event.touch_id : 0 }; }

    bool operator==(Contact const&) const = default;
};

/// Immutable report of a recognized (or abandoned) gesture.
struct GestureInfo
{
    GestureKind kind = GestureKind::Tap;
    GestureState state = GestureState::Began;
    uint64_t timestamp_ms = 0;
    Point position;
    std::optional<Point> start_position;
    std::optional<WindowId> target;
    std::optional<uint64_t> duration_ms;
    std::optional<double> scale;
    std::optional<double> rotation; ///< Radians, positive is clockwise on screen
    std::optional<std::string> source_device;
    std::optional<SwipeDirection> direction;
    std::optional<PinchDirection> pinch_direction;
    std::optional<ScreenEdge> edge;
    uint32_t modifiers = 0;
    Point delta;
    uint32_t touch_count = 1;

    bool is_terminal() const
    {
        return state == GestureState::Ended || state == GestureState::Cancelled || state == GestureState::Failed;
    }
};

/// a - b, clamped at zero when timestamps go backwards.
inline uint64_t elapsed_ms(uint64_t now, uint64_t since)
{
    return now > since ? now - since : 0;
}

std::string_view to_string(InputEventType type);
std::string_view to_string(GestureKind kind);
std::string_view to_string(GestureState state);
std::string_view to_string(SwipeDirection direction);
std::string_view to_string(ScreenEdge edge);

} // namespace lumen
