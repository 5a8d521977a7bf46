#pragma once

#include "lumen/gesture/types.hpp"
#include <algorithm>
#include <optional>
#include <string_view>
#include <vector>

namespace lumen {

/**
 * @brief State machine that turns a stream of InputEvents into one gesture kind.
 *
 * A recognizer receives every input event regardless of target and filters by
 * contact itself. update() returns at most one GestureInfo per event.
 */
class GestureRecognizer
{
public:
    virtual ~GestureRecognizer() = default;

    virtual GestureKind kind() const = 0;
    virtual std::string_view name() const = 0;

    virtual std::optional<GestureInfo> update(InputEvent const& event) = 0;
    virtual void reset() = 0;

    /// True while a press (or touch set) is being followed.
    virtual bool is_tracking() const = 0;

    /// Contacts currently followed; empty when idle.
    virtual std::vector<Contact> contacts() const = 0;

    bool tracks(Contact const& contact) const
    {
        auto held = contacts();
        return std::ranges::find(held, contact) != held.end();
    }

    /// Exclusive recognizers cannot share a contact with another exclusive recognizer
    /// once one of them has begun.
    virtual bool is_exclusive() const { return true; }

    /// Abandon whatever is being tracked. Returns a Cancelled gesture only if
    /// recognition had already been reported; always resets.
    virtual std::optional<GestureInfo> cancel(uint64_t timestamp_ms) = 0;
};

/**
 * @brief Bookkeeping for a single tracked press, shared by the single-contact recognizers.
 */
struct PressState
{
    bool active = false;
    Contact contact;
    Point start_position;
    Point last_position;
    uint64_t start_ms = 0;
    std::optional<WindowId> target;
    uint32_t modifiers = 0;
    std::string source_device;

    void begin(InputEvent const& event)
    {
        active = true;
        contact = Contact::of(event);
        start_position = event.position;
        last_position = event.position;
        start_ms = event.timestamp_ms;
        target = event.target;
        modifiers = event.modifiers;
        source_device = event.source_device;
    }

    void clear() { *this = PressState{}; }

    /// Whether the event belongs to the press being tracked.
    bool matches(InputEvent const& event) const
    {
        if (!active)
            return false;
        if (event.type == InputEventType::Idle)
            return true;
        return Contact::of(event) == contact;
    }

    std::vector<Contact> contacts() const
    {
        if (!active)
            return {};
        return { contact };
    }

    double travelled(Point p) const { return distance(start_position, p); }
    uint64_t elapsed(uint64_t now_ms) const { return elapsed_ms(now_ms, start_ms); }

    GestureInfo info(GestureKind kind, GestureState state, uint64_t timestamp_ms) const
    {
        GestureInfo g;
        g.kind = kind;
        g.state = state;
        g.timestamp_ms = timestamp_ms;
        g.position = last_position;
        g.start_position = start_position;
        g.target = target;
        g.duration_ms = elapsed(timestamp_ms);
        if (!source_device.empty())
            g.source_device = source_device;
        g.modifiers = modifiers;
        g.delta = { last_position.x - start_position.x, last_position.y - start_position.y };
        return g;
    }
};

/// Presses that start a single-contact gesture: left button or any touch.
inline bool is_primary_press(InputEvent const& event)
{
    if (event.type == InputEventType::TouchBegin)
        return true;
    return event.type == InputEventType::PointerPress && event.button == PointerButton::Left;
}

/// Releases that end one: left button or any touch.
inline bool is_primary_release(InputEvent const& event)
{
    if (event.type == InputEventType::TouchEnd)
        return true;
    return event.type == InputEventType::PointerRelease && event.button == PointerButton::Left;
}

} // namespace lumen
