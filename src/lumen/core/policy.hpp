#pragma once

#include "lumen/core/types.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace lumen::focus_policy {

/// Pick the window that should receive focus after the focused one went away.
///
/// Prefers the topmost renderable window; if none is renderable, falls back to
/// the top of the render queue. Returns nullopt only for an empty queue.
inline std::optional<WindowId>
select_focus_candidate(std::span<WindowId const> render_queue, std::function<bool(WindowId)> const& is_renderable)
{
    for (auto it = render_queue.rbegin(); it != render_queue.rend(); ++it)
    {
        if (is_renderable(*it))
            return *it;
    }
    if (!render_queue.empty())
        return render_queue.back();
    return std::nullopt;
}

} // namespace lumen::focus_policy

namespace lumen::stacking_policy {

/// Move a window to the top of the render queue. Returns false if absent or already on top.
inline bool raise(std::vector<WindowId>& queue, WindowId id)
{
    auto it = std::ranges::find(queue, id);
    if (it == queue.end() || (it + 1) == queue.end())
        return false;
    std::rotate(it, it + 1, queue.end());
    return true;
}

/// Move a window to the bottom of the render queue. Returns false if absent or already at the bottom.
inline bool lower(std::vector<WindowId>& queue, WindowId id)
{
    auto it = std::ranges::find(queue, id);
    if (it == queue.end() || it == queue.begin())
        return false;
    std::rotate(queue.begin(), it, it + 1);
    return true;
}

/// True if making `parent` the parent of `child` would close a cycle.
/// `parent_of` returns the current parent of a window, if any.
inline bool would_create_cycle(
    WindowId child,
    WindowId parent,
    std::function<std::optional<WindowId>(WindowId)> const& parent_of
)
{
    if (child == parent)
        return true;

    // Bounded walk: a chain longer than this is already corrupt
    constexpr size_t MAX_DEPTH = 4096;
    std::optional<WindowId> cursor = parent;
    for (size_t depth = 0; cursor && depth < MAX_DEPTH; ++depth)
    {
        if (*cursor == child)
            return true;
        cursor = parent_of(*cursor);
    }
    return cursor.has_value();
}

} // namespace lumen::stacking_policy

namespace lumen::damage_policy {

/// Clip a window-local damage rectangle to the surface. Damage outside the surface is dropped.
inline std::optional<Rectangle> clip_to_surface(Rectangle const& local_bounds, Rectangle const& damage)
{
    return local_bounds.intersect(damage);
}

/// Convert window-local damage into global logical coordinates.
inline Rectangle to_screen(Rectangle const& window_geometry, Rectangle const& local)
{
    return local.translated(window_geometry.x, window_geometry.y);
}

} // namespace lumen::damage_policy

namespace lumen::output_policy {

/// Output whose logical geometry contains the point, preferring enabled outputs in id order.
inline std::optional<OutputId> output_at(std::map<OutputId, OutputDevice> const& outputs, Point p)
{
    for (auto const& [id, output] : outputs)
    {
        if (output.enabled && output.logical_geometry().contains(p))
            return id;
    }
    return std::nullopt;
}

inline std::optional<OutputId> primary_output(std::map<OutputId, OutputDevice> const& outputs)
{
    for (auto const& [id, output] : outputs)
    {
        if (output.primary)
            return id;
    }
    if (!outputs.empty())
        return outputs.begin()->first;
    return std::nullopt;
}

} // namespace lumen::output_policy
