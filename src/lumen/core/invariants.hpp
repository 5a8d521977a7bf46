#pragma once

/**
 * @file invariants.hpp
 * @brief Debug assertions for compositor invariants
 *
 * These assertions verify critical invariants that must hold after every
 * compositor operation. They are enabled in debug builds and compiled out in
 * release builds.
 *
 * Key invariants:
 * 1. Every window in the registry appears exactly once in the render queue and vice versa
 * 2. Window z_order equals its index in the render queue
 * 3. At most one window is focused, and it is the active window
 * 4. Parent/child links are symmetric and parent chains are acyclic
 */

#include "log.hpp"
#include "types.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lumen::invariants {

#ifdef NDEBUG
// Release build: no-op
#    define LUMEN_ASSERT_STACKING(windows, render_queue)
#    define LUMEN_ASSERT_FOCUS(windows, active_window)
#    define LUMEN_ASSERT_HIERARCHY(windows)
#else

/**
 * @brief Assert registry and render queue agree, and z-order is unique and total
 */
inline void assert_stacking(
    std::unordered_map<WindowId, Window> const& windows,
    std::vector<WindowId> const& render_queue
)
{
    if (windows.size() != render_queue.size())
    {
        LOG_ERROR(
            "INVARIANT VIOLATION: {} registered windows but {} render queue entries",
            windows.size(),
            render_queue.size()
        );
    }

    std::unordered_set<WindowId> seen;
    for (size_t i = 0; i < render_queue.size(); ++i)
    {
        WindowId id = render_queue[i];
        if (!seen.insert(id).second)
        {
            LOG_ERROR("INVARIANT VIOLATION: Window {} appears twice in render queue", id);
            continue;
        }

        auto it = windows.find(id);
        if (it == windows.end())
        {
            LOG_ERROR("INVARIANT VIOLATION: Render queue entry {} not in registry", id);
            continue;
        }

        if (it->second.z_order != static_cast<int32_t>(i))
        {
            LOG_ERROR(
                "INVARIANT VIOLATION: Window {} has z_order {} but queue index {}",
                id,
                it->second.z_order,
                i
            );
        }
    }
}

/**
 * @brief Assert focus consistency
 *
 * Verifies:
 * - If active_window != NO_WINDOW, it must be registered and flagged focused
 * - No other window is flagged focused
 */
inline void assert_focus(std::unordered_map<WindowId, Window> const& windows, std::optional<WindowId> active_window)
{
    for (auto const& [id, window] : windows)
    {
        if (window.focused && (!active_window || *active_window != id))
        {
            LOG_ERROR("INVARIANT VIOLATION: Window {} is focused but not the active window", id);
        }
    }

    if (!active_window)
        return;

    auto it = windows.find(*active_window);
    if (it == windows.end())
    {
        LOG_ERROR("INVARIANT VIOLATION: Active window {} not in registry", *active_window);
        return;
    }
    if (!it->second.focused)
    {
        LOG_ERROR("INVARIANT VIOLATION: Active window {} is not flagged focused", *active_window);
    }
}

/**
 * @brief Assert parent/child links are symmetric and acyclic
 */
inline void assert_hierarchy(std::unordered_map<WindowId, Window> const& windows)
{
    for (auto const& [id, window] : windows)
    {
        for (WindowId child : window.children)
        {
            auto it = windows.find(child);
            if (it == windows.end())
            {
                LOG_ERROR("INVARIANT VIOLATION: Window {} lists unknown child {}", id, child);
                continue;
            }
            if (it->second.parent != id)
            {
                LOG_ERROR("INVARIANT VIOLATION: Child {} does not point back to parent {}", child, id);
            }
        }

        // Walk up; a chain longer than the registry must loop
        size_t steps = 0;
        std::optional<WindowId> cursor = window.parent;
        while (cursor && steps <= windows.size())
        {
            auto it = windows.find(*cursor);
            if (it == windows.end())
            {
                LOG_ERROR("INVARIANT VIOLATION: Window {} has unknown ancestor {}", id, *cursor);
                break;
            }
            cursor = it->second.parent;
            ++steps;
        }
        if (cursor && steps > windows.size())
        {
            LOG_ERROR("INVARIANT VIOLATION: Parent chain of window {} contains a cycle", id);
        }
    }
}

#    define LUMEN_ASSERT_STACKING(windows, render_queue) ::lumen::invariants::assert_stacking(windows, render_queue)
#    define LUMEN_ASSERT_FOCUS(windows, active_window) ::lumen::invariants::assert_focus(windows, active_window)
#    define LUMEN_ASSERT_HIERARCHY(windows) ::lumen::invariants::assert_hierarchy(windows)

#endif // NDEBUG

} // namespace lumen::invariants
