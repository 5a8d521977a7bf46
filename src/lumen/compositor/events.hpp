#pragma once

#include "lumen/core/types.hpp"
#include <functional>
#include <string_view>

namespace lumen {

enum class CompositorEventType
{
    WindowCreated,
    WindowDestroyed,
    WindowFocused,
    WindowMoved,
    WindowResized,
    WindowMinimized,
    WindowMaximized,
    WindowRestored,
    WindowFullscreen,
    WindowOpacityChanged,
    OutputAdded,
    OutputRemoved,
    OutputEnabled,
    OutputModeChanged,
    FramePresented,
    FrameDropped,
};

/**
 * @brief Notification broadcast by the compositor to registered handlers.
 *
 * Only the fields relevant to the event type are meaningful:
 * - Window* events carry `window`; Moved adds x/y, Resized adds width/height,
 *   Fullscreen uses `flag`, OpacityChanged uses `opacity`.
 * - Output* events carry `output`; Enabled uses `flag`, ModeChanged adds
 *   width/height/refresh.
 * - Frame* events carry nothing.
 */
struct CompositorEvent
{
    CompositorEventType type = CompositorEventType::FramePresented;
    WindowId window = NO_WINDOW;
    OutputId output = NO_OUTPUT;
    int32_t x = 0;
    int32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    double refresh = 0.0;
    float opacity = 1.0f;
    bool flag = false;
};

/// Returning false stops propagation to the handlers registered after this one.
/// The return value means "continue", not "success".
using CompositorEventHandler = std::function<bool(CompositorEvent const&)>;

std::string_view to_string(CompositorEventType type);

} // namespace lumen
