#include "types.hpp"

namespace lumen {

std::string_view to_string(InputEventType type)
{
    switch (type)
    {
        case InputEventType::PointerPress:
            return "PointerPress";
        case InputEventType::PointerRelease:
            return "PointerRelease";
        case InputEventType::PointerMove:
            return "PointerMove";
        case InputEventType::TouchBegin:
            return "TouchBegin";
        case InputEventType::TouchUpdate:
            return "TouchUpdate";
        case InputEventType::TouchEnd:
            return "TouchEnd";
        case InputEventType::Idle:
            return "Idle";
    }
    return "Unknown";
}

std::string_view to_string(GestureKind kind)
{
    switch (kind)
    {
        case GestureKind::Tap:
            return "tap";
        case GestureKind::DoubleTap:
            return "double-tap";
        case GestureKind::LongPress:
            return "long-press";
        case GestureKind::Swipe:
            return "swipe";
        case GestureKind::Pinch:
            return "pinch";
        case GestureKind::Rotate:
            return "rotate";
        case GestureKind::EdgeSwipe:
            return "edge-swipe";
    }
    return "unknown";
}

std::string_view to_string(GestureState state)
{
    switch (state)
    {
        case GestureState::Began:
            return "Began";
        case GestureState::Changed:
            return "Changed";
        case GestureState::Ended:
            return "Ended";
        case GestureState::Cancelled:
            return "Cancelled";
        case GestureState::Failed:
            return "Failed";
    }
    return "Unknown";
}

std::string_view to_string(SwipeDirection direction)
{
    switch (direction)
    {
        case SwipeDirection::Right:
            return "right";
        case SwipeDirection::DownRight:
            return "down-right";
        case SwipeDirection::Down:
            return "down";
        case SwipeDirection::DownLeft:
            return "down-left";
        case SwipeDirection::Left:
            return "left";
        case SwipeDirection::UpLeft:
            return "up-left";
        case SwipeDirection::Up:
            return "up";
        case SwipeDirection::UpRight:
            return "up-right";
    }
    return "unknown";
}

std::string_view to_string(ScreenEdge edge)
{
    switch (edge)
    {
        case ScreenEdge::Top:
            return "top";
        case ScreenEdge::Bottom:
            return "bottom";
        case ScreenEdge::Left:
            return "left";
        case ScreenEdge::Right:
            return "right";
    }
    return "unknown";
}

} // namespace lumen
