#include "recognizers.hpp"
#include "lumen/core/log.hpp"

namespace lumen {

// ─────────────────────────────────────────────────────────────────────────────
// Tap
// ─────────────────────────────────────────────────────────────────────────────

TapRecognizer::TapRecognizer(double threshold, uint32_t timeout_ms)
    : threshold_(threshold)
    , timeout_ms_(timeout_ms)
{
}

std::optional<GestureInfo> TapRecognizer::update(InputEvent const& event)
{
    if (is_primary_press(event))
    {
        // A second finger does not restart a touch tap
        if (press_.active && event.is_touch() && press_.contact.touch && !press_.matches(event))
            return std::nullopt;
        press_.begin(event);
        return std::nullopt;
    }

    if (!press_.matches(event))
        return std::nullopt;

    if (press_.elapsed(event.timestamp_ms) > timeout_ms_)
    {
        LOG_TRACE("tap: press held past {}ms, abandoning", timeout_ms_);
        press_.clear();
        return std::nullopt;
    }

    if (event.type == InputEventType::Idle)
        return std::nullopt;

    press_.last_position = event.position;
    if (press_.travelled(event.position) > threshold_)
    {
        LOG_TRACE("tap: moved {:.1f}px, abandoning", press_.travelled(event.position));
        press_.clear();
        return std::nullopt;
    }

    if (!is_primary_release(event))
        return std::nullopt;

    GestureInfo gesture = press_.info(GestureKind::Tap, GestureState::Ended, event.timestamp_ms);
    press_.clear();
    return gesture;
}

std::optional<GestureInfo> TapRecognizer::cancel(uint64_t)
{
    press_.clear();
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Double tap
// ─────────────────────────────────────────────────────────────────────────────

DoubleTapRecognizer::DoubleTapRecognizer(
    double tap_threshold,
    uint32_t tap_timeout_ms,
    uint32_t interval_ms,
    double max_distance
)
    : tap_threshold_(tap_threshold)
    , tap_timeout_ms_(tap_timeout_ms)
    , interval_ms_(interval_ms)
    , max_distance_(max_distance)
{
}

void DoubleTapRecognizer::reset()
{
    press_.clear();
    first_tap_.reset();
}

void DoubleTapRecognizer::expire_first_tap(uint64_t now_ms)
{
    if (first_tap_ && elapsed_ms(now_ms, first_tap_->release_ms) > interval_ms_)
        first_tap_.reset();
}

std::optional<GestureInfo> DoubleTapRecognizer::update(InputEvent const& event)
{
    if (!press_.active)
        expire_first_tap(event.timestamp_ms);

    if (is_primary_press(event))
    {
        if (press_.active && event.is_touch() && press_.contact.touch && !press_.matches(event))
            return std::nullopt;
        press_.begin(event);
        return std::nullopt;
    }

    if (!press_.matches(event))
        return std::nullopt;

    if (press_.elapsed(event.timestamp_ms) > tap_timeout_ms_)
    {
        reset();
        return std::nullopt;
    }

    if (event.type == InputEventType::Idle)
        return std::nullopt;

    press_.last_position = event.position;
    if (press_.travelled(event.position) > tap_threshold_)
    {
        reset();
        return std::nullopt;
    }

    if (!is_primary_release(event))
        return std::nullopt;

    // A complete tap; pair it with the previous one if close enough
    bool pairs = first_tap_ && elapsed_ms(press_.start_ms, first_tap_->release_ms) <= interval_ms_
        && distance(first_tap_->position, event.position) <= max_distance_;

    if (!pairs)
    {
        first_tap_ = CompletedTap{ event.position, event.timestamp_ms };
        press_.clear();
        return std::nullopt;
    }

    GestureInfo gesture = press_.info(GestureKind::DoubleTap, GestureState::Ended, event.timestamp_ms);
    gesture.start_position = first_tap_->position;
    gesture.touch_count = 2;
    reset();
    return gesture;
}

std::optional<GestureInfo> DoubleTapRecognizer::cancel(uint64_t)
{
    reset();
    return std::nullopt;
}

} // namespace lumen
