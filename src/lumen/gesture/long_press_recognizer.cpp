#include "recognizers.hpp"
#include "lumen/core/log.hpp"

namespace lumen {

LongPressRecognizer::LongPressRecognizer(double threshold, uint32_t delay_ms, uint32_t feedback_ms)
    : threshold_(threshold)
    , delay_ms_(delay_ms)
    , feedback_ms_(feedback_ms)
{
}

void LongPressRecognizer::reset()
{
    press_.clear();
    recognized_ = false;
    last_feedback_ms_ = 0;
}

std::optional<GestureInfo> LongPressRecognizer::update(InputEvent const& event)
{
    if (is_primary_press(event))
    {
        if (press_.active && event.is_touch() && press_.contact.touch && !press_.matches(event))
            return std::nullopt;

        // A fresh press while one is recognized supersedes it
        std::optional<GestureInfo> superseded = recognized_ ? cancel(event.timestamp_ms) : std::nullopt;
        reset();
        press_.begin(event);
        LOG_TRACE("long-press: tracking press at ({:.1f}, {:.1f})", event.position.x, event.position.y);
        return superseded;
    }

    if (!press_.matches(event))
        return std::nullopt;

    if (is_primary_release(event))
    {
        press_.last_position = event.position;
        std::optional<GestureInfo> result;
        if (recognized_)
            result = press_.info(GestureKind::LongPress, GestureState::Ended, event.timestamp_ms);
        reset();
        return result;
    }

    if (event.is_motion())
    {
        press_.last_position = event.position;
        if (press_.travelled(event.position) > threshold_)
        {
            LOG_TRACE(
                "long-press: moved beyond {:.1f}px {} recognition", threshold_, recognized_ ? "after" : "before"
            );
            reset();
            return std::nullopt;
        }
        return check(event.timestamp_ms);
    }

    if (event.type == InputEventType::Idle)
        return check(event.timestamp_ms);

    return std::nullopt;
}

std::optional<GestureInfo> LongPressRecognizer::check(uint64_t timestamp_ms)
{
    if (press_.elapsed(timestamp_ms) < delay_ms_)
        return std::nullopt;

    if (!recognized_)
    {
        recognized_ = true;
        last_feedback_ms_ = timestamp_ms;
        LOG_TRACE("long-press: recognized after {}ms", press_.elapsed(timestamp_ms));
        return press_.info(GestureKind::LongPress, GestureState::Began, timestamp_ms);
    }

    if (elapsed_ms(timestamp_ms, last_feedback_ms_) >= feedback_ms_)
    {
        last_feedback_ms_ = timestamp_ms;
        return press_.info(GestureKind::LongPress, GestureState::Changed, timestamp_ms);
    }

    return std::nullopt;
}

std::optional<GestureInfo> LongPressRecognizer::cancel(uint64_t timestamp_ms)
{
    std::optional<GestureInfo> result;
    if (recognized_)
        result = press_.info(GestureKind::LongPress, GestureState::Cancelled, timestamp_ms);
    reset();
    return result;
}

} // namespace lumen
