#include "recognizers.hpp"
#include "lumen/core/log.hpp"
#include <cmath>
#include <numbers>

namespace lumen {

// ─────────────────────────────────────────────────────────────────────────────
// Swipe
// ─────────────────────────────────────────────────────────────────────────────

SwipeRecognizer::SwipeRecognizer(double min_distance, uint32_t max_time_ms)
    : min_distance_(min_distance)
    , max_time_ms_(max_time_ms)
{
}

void SwipeRecognizer::reset()
{
    press_.clear();
    recognized_ = false;
}

SwipeDirection SwipeRecognizer::direction_of(Point delta)
{
    // Screen coordinates: y grows downward, so a positive angle points down
    double angle = std::atan2(delta.y, delta.x);
    long sector = std::lround(angle / (std::numbers::pi / 4.0));
    sector = ((sector % 8) + 8) % 8;
    return static_cast<SwipeDirection>(sector);
}

GestureInfo SwipeRecognizer::make(GestureState state, uint64_t timestamp_ms) const
{
    GestureInfo gesture = press_.info(GestureKind::Swipe, state, timestamp_ms);
    gesture.direction = direction_of(gesture.delta);
    return gesture;
}

std::optional<GestureInfo> SwipeRecognizer::update(InputEvent const& event)
{
    if (is_primary_press(event))
    {
        if (press_.active && event.is_touch() && press_.contact.touch && !press_.matches(event))
            return std::nullopt;

        std::optional<GestureInfo> superseded = recognized_ ? cancel(event.timestamp_ms) : std::nullopt;
        reset();
        press_.begin(event);
        return superseded;
    }

    if (!press_.matches(event))
        return std::nullopt;

    uint64_t elapsed = press_.elapsed(event.timestamp_ms);

    if (event.type == InputEventType::Idle)
    {
        if (!recognized_ && elapsed > max_time_ms_)
            reset();
        return std::nullopt;
    }

    if (event.is_motion())
    {
        press_.last_position = event.position;
        if (recognized_)
            return make(GestureState::Changed, event.timestamp_ms);

        if (elapsed > max_time_ms_)
        {
            LOG_TRACE("swipe: too slow ({}ms), abandoning", elapsed);
            reset();
            return std::nullopt;
        }
        if (press_.travelled(event.position) >= min_distance_)
        {
            recognized_ = true;
            GestureInfo gesture = make(GestureState::Began, event.timestamp_ms);
            LOG_TRACE("swipe: began towards {}", to_string(*gesture.direction));
            return gesture;
        }
        return std::nullopt;
    }

    if (is_primary_release(event))
    {
        press_.last_position = event.position;
        if (!recognized_)
        {
            reset();
            return std::nullopt;
        }

        bool valid = press_.travelled(event.position) >= min_distance_ && elapsed <= max_time_ms_;
        GestureInfo gesture = make(valid ? GestureState::Ended : GestureState::Cancelled, event.timestamp_ms);
        reset();
        return gesture;
    }

    return std::nullopt;
}

std::optional<GestureInfo> SwipeRecognizer::cancel(uint64_t timestamp_ms)
{
    std::optional<GestureInfo> result;
    if (recognized_)
        result = make(GestureState::Cancelled, timestamp_ms);
    reset();
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Edge swipe
// ─────────────────────────────────────────────────────────────────────────────

EdgeSwipeRecognizer::EdgeSwipeRecognizer(Rectangle screen, double edge_threshold, double min_distance)
    : screen_(screen)
    , edge_threshold_(edge_threshold)
    , min_distance_(min_distance)
{
}

void EdgeSwipeRecognizer::reset()
{
    press_.clear();
    recognized_ = false;
}

std::optional<ScreenEdge> EdgeSwipeRecognizer::edge_at(Point p) const
{
    if (!screen_.contains(p))
        return std::nullopt;

    struct Candidate
    {
        ScreenEdge edge;
        double distance;
    };
    Candidate candidates[] = {
        { ScreenEdge::Left, p.x - screen_.x },
        { ScreenEdge::Right, static_cast<double>(screen_.right()) - p.x },
        { ScreenEdge::Top, p.y - screen_.y },
        { ScreenEdge::Bottom, static_cast<double>(screen_.bottom()) - p.y },
    };

    std::optional<Candidate> best;
    for (auto const& candidate : candidates)
    {
        if (candidate.distance > edge_threshold_)
            continue;
        if (!best || candidate.distance < best->distance)
            best = candidate;
    }
    if (!best)
        return std::nullopt;
    return best->edge;
}

double EdgeSwipeRecognizer::inward_distance() const
{
    double dx = press_.last_position.x - press_.start_position.x;
    double dy = press_.last_position.y - press_.start_position.y;
    switch (edge_)
    {
        case ScreenEdge::Left:
            return dx;
        case ScreenEdge::Right:
            return -dx;
        case ScreenEdge::Top:
            return dy;
        case ScreenEdge::Bottom:
            return -dy;
    }
    return 0.0;
}

GestureInfo EdgeSwipeRecognizer::make(GestureState state, uint64_t timestamp_ms) const
{
    GestureInfo gesture = press_.info(GestureKind::EdgeSwipe, state, timestamp_ms);
    gesture.edge = edge_;
    gesture.direction = SwipeRecognizer::direction_of(gesture.delta);
    return gesture;
}

std::optional<GestureInfo> EdgeSwipeRecognizer::update(InputEvent const& event)
{
    if (is_primary_press(event))
    {
        if (press_.active && event.is_touch() && press_.contact.touch && !press_.matches(event))
            return std::nullopt;

        std::optional<GestureInfo> superseded = recognized_ ? cancel(event.timestamp_ms) : std::nullopt;
        reset();

        auto edge = edge_at(event.position);
        if (!edge)
            return superseded;

        press_.begin(event);
        edge_ = *edge;
        LOG_TRACE("edge-swipe: press near {} edge", to_string(edge_));
        return superseded;
    }

    if (!press_.matches(event) || event.type == InputEventType::Idle)
        return std::nullopt;

    if (event.is_motion())
    {
        press_.last_position = event.position;
        if (recognized_)
            return make(GestureState::Changed, event.timestamp_ms);

        if (inward_distance() >= min_distance_)
        {
            recognized_ = true;
            return make(GestureState::Began, event.timestamp_ms);
        }
        return std::nullopt;
    }

    if (is_primary_release(event))
    {
        press_.last_position = event.position;
        std::optional<GestureInfo> result;
        if (recognized_)
            result = make(GestureState::Ended, event.timestamp_ms);
        reset();
        return result;
    }

    return std::nullopt;
}

std::optional<GestureInfo> EdgeSwipeRecognizer::cancel(uint64_t timestamp_ms)
{
    std::optional<GestureInfo> result;
    if (recognized_)
        result = make(GestureState::Cancelled, timestamp_ms);
    reset();
    return result;
}

} // namespace lumen
