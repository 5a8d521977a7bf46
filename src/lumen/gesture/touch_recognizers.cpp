#include "recognizers.hpp"
#include "lumen/core/log.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace lumen {

// ─────────────────────────────────────────────────────────────────────────────
// TouchPair
// ─────────────────────────────────────────────────────────────────────────────

bool TouchPair::contains(uint32_t id) const
{
    return std::ranges::any_of(touches, [id](Touch const& t) { return t.id == id; });
}

std::vector<Contact> TouchPair::contacts() const
{
    std::vector<Contact> result;
    result.reserve(touches.size());
    for (auto const& t : touches)
        result.push_back({ true, t.id });
    return result;
}

TouchPair::Touch* TouchPair::find(uint32_t id)
{
    auto it = std::ranges::find_if(touches, [id](Touch const& t) { return t.id == id; });
    return it != touches.end() ? &*it : nullptr;
}

bool TouchPair::remove(uint32_t id)
{
    return std::erase_if(touches, [id](Touch const& t) { return t.id == id; }) > 0;
}

double TouchPair::span() const
{
    if (!complete())
        return 0.0;
    return distance(touches[0].position, touches[1].position);
}

double TouchPair::angle() const
{
    if (!complete())
        return 0.0;
    return std::atan2(touches[1].position.y - touches[0].position.y, touches[1].position.x - touches[0].position.x);
}

Point TouchPair::centroid() const
{
    if (touches.empty())
        return {};
    Point sum;
    for (auto const& t : touches)
    {
        sum.x += t.position.x;
        sum.y += t.position.y;
    }
    return { sum.x / touches.size(), sum.y / touches.size() };
}

namespace {

/// Shared TouchBegin handling. Returns true when the pair just became complete.
bool accept_touch(TouchPair& pair, InputEvent const& event)
{
    if (pair.complete() || pair.contains(event.touch_id))
        return false;

    if (pair.touches.empty())
    {
        pair.target = event.target;
        pair.source_device = event.source_device;
        pair.modifiers = event.modifiers;
        pair.start_ms = event.timestamp_ms;
    }
    pair.touches.push_back({ event.touch_id, event.position });
    return pair.complete();
}

GestureInfo pair_info(TouchPair const& pair, GestureKind kind, GestureState state, uint64_t timestamp_ms)
{
    GestureInfo gesture;
    gesture.kind = kind;
    gesture.state = state;
    gesture.timestamp_ms = timestamp_ms;
    gesture.position = pair.centroid();
    gesture.target = pair.target;
    gesture.duration_ms = elapsed_ms(timestamp_ms, pair.start_ms);
    if (!pair.source_device.empty())
        gesture.source_device = pair.source_device;
    gesture.modifiers = pair.modifiers;
    gesture.touch_count = static_cast<uint32_t>(std::max<size_t>(pair.touches.size(), 2));
    return gesture;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Pinch
// ─────────────────────────────────────────────────────────────────────────────

PinchRecognizer::PinchRecognizer(double min_distance, double min_scale_change)
    : min_distance_(min_distance)
    , min_scale_change_(min_scale_change)
{
}

void PinchRecognizer::reset()
{
    pair_ = TouchPair{};
    initial_span_ = 0.0;
    scale_ = 1.0;
    last_emitted_scale_ = 1.0;
    recognized_ = false;
}

void PinchRecognizer::rebase()
{
    initial_span_ = pair_.span();
    scale_ = 1.0;
    last_emitted_scale_ = 1.0;
    if (initial_span_ < min_distance_)
        LOG_TRACE("pinch: fingers {:.1f}px apart, too close to measure", initial_span_);
}

GestureInfo PinchRecognizer::make(GestureState state, uint64_t timestamp_ms) const
{
    GestureInfo gesture = pair_info(pair_, GestureKind::Pinch, state, timestamp_ms);
    gesture.scale = scale_;
    gesture.pinch_direction = scale_ < 1.0 ? PinchDirection::In : PinchDirection::Out;
    return gesture;
}

std::optional<GestureInfo> PinchRecognizer::update(InputEvent const& event)
{
    switch (event.type)
    {
        case InputEventType::TouchBegin:
            if (accept_touch(pair_, event))
                rebase();
            return std::nullopt;

        case InputEventType::TouchUpdate:
        {
            auto* touch = pair_.find(event.touch_id);
            if (!touch)
                return std::nullopt;
            touch->position = event.position;

            if (!pair_.complete() || initial_span_ < min_distance_)
                return std::nullopt;

            scale_ = pair_.span() / initial_span_;
            if (!recognized_)
            {
                if (std::abs(scale_ - 1.0) < min_scale_change_)
                    return std::nullopt;
                recognized_ = true;
                last_emitted_scale_ = scale_;
                return make(GestureState::Began, event.timestamp_ms);
            }

            if (std::abs(scale_ - last_emitted_scale_) < min_scale_change_)
                return std::nullopt;
            last_emitted_scale_ = scale_;
            return make(GestureState::Changed, event.timestamp_ms);
        }

        case InputEventType::TouchEnd:
        {
            if (!pair_.contains(event.touch_id))
                return std::nullopt;

            if (recognized_)
            {
                GestureInfo gesture = make(GestureState::Ended, event.timestamp_ms);
                reset();
                return gesture;
            }

            pair_.remove(event.touch_id);
            if (pair_.touches.empty())
                reset();
            return std::nullopt;
        }

        default:
            return std::nullopt;
    }
}

std::optional<GestureInfo> PinchRecognizer::cancel(uint64_t timestamp_ms)
{
    std::optional<GestureInfo> result;
    if (recognized_)
        result = make(GestureState::Cancelled, timestamp_ms);
    reset();
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Rotate
// ─────────────────────────────────────────────────────────────────────────────

RotateRecognizer::RotateRecognizer(double min_angle)
    : min_angle_(min_angle)
{
}

double RotateRecognizer::normalize_angle(double radians)
{
    double wrapped = std::remainder(radians, 2.0 * std::numbers::pi);
    if (wrapped <= -std::numbers::pi)
        wrapped += 2.0 * std::numbers::pi;
    return wrapped;
}

void RotateRecognizer::reset()
{
    pair_ = TouchPair{};
    last_angle_ = 0.0;
    rotation_ = 0.0;
    last_emitted_rotation_ = 0.0;
    recognized_ = false;
}

void RotateRecognizer::rebase()
{
    last_angle_ = pair_.angle();
    rotation_ = 0.0;
    last_emitted_rotation_ = 0.0;
}

GestureInfo RotateRecognizer::make(GestureState state, uint64_t timestamp_ms) const
{
    GestureInfo gesture = pair_info(pair_, GestureKind::Rotate, state, timestamp_ms);
    gesture.rotation = rotation_;
    return gesture;
}

std::optional<GestureInfo> RotateRecognizer::update(InputEvent const& event)
{
    switch (event.type)
    {
        case InputEventType::TouchBegin:
            if (accept_touch(pair_, event))
                rebase();
            return std::nullopt;

        case InputEventType::TouchUpdate:
        {
            auto* touch = pair_.find(event.touch_id);
            if (!touch)
                return std::nullopt;
            touch->position = event.position;

            if (!pair_.complete())
                return std::nullopt;

            // Accumulate step by step so turning past +-180 degrees keeps counting
            double angle = pair_.angle();
            rotation_ += normalize_angle(angle - last_angle_);
            last_angle_ = angle;

            if (!recognized_)
            {
                if (std::abs(rotation_) < min_angle_)
                    return std::nullopt;
                recognized_ = true;
                last_emitted_rotation_ = rotation_;
                return make(GestureState::Began, event.timestamp_ms);
            }

            if (std::abs(rotation_ - last_emitted_rotation_) < min_angle_)
                return std::nullopt;
            last_emitted_rotation_ = rotation_;
            return make(GestureState::Changed, event.timestamp_ms);
        }

        case InputEventType::TouchEnd:
        {
            if (!pair_.contains(event.touch_id))
                return std::nullopt;

            if (recognized_)
            {
                GestureInfo gesture = make(GestureState::Ended, event.timestamp_ms);
                reset();
                return gesture;
            }

            pair_.remove(event.touch_id);
            if (pair_.touches.empty())
                reset();
            return std::nullopt;
        }

        default:
            return std::nullopt;
    }
}

std::optional<GestureInfo> RotateRecognizer::cancel(uint64_t timestamp_ms)
{
    std::optional<GestureInfo> result;
    if (recognized_)
        result = make(GestureState::Cancelled, timestamp_ms);
    reset();
    return result;
}

} // namespace lumen
