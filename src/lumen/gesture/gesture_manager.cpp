#include "gesture_manager.hpp"
#include "lumen/core/log.hpp"
#include "lumen/gesture/recognizers.hpp"
#include <algorithm>

namespace lumen {

void GestureManager::register_recognizer(std::unique_ptr<GestureRecognizer> recognizer)
{
    if (!recognizer)
        return;

    GestureKind kind = recognizer->kind();
    auto it = std::ranges::find_if(recognizers_, [kind](auto const& r) { return r->kind() == kind; });
    if (it != recognizers_.end())
    {
        LOG_DEBUG("Replacing {} recognizer", to_string(kind));
        deactivate(kind);
        *it = std::move(recognizer);
        return;
    }

    LOG_DEBUG("Registered {} recognizer", to_string(kind));
    recognizers_.push_back(std::move(recognizer));
}

void GestureManager::register_default_recognizers(GestureConfig const& config, Rectangle screen)
{
    screen_ = screen;
    register_recognizer(std::make_unique<TapRecognizer>(config.tap_threshold, config.tap_timeout_ms));
    register_recognizer(std::make_unique<DoubleTapRecognizer>(
        config.tap_threshold,
        config.tap_timeout_ms,
        config.double_tap_interval_ms,
        config.double_tap_distance
    ));
    register_recognizer(std::make_unique<LongPressRecognizer>(
        config.long_press_threshold,
        config.long_press_delay_ms,
        config.long_press_feedback_ms
    ));
    register_recognizer(std::make_unique<SwipeRecognizer>(config.swipe_min_distance, config.swipe_max_time_ms));
    register_recognizer(std::make_unique<PinchRecognizer>(config.pinch_min_distance, config.pinch_min_scale_change));
    register_recognizer(std::make_unique<RotateRecognizer>(config.rotate_min_angle));
    register_recognizer(
        std::make_unique<EdgeSwipeRecognizer>(screen_, config.edge_threshold, config.edge_min_distance)
    );
}

void GestureManager::add_callback(GestureCallback callback)
{
    if (callback)
        callbacks_.push_back(std::move(callback));
}

std::vector<GestureInfo> GestureManager::process_event(InputEvent const& event)
{
    if (event.type != InputEventType::Idle)
        LOG_INPUT(to_string(event.type), event.position.x, event.position.y, event.timestamp_ms);

    std::vector<GestureInfo> emitted;
    std::vector<GestureKind> const previously_active = active_;
    std::vector<GestureRecognizer*> began_now;

    // Phase 1: recognizers that are not yet active
    for (auto& recognizer : recognizers_)
    {
        if (is_active(recognizer->kind()))
            continue;

        auto gesture = recognizer->update(event);
        if (!gesture)
            continue;

        if (gesture->state == GestureState::Began)
        {
            activate(recognizer->kind());
            began_now.push_back(recognizer.get());
        }
        emitted.push_back(std::move(*gesture));
    }

    // Arbitration: an exclusive recognizer that began claims its contacts
    for (auto* winner : began_now)
    {
        if (!winner->is_exclusive())
            continue;

        for (Contact const& contact : winner->contacts())
        {
            for (auto& other : recognizers_)
            {
                if (!other->is_exclusive() || std::ranges::find(began_now, other.get()) != began_now.end())
                    continue;
                if (!other->tracks(contact))
                    continue;

                LOG_TRACE("{} claims contact, cancelling {}", winner->name(), other->name());
                bool was_active = is_active(other->kind());
                auto cancelled = other->cancel(event.timestamp_ms);
                if (was_active)
                    deactivate(other->kind());
                if (cancelled)
                    emitted.push_back(std::move(*cancelled));
            }
        }
    }

    // Phase 2: kinds that were already in progress get the event too
    for (auto& recognizer : recognizers_)
    {
        GestureKind kind = recognizer->kind();
        if (std::ranges::find(previously_active, kind) == previously_active.end() || !is_active(kind))
            continue;

        auto gesture = recognizer->update(event);
        if (gesture)
        {
            if (gesture->is_terminal())
                deactivate(kind);
            emitted.push_back(std::move(*gesture));
        }
        else if (!recognizer->is_tracking())
        {
            LOG_TRACE("{} stopped tracking without a terminal state", recognizer->name());
            deactivate(kind);
        }
    }

    for (auto const& gesture : emitted)
        dispatch(gesture);

    return emitted;
}

void GestureManager::reset_all()
{
    for (auto& recognizer : recognizers_)
        recognizer->reset();
    active_.clear();
}

void GestureManager::set_screen_bounds(Rectangle screen)
{
    screen_ = screen;
    if (auto* edge = dynamic_cast<EdgeSwipeRecognizer*>(recognizer(GestureKind::EdgeSwipe)))
        edge->set_screen_bounds(screen);
}

GestureRecognizer* GestureManager::recognizer(GestureKind kind) const
{
    auto it = std::ranges::find_if(recognizers_, [kind](auto const& r) { return r->kind() == kind; });
    return it != recognizers_.end() ? it->get() : nullptr;
}

bool GestureManager::is_active(GestureKind kind) const
{
    return std::ranges::find(active_, kind) != active_.end();
}

void GestureManager::activate(GestureKind kind)
{
    if (!is_active(kind))
        active_.push_back(kind);
}

void GestureManager::deactivate(GestureKind kind)
{
    std::erase(active_, kind);
}

void GestureManager::dispatch(GestureInfo const& gesture) const
{
    LOG_TRACE(
        "Gesture {} {} at ({:.1f}, {:.1f})",
        to_string(gesture.kind),
        to_string(gesture.state),
        gesture.position.x,
        gesture.position.y
    );

    // Copy: a callback may register another callback
    auto callbacks = callbacks_;
    for (auto const& callback : callbacks)
    {
        if (!callback(gesture))
            break;
    }
}

} // namespace lumen
