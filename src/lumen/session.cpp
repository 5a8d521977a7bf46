#include "session.hpp"
#include "lumen/core/log.hpp"
#include <algorithm>

namespace lumen {

namespace {

OutputDevice output_from_config(OutputConfig const& config)
{
    OutputDevice output;
    output.name = config.name;
    output.width = config.width;
    output.height = config.height;
    output.refresh_rate = config.refresh;
    output.scale_factor = config.scale > 0.0 ? config.scale : 1.0;
    output.x = config.x;
    output.y = config.y;
    output.primary = config.primary;
    return output;
}

} // namespace

Session::Session(Config config, std::unique_ptr<RenderBackend> backend)
    : config_(std::move(config))
    , compositor_(config_.compositor, std::move(backend))
    , pipeline_(create_default_pipeline(config_.effects.effect_limit))
    , now_(Clock::now())
    , started_(now_)
{
    compositor_.add_event_handler([this](CompositorEvent const& event) { return on_compositor_event(event); });
    gestures_.add_callback([this](GestureInfo const& gesture) { return on_gesture(gesture); });
}

Session::~Session()
{
    // Effect callbacks reference the compositor
    pipeline_->set_enabled(false);
}

void Session::initialize()
{
    compositor_.initialize();

    for (auto const& output : config_.outputs)
        compositor_.add_output(output_from_config(output));

    gestures_.register_default_recognizers(config_.gestures);
    update_screen_bounds();

    if (!pipeline_->apply_preset(config_.effects.preset))
        LOG_WARN("Keeping default effects stages");
    pipeline_->set_enabled(config_.effects.enabled);

    LOG_INFO(
        "Session ready: {} outputs, {} recognizers, effects {}",
        compositor_.outputs().size(),
        gestures_.recognizer_count(),
        config_.effects.enabled ? "on" : "off"
    );
}

std::vector<GestureInfo> Session::handle_input(InputEvent event, Clock::time_point arrival)
{
    if (event.type != InputEventType::Idle)
    {
        if (!event.target)
            event.target = compositor_.window_at(event.position);
        last_input_ = { event.timestamp_ms, arrival };
    }
    return gestures_.process_event(event);
}

void Session::pre_frame(Clock::time_point now)
{
    now_ = now;

    if (input_poller_)
    {
        std::vector<InputEvent> events;
        if (!input_poller_(events))
        {
            LOG_INFO("Input source closed, stopping");
            stop();
        }
        for (auto& event : events)
            handle_input(std::move(event), now);
    }

    InputEvent idle;
    idle.type = InputEventType::Idle;
    idle.timestamp_ms = idle_timestamp(now);
    gestures_.process_event(idle);

    pipeline_->update(now);
}

void Session::tick(Clock::time_point now)
{
    pre_frame(now);
    compositor_.render_frame(now);
}

void Session::run()
{
    compositor_.set_pre_frame_hook([this](Clock::time_point now) { pre_frame(now); });
    compositor_.run();
}

// ─────────────────────────────────────────────────────────────────────────────
// Wiring
// ─────────────────────────────────────────────────────────────────────────────

bool Session::on_compositor_event(CompositorEvent const& event)
{
    switch (event.type)
    {
        case CompositorEventType::WindowCreated:
            start_window_transitions(event.window);
            break;
        case CompositorEventType::WindowDestroyed:
            pipeline_->cancel_effects_for_target(event.window);
            break;
        case CompositorEventType::OutputAdded:
        case CompositorEventType::OutputRemoved:
        case CompositorEventType::OutputEnabled:
        case CompositorEventType::OutputModeChanged:
            update_screen_bounds();
            break;
        default:
            break;
    }
    return true;
}

void Session::start_window_transitions(WindowId id)
{
    if (!pipeline_->is_enabled())
        return;

    auto const* window = compositor_.window(id);
    if (!window)
        return;

    auto duration = std::chrono::milliseconds(config_.effects.default_duration_ms);

    for (EffectKind kind : pipeline_->transition_effects())
    {
        try
        {
            if (kind == EffectKind::FadeIn)
            {
                float target_opacity = window->opacity;
                compositor_.set_window_opacity(id, 0.0f);
                auto effect = pipeline_->apply_effect(
                    kind,
                    duration,
                    id,
                    [this, id, target_opacity](float progress)
                    { return compositor_.set_window_opacity(id, target_opacity * progress); },
                    now_
                );
                if (effect)
                {
                    // An interrupted fade must not leave the window invisible
                    pipeline_->set_end_handler(
                        *effect,
                        [this, id, target_opacity](EffectState state)
                        {
                            if (state != EffectState::Completed)
                                compositor_.set_window_opacity(id, target_opacity);
                        }
                    );
                }
            }
            else if (kind == EffectKind::ScaleIn)
            {
                float start = config_.effects.start_scale;
                compositor_.set_window_scale(id, start);
                auto effect = pipeline_->apply_effect(
                    kind,
                    duration,
                    id,
                    [this, id, start](float progress)
                    { return compositor_.set_window_scale(id, start + (1.0f - start) * progress); },
                    now_
                );
                if (effect)
                {
                    pipeline_->set_end_handler(
                        *effect,
                        [this, id](EffectState state)
                        {
                            if (state != EffectState::Completed)
                                compositor_.set_window_scale(id, 1.0f);
                        }
                    );
                }
            }
            else
            {
                LOG_TRACE("No window-open binding for {} stage", to_string(kind));
            }
        }
        catch (EffectsError const& e)
        {
            LOG_WARN("Window {}: {}", id, e.what());
        }

        // set_window_opacity may have run handlers that removed the window
        window = compositor_.window(id);
        if (!window)
            return;
    }
}

bool Session::on_gesture(GestureInfo const& gesture)
{
    auto target = gesture.target;
    if (target && !compositor_.window(*target))
        target.reset();

    switch (gesture.kind)
    {
        case GestureKind::Tap:
            if (target)
            {
                compositor_.set_active_window(*target);
                compositor_.raise_window(*target);
            }
            break;

        case GestureKind::DoubleTap:
            if (target)
            {
                if (compositor_.window(*target)->maximized)
                    compositor_.restore_window(*target);
                else
                    compositor_.maximize_window(*target);
            }
            break;

        case GestureKind::LongPress:
            if (target && gesture.state == GestureState::Began)
                compositor_.raise_window(*target);
            break;

        case GestureKind::Swipe:
            if (target && gesture.state == GestureState::Ended && gesture.direction == SwipeDirection::Down)
                compositor_.minimize_window(*target);
            break;

        case GestureKind::Pinch:
            if (target && gesture.state == GestureState::Ended && gesture.scale && *gesture.scale < 1.0)
                compositor_.minimize_window(*target);
            break;

        case GestureKind::EdgeSwipe:
            if (gesture.state == GestureState::Ended && gesture.edge == ScreenEdge::Bottom)
            {
                // Copy: restore handlers may change the queue
                auto order = compositor_.render_order();
                for (WindowId id : order)
                {
                    auto const* window = compositor_.window(id);
                    if (window && window->minimized)
                        compositor_.restore_window(id);
                }
            }
            break;

        case GestureKind::Rotate:
            break;
    }
    return true;
}

void Session::update_screen_bounds()
{
    Rectangle bounds;
    for (auto const& [id, output] : compositor_.outputs())
    {
        if (output.enabled)
            bounds = bounds.united(output.logical_geometry());
    }
    if (bounds.empty())
        return;

    gestures_.set_screen_bounds(bounds);
    LOG_DEBUG("Gesture screen bounds {}x{}+{}+{}", bounds.width, bounds.height, bounds.x, bounds.y);
}

uint64_t Session::idle_timestamp(Clock::time_point now) const
{
    // Extrapolate the input device clock from the last event it sent
    if (last_input_)
    {
        auto since = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_input_->second).count();
        return last_input_->first + static_cast<uint64_t>(std::max<int64_t>(since, 0));
    }
    auto since_start = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_).count();
    return static_cast<uint64_t>(std::max<int64_t>(since_start, 0));
}

} // namespace lumen
