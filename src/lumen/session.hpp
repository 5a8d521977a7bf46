#pragma once

#include "lumen/compositor/compositor.hpp"
#include "lumen/config/config.hpp"
#include "lumen/effects/pipeline.hpp"
#include "lumen/gesture/gesture_manager.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace lumen {

/**
 * @brief Owns the compositor, gesture engine and effects pipeline and wires them together.
 *
 * - Compositor window events start and stop transition effects.
 * - Recognized gestures drive compositor actions.
 * - Each frame feeds an Idle tick to the recognizers and advances effects
 *   before the compositor renders.
 */
class Session
{
public:
    /// Fills `out` with pending input. Returns false when the input source has gone away.
    using InputPoller = std::function<bool(std::vector<InputEvent>& out)>;

    Session(Config config, std::unique_ptr<RenderBackend> backend);
    ~Session();

    Session(Session const&) = delete;
    Session& operator=(Session const&) = delete;

    /// Initialize the backend, attach configured outputs and apply the effects preset.
    void initialize();

    /// `arrival` pairs the event's device timestamp with the frame clock for idle ticks.
    std::vector<GestureInfo> handle_input(InputEvent event, Clock::time_point arrival = Clock::now());

    /// Input, idle tick and effects for one frame, without rendering.
    void pre_frame(Clock::time_point now);

    /// pre_frame() followed by one rendered frame.
    void tick(Clock::time_point now);

    void run();
    void stop() { compositor_.stop(); }

    void set_input_poller(InputPoller poller) { input_poller_ = std::move(poller); }

    Compositor& compositor() { return compositor_; }
    GestureManager& gestures() { return gestures_; }
    EffectsPipeline& effects() { return *pipeline_; }
    Config const& config() const { return config_; }

private:
    Config config_;
    Compositor compositor_;
    GestureManager gestures_;
    std::unique_ptr<EffectsPipeline> pipeline_;
    InputPoller input_poller_;

    Clock::time_point now_;
    std::optional<std::pair<uint64_t, Clock::time_point>> last_input_; // device timestamp, arrival
    Clock::time_point started_;

    bool on_compositor_event(CompositorEvent const& event);
    bool on_gesture(GestureInfo const& gesture);
    void start_window_transitions(WindowId id);
    void update_screen_bounds();
    uint64_t idle_timestamp(Clock::time_point now) const;
};

} // namespace lumen
