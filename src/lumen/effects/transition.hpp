#pragma once

#include "lumen/core/types.hpp"
#include "lumen/effects/easing.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace lumen {

enum class EffectKind
{
    FadeIn,
    FadeOut,
    ScaleIn,
    ScaleOut,
    SlideIn,
    SlideOut,
    Blur,
    Sharpen,
    ColorTransform,
    Ripple,
    Elastic,
    Custom,
};

enum class SlideDirection
{
    FromTop,
    FromBottom,
    FromLeft,
    FromRight,
};

enum class EffectState
{
    Ready,
    Running,
    Completed,
    Cancelled,
};

/**
 * @brief One time-based transition from progress 0 to 1.
 *
 * start() schedules the effect at `now + delay`; until then progress stays 0.
 * Progress is linear time through the duration passed through the easing
 * curve. The tick that reaches the end sets progress to exactly 1 and the
 * state to Completed.
 */
class TransitionEffect
{
public:
    TransitionEffect(EffectKind kind, std::chrono::milliseconds duration, Easing easing = Easing::Linear);

    TransitionEffect& with_easing(Easing easing);
    TransitionEffect& with_delay(std::chrono::milliseconds delay);
    TransitionEffect& with_strength(float strength);
    TransitionEffect& with_param(std::string name, float value);
    TransitionEffect& with_slide_direction(SlideDirection direction);
    TransitionEffect& with_custom_id(uint32_t id);

    void start(Clock::time_point now);

    /// Advance to `now`. Returns true exactly when progress or state changed.
    bool update(Clock::time_point now);

    void cancel();

    EffectKind kind() const { return kind_; }
    EffectState state() const { return state_; }
    Easing easing() const { return easing_; }
    float progress() const { return progress_; }
    float strength() const { return strength_; }
    /// progress * strength
    float value() const { return progress_ * strength_; }
    std::chrono::milliseconds duration() const { return duration_; }
    std::chrono::milliseconds delay() const { return delay_; }
    std::optional<Clock::time_point> start_time() const { return start_time_; }
    std::optional<Clock::time_point> end_time() const { return end_time_; }
    std::optional<SlideDirection> slide_direction() const { return slide_direction_; }
    uint32_t custom_id() const { return custom_id_; }

    std::optional<float> param(std::string_view name) const;
    float param_or(std::string_view name, float fallback) const;
    std::map<std::string, float, std::less<>> const& params() const { return params_; }

    bool finished() const { return state_ == EffectState::Completed || state_ == EffectState::Cancelled; }

private:
    EffectKind kind_;
    std::chrono::milliseconds duration_;
    std::chrono::milliseconds delay_{ 0 };
    Easing easing_;
    EffectState state_ = EffectState::Ready;
    float progress_ = 0.0f;
    float strength_ = 1.0f;
    std::optional<Clock::time_point> start_time_;
    std::optional<Clock::time_point> end_time_;
    std::optional<SlideDirection> slide_direction_;
    uint32_t custom_id_ = 0;
    std::map<std::string, float, std::less<>> params_;
};

std::string_view to_string(EffectKind kind);
std::string_view to_string(EffectState state);

} // namespace lumen
