#include "transition.hpp"
#include <algorithm>

namespace lumen {

TransitionEffect::TransitionEffect(EffectKind kind, std::chrono::milliseconds duration, Easing easing)
    : kind_(kind)
    , duration_(std::max(duration, std::chrono::milliseconds::zero()))
    , easing_(easing)
{
}

TransitionEffect& TransitionEffect::with_easing(Easing easing)
{
    easing_ = easing;
    return *this;
}

TransitionEffect& TransitionEffect::with_delay(std::chrono::milliseconds delay)
{
    delay_ = std::max(delay, std::chrono::milliseconds::zero());
    return *this;
}

TransitionEffect& TransitionEffect::with_strength(float strength)
{
    strength_ = strength;
    return *this;
}

TransitionEffect& TransitionEffect::with_param(std::string name, float value)
{
    params_[std::move(name)] = value;
    return *this;
}

TransitionEffect& TransitionEffect::with_slide_direction(SlideDirection direction)
{
    slide_direction_ = direction;
    return *this;
}

TransitionEffect& TransitionEffect::with_custom_id(uint32_t id)
{
    custom_id_ = id;
    return *this;
}

void TransitionEffect::start(Clock::time_point now)
{
    start_time_ = now + delay_;
    end_time_ = *start_time_ + duration_;
    progress_ = 0.0f;
    state_ = EffectState::Running;
}

bool TransitionEffect::update(Clock::time_point now)
{
    if (state_ != EffectState::Running)
        return false;

    if (now < *start_time_)
        return false;

    if (now >= *end_time_)
    {
        progress_ = 1.0f;
        state_ = EffectState::Completed;
        return true;
    }

    std::chrono::duration<double> elapsed = now - *start_time_;
    std::chrono::duration<double> total = duration_;
    double t = total.count() > 0.0 ? elapsed.count() / total.count() : 1.0;

    float eased = static_cast<float>(ease(easing_, t));
    if (eased == progress_)
        return false;

    progress_ = eased;
    return true;
}

void TransitionEffect::cancel()
{
    if (!finished())
        state_ = EffectState::Cancelled;
}

std::optional<float> TransitionEffect::param(std::string_view name) const
{
    auto it = params_.find(name);
    if (it == params_.end())
        return std::nullopt;
    return it->second;
}

float TransitionEffect::param_or(std::string_view name, float fallback) const
{
    return param(name).value_or(fallback);
}

std::string_view to_string(EffectKind kind)
{
    switch (kind)
    {
        case EffectKind::FadeIn:
            return "fade-in";
        case EffectKind::FadeOut:
            return "fade-out";
        case EffectKind::ScaleIn:
            return "scale-in";
        case EffectKind::ScaleOut:
            return "scale-out";
        case EffectKind::SlideIn:
            return "slide-in";
        case EffectKind::SlideOut:
            return "slide-out";
        case EffectKind::Blur:
            return "blur";
        case EffectKind::Sharpen:
            return "sharpen";
        case EffectKind::ColorTransform:
            return "color-transform";
        case EffectKind::Ripple:
            return "ripple";
        case EffectKind::Elastic:
            return "elastic";
        case EffectKind::Custom:
            return "custom";
    }
    return "unknown";
}

std::string_view to_string(EffectState state)
{
    switch (state)
    {
        case EffectState::Ready:
            return "Ready";
        case EffectState::Running:
            return "Running";
        case EffectState::Completed:
            return "Completed";
        case EffectState::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

} // namespace lumen
