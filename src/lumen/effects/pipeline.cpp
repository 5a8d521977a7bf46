#include "pipeline.hpp"
#include "lumen/core/log.hpp"
#include <algorithm>

namespace lumen {

EffectsPipeline::EffectsPipeline(size_t effect_limit)
    : manager_(effect_limit)
{
}

EffectsPipeline& EffectsPipeline::add_stage(PipelineStage stage)
{
    std::lock_guard lock(mutex_);
    LOG_DEBUG("Pipeline stage '{}' added", stage.name);
    stages_.push_back(std::move(stage));
    active_preset_.reset();
    return *this;
}

bool EffectsPipeline::set_stage_enabled(std::string const& name, bool enabled)
{
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(stages_, [&](PipelineStage const& s) { return s.name == name; });
    if (it == stages_.end())
        return false;
    it->enabled = enabled;
    return true;
}

std::vector<PipelineStage> EffectsPipeline::stages() const
{
    std::lock_guard lock(mutex_);
    return stages_;
}

std::vector<EffectKind> EffectsPipeline::transition_effects() const
{
    std::lock_guard lock(mutex_);
    std::vector<EffectKind> kinds;
    for (auto const& stage : stages_)
    {
        if (stage.enabled && stage.type == StageType::Transition && stage.effect)
            kinds.push_back(*stage.effect);
    }
    return kinds;
}

void EffectsPipeline::register_preset(std::string name, std::vector<PipelineStage> stages)
{
    std::lock_guard lock(mutex_);
    presets_[std::move(name)] = std::move(stages);
}

bool EffectsPipeline::apply_preset(std::string const& name)
{
    std::lock_guard lock(mutex_);
    auto it = presets_.find(name);
    if (it == presets_.end())
    {
        LOG_WARN("Unknown effects preset '{}'", name);
        return false;
    }

    stages_ = it->second;
    active_preset_ = name;
    LOG_INFO("Effects preset '{}' applied ({} stages)", name, stages_.size());
    return true;
}

std::optional<std::string> EffectsPipeline::active_preset() const
{
    std::lock_guard lock(mutex_);
    return active_preset_;
}

std::vector<std::string> EffectsPipeline::preset_names() const
{
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    for (auto const& [name, _] : presets_)
        names.push_back(name);
    return names;
}

EffectId EffectsPipeline::apply_effect(
    TransitionEffect effect,
    std::optional<WindowId> target,
    EffectCallback callback,
    Clock::time_point now
)
{
    std::lock_guard lock(mutex_);
    return manager_.add_effect(std::move(effect), target, std::move(callback), now);
}

std::optional<EffectId> EffectsPipeline::apply_effect(
    EffectKind kind,
    std::chrono::milliseconds duration,
    std::optional<WindowId> target,
    EffectCallback callback,
    Clock::time_point now
)
{
    std::lock_guard lock(mutex_);
    return manager_.add_effect_from_factory(kind, duration, target, std::move(callback), now);
}

void EffectsPipeline::update(Clock::time_point now)
{
    std::lock_guard lock(mutex_);
    manager_.update(now);
}

bool EffectsPipeline::set_end_handler(EffectId id, EffectEndHandler handler)
{
    std::lock_guard lock(mutex_);
    return manager_.set_end_handler(id, std::move(handler));
}

void EffectsPipeline::clear_all_effects()
{
    std::lock_guard lock(mutex_);
    manager_.cancel_all_effects();
}

size_t EffectsPipeline::cancel_effects_for_target(WindowId target)
{
    std::lock_guard lock(mutex_);
    return manager_.cancel_effects_for_target(target);
}

void EffectsPipeline::set_enabled(bool enabled)
{
    std::lock_guard lock(mutex_);
    manager_.set_enabled(enabled);
}

bool EffectsPipeline::is_enabled() const
{
    std::lock_guard lock(mutex_);
    return manager_.is_enabled();
}

size_t EffectsPipeline::active_effect_count() const
{
    std::lock_guard lock(mutex_);
    return manager_.active_effect_count();
}

std::unique_ptr<EffectsPipeline> create_default_pipeline(size_t effect_limit)
{
    auto pipeline = std::make_unique<EffectsPipeline>(effect_limit);

    pipeline->add_stage(PipelineStage::transition("fade", EffectKind::FadeIn))
        .add_stage(PipelineStage::transition("scale", EffectKind::ScaleIn))
        .add_stage(PipelineStage::filter_stage("blur", FilterKind::Blur));

    pipeline->register_preset("minimal", { PipelineStage::transition("fade", EffectKind::FadeIn) });
    pipeline->register_preset(
        "performance",
        {
            PipelineStage::transition("fade", EffectKind::FadeIn),
            PipelineStage::transition("scale", EffectKind::ScaleIn),
        }
    );
    pipeline->register_preset(
        "fancy",
        {
            PipelineStage::transition("fade", EffectKind::FadeIn),
            PipelineStage::transition("scale", EffectKind::ScaleIn),
            PipelineStage::filter_stage("blur", FilterKind::Blur),
            PipelineStage::filter_stage("color", FilterKind::ColorTransform),
        }
    );

    return pipeline;
}

} // namespace lumen
