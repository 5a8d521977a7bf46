#pragma once

#include "lumen/effects/effects_manager.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

enum class StageType
{
    Transition,
    Filter,
    Animation,
    Render,
    Custom,
};

enum class FilterKind
{
    Blur,
    Sharpen,
    ColorTransform,
    Ripple,
};

struct PipelineStage
{
    std::string name;
    StageType type = StageType::Custom;
    bool enabled = true;
    std::optional<EffectKind> effect; ///< Transition stages
    std::optional<FilterKind> filter; ///< Filter stages

    static PipelineStage transition(std::string name, EffectKind kind)
    {
        return { std::move(name), StageType::Transition, true, kind, std::nullopt };
    }

    static PipelineStage filter_stage(std::string name, FilterKind kind)
    {
        return { std::move(name), StageType::Filter, true, std::nullopt, kind };
    }
};

/**
 * @brief Ordered stage list plus the effects manager it drives.
 *
 * This is the one structure shared between threads: settings changes may add
 * effects while the render loop calls update(). Every public member takes the
 * same recursive mutex, so effect callbacks running inside update() may call
 * back into the pipeline.
 */
class EffectsPipeline
{
public:
    explicit EffectsPipeline(size_t effect_limit = 32);

    EffectsPipeline(EffectsPipeline const&) = delete;
    EffectsPipeline& operator=(EffectsPipeline const&) = delete;

    EffectsPipeline& add_stage(PipelineStage stage);
    bool set_stage_enabled(std::string const& name, bool enabled);
    std::vector<PipelineStage> stages() const;

    /// Enabled transition stages' effect kinds, in stage order.
    std::vector<EffectKind> transition_effects() const;

    void register_preset(std::string name, std::vector<PipelineStage> stages);
    /// Replace the stage list with a preset's. False (and no change) for an unknown name.
    bool apply_preset(std::string const& name);
    std::optional<std::string> active_preset() const;
    std::vector<std::string> preset_names() const;

    EffectId apply_effect(
        TransitionEffect effect,
        std::optional<WindowId> target = std::nullopt,
        EffectCallback callback = {},
        Clock::time_point now = Clock::now()
    );
    std::optional<EffectId> apply_effect(
        EffectKind kind,
        std::chrono::milliseconds duration,
        std::optional<WindowId> target = std::nullopt,
        EffectCallback callback = {},
        Clock::time_point now = Clock::now()
    );

    bool set_end_handler(EffectId id, EffectEndHandler handler);

    void update(Clock::time_point now = Clock::now());
    void clear_all_effects();
    size_t cancel_effects_for_target(WindowId target);

    void set_enabled(bool enabled);
    bool is_enabled() const;
    size_t active_effect_count() const;

    /// Run `fn` with the lock held, for anything not covered above.
    template<typename Fn>
    decltype(auto) with_manager(Fn&& fn)
    {
        std::lock_guard lock(mutex_);
        return fn(manager_);
    }

private:
    mutable std::recursive_mutex mutex_;
    EffectsManager manager_;
    std::vector<PipelineStage> stages_;
    std::map<std::string, std::vector<PipelineStage>> presets_;
    std::optional<std::string> active_preset_;
};

/// Pipeline with the fade, scale and blur stages and the minimal, performance and fancy presets.
std::unique_ptr<EffectsPipeline> create_default_pipeline(size_t effect_limit = 32);

} // namespace lumen
