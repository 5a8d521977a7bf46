#pragma once

#include "lumen/effects/transition.hpp"
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

namespace lumen {

using EffectId = uint64_t;

/// Called whenever an effect's progress changes. Returning false cancels the effect.
using EffectCallback = std::function<bool(float progress)>;

/// Called once when an effect leaves the manager, with its final state.
/// Evicted and dropped effects report Cancelled.
using EffectEndHandler = std::function<void(EffectState state)>;

/// Builds a preconfigured effect of one kind for a given duration.
using EffectFactory = std::function<TransitionEffect(std::chrono::milliseconds duration)>;

/// Raised for operations that are invalid in the manager's current state.
class EffectsError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Bounded, ordered set of running transition effects.
 *
 * Effects are kept in insertion order. When the limit is reached the oldest
 * effect is evicted to make room. Finished effects are pruned at the end of
 * each update() pass. Effects added from a callback while update() runs are
 * held back and join after the pass.
 *
 * An effect's end handler runs exactly once, whether the effect completed, was
 * cancelled, evicted by the limit or dropped by set_enabled(false). Handlers
 * run after the manager's own bookkeeping is done.
 *
 * Not thread-safe on its own; EffectsPipeline provides the lock.
 */
class EffectsManager
{
public:
    explicit EffectsManager(size_t effect_limit = 32);

    void register_factory(EffectKind kind, EffectFactory factory);
    bool has_factory(EffectKind kind) const { return factories_.contains(kind); }

    /// Start an effect. Throws EffectsError when effects are disabled.
    EffectId add_effect(
        TransitionEffect effect,
        std::optional<WindowId> target = std::nullopt,
        EffectCallback callback = {},
        Clock::time_point now = Clock::now()
    );

    /// Build an effect with the registered factory. nullopt when no factory exists for `kind`.
    std::optional<EffectId> add_effect_from_factory(
        EffectKind kind,
        std::chrono::milliseconds duration,
        std::optional<WindowId> target = std::nullopt,
        EffectCallback callback = {},
        Clock::time_point now = Clock::now()
    );

    /// False for an unknown or already removed effect.
    bool set_end_handler(EffectId id, EffectEndHandler handler);

    void update(Clock::time_point now = Clock::now());

    bool cancel_effect(EffectId id);
    size_t cancel_effects_for_target(WindowId target);
    void cancel_all_effects();

    void set_enabled(bool enabled);
    bool is_enabled() const { return enabled_; }

    void set_effect_limit(size_t limit);
    size_t effect_limit() const { return effect_limit_; }

    size_t active_effect_count() const;
    std::optional<float> progress(EffectId id) const;
    TransitionEffect const* effect(EffectId id) const;

private:
    struct ActiveEffect
    {
        EffectId id = 0;
        TransitionEffect effect;
        std::optional<WindowId> target;
        EffectCallback callback;
        EffectEndHandler on_end;
    };

    std::deque<ActiveEffect> effects_;
    std::vector<ActiveEffect> pending_; // Added during update()
    std::map<EffectKind, EffectFactory> factories_;
    size_t effect_limit_;
    bool enabled_ = true;
    bool updating_ = false;
    EffectId next_id_ = 1;

    void register_default_factories();
    [[nodiscard]] std::vector<ActiveEffect> enforce_limit(size_t room_for);
    static void notify_ended(std::vector<ActiveEffect> ended);
    ActiveEffect* find(EffectId id);
    ActiveEffect const* find(EffectId id) const;
};

} // namespace lumen
