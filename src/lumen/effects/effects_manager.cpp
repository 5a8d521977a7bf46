#include "effects_manager.hpp"
#include "lumen/core/log.hpp"
#include <algorithm>
#include <iterator>

namespace lumen {

EffectsManager::EffectsManager(size_t effect_limit)
    : effect_limit_(std::max<size_t>(effect_limit, 1))
{
    register_default_factories();
}

void EffectsManager::register_default_factories()
{
    register_factory(
        EffectKind::FadeIn,
        [](std::chrono::milliseconds duration) { return TransitionEffect(EffectKind::FadeIn, duration, Easing::EaseInOut); }
    );
    register_factory(
        EffectKind::FadeOut,
        [](std::chrono::milliseconds duration)
        { return TransitionEffect(EffectKind::FadeOut, duration, Easing::EaseInOut); }
    );
    register_factory(
        EffectKind::ScaleIn,
        [](std::chrono::milliseconds duration)
        {
            TransitionEffect effect(EffectKind::ScaleIn, duration, Easing::EaseOut);
            effect.with_param("start_scale", 0.8f);
            return effect;
        }
    );
    register_factory(
        EffectKind::ScaleOut,
        [](std::chrono::milliseconds duration)
        {
            TransitionEffect effect(EffectKind::ScaleOut, duration, Easing::Back);
            effect.with_param("end_scale", 0.8f);
            return effect;
        }
    );
}

void EffectsManager::register_factory(EffectKind kind, EffectFactory factory)
{
    if (!factory)
    {
        factories_.erase(kind);
        return;
    }
    factories_[kind] = std::move(factory);
}

EffectId EffectsManager::add_effect(
    TransitionEffect effect,
    std::optional<WindowId> target,
    EffectCallback callback,
    Clock::time_point now
)
{
    if (!enabled_)
        throw EffectsError("Cannot add " + std::string(to_string(effect.kind())) + " effect: effects are disabled");

    effect.start(now);
    ActiveEffect entry{ next_id_++, std::move(effect), target, std::move(callback) };
    EffectId id = entry.id;

    LOG_DEBUG(
        "Effect {} ({}) added for window {}, {}ms",
        id,
        to_string(entry.effect.kind()),
        target.value_or(NO_WINDOW),
        entry.effect.duration().count()
    );

    if (updating_)
    {
        pending_.push_back(std::move(entry));
        return id;
    }

    auto evicted = enforce_limit(1);
    effects_.push_back(std::move(entry));
    notify_ended(std::move(evicted));
    return id;
}

std::optional<EffectId> EffectsManager::add_effect_from_factory(
    EffectKind kind,
    std::chrono::milliseconds duration,
    std::optional<WindowId> target,
    EffectCallback callback,
    Clock::time_point now
)
{
    auto it = factories_.find(kind);
    if (it == factories_.end())
    {
        LOG_WARN("No effect factory registered for {}", to_string(kind));
        return std::nullopt;
    }
    return add_effect(it->second(duration), target, std::move(callback), now);
}

bool EffectsManager::set_end_handler(EffectId id, EffectEndHandler handler)
{
    auto* entry = find(id);
    if (!entry)
        return false;
    entry->on_end = std::move(handler);
    return true;
}

void EffectsManager::update(Clock::time_point now)
{
    {
        // Reset the flag even if a callback throws
        struct UpdatingScope
        {
            bool& flag;
            explicit UpdatingScope(bool& f)
                : flag(f)
            {
                flag = true;
            }
            ~UpdatingScope() { flag = false; }
        } scope(updating_);

        // Index loop: callbacks may cancel effects but never insert into effects_
        for (size_t i = 0; i < effects_.size(); ++i)
        {
            auto& entry = effects_[i];
            if (entry.effect.finished())
                continue;

            if (!entry.effect.update(now) || !entry.callback)
                continue;

            if (!entry.callback(entry.effect.progress()))
            {
                LOG_DEBUG("Effect {} cancelled by its callback", entry.id);
                entry.effect.cancel();
            }
        }
    }

    std::vector<ActiveEffect> ended;
    std::deque<ActiveEffect> running;
    for (auto& entry : effects_)
    {
        if (entry.effect.finished())
            ended.push_back(std::move(entry));
        else
            running.push_back(std::move(entry));
    }
    effects_ = std::move(running);
    if (!ended.empty())
        LOG_TRACE("Pruned {} finished effects, {} remain", ended.size(), effects_.size());

    if (!enabled_)
    {
        std::ranges::move(effects_, std::back_inserter(ended));
        std::ranges::move(pending_, std::back_inserter(ended));
        effects_.clear();
        pending_.clear();
        notify_ended(std::move(ended));
        return;
    }

    for (auto& entry : pending_)
    {
        if (entry.effect.finished())
        {
            ended.push_back(std::move(entry));
            continue;
        }
        std::ranges::move(enforce_limit(1), std::back_inserter(ended));
        effects_.push_back(std::move(entry));
    }
    pending_.clear();

    // The limit may have been lowered from a callback
    std::ranges::move(enforce_limit(0), std::back_inserter(ended));

    notify_ended(std::move(ended));
}

bool EffectsManager::cancel_effect(EffectId id)
{
    auto* entry = find(id);
    if (!entry || entry->effect.finished())
        return false;

    entry->effect.cancel();
    return true;
}

size_t EffectsManager::cancel_effects_for_target(WindowId target)
{
    size_t cancelled = 0;
    auto cancel_matching = [&](ActiveEffect& entry)
    {
        if (entry.target == target && !entry.effect.finished())
        {
            entry.effect.cancel();
            ++cancelled;
        }
    };
    std::ranges::for_each(effects_, cancel_matching);
    std::ranges::for_each(pending_, cancel_matching);

    if (cancelled > 0)
        LOG_DEBUG("Cancelled {} effects for window {}", cancelled, target);
    return cancelled;
}

void EffectsManager::cancel_all_effects()
{
    for (auto& entry : effects_)
        entry.effect.cancel();
    for (auto& entry : pending_)
        entry.effect.cancel();
}

void EffectsManager::set_enabled(bool enabled)
{
    if (enabled_ == enabled)
        return;

    enabled_ = enabled;
    LOG_INFO("Effects {}", enabled ? "enabled" : "disabled");
    if (enabled)
        return;

    cancel_all_effects();
    std::vector<ActiveEffect> dropped(
        std::make_move_iterator(pending_.begin()), std::make_move_iterator(pending_.end())
    );
    pending_.clear();
    // Mid-update, the pass itself drops everything once it is done iterating
    if (!updating_)
    {
        std::ranges::move(effects_, std::back_inserter(dropped));
        effects_.clear();
    }
    notify_ended(std::move(dropped));
}

void EffectsManager::set_effect_limit(size_t limit)
{
    effect_limit_ = std::max<size_t>(limit, 1);
    // Mid-update, the pass enforces the new limit when it ends
    if (!updating_)
        notify_ended(enforce_limit(0));
}

size_t EffectsManager::active_effect_count() const
{
    return static_cast<size_t>(
        std::ranges::count_if(effects_, [](ActiveEffect const& e) { return !e.effect.finished(); })
    );
}

std::optional<float> EffectsManager::progress(EffectId id) const
{
    auto const* entry = find(id);
    if (!entry)
        return std::nullopt;
    return entry->effect.progress();
}

TransitionEffect const* EffectsManager::effect(EffectId id) const
{
    auto const* entry = find(id);
    return entry ? &entry->effect : nullptr;
}

std::vector<EffectsManager::ActiveEffect> EffectsManager::enforce_limit(size_t room_for)
{
    std::vector<ActiveEffect> evicted;
    while (!effects_.empty() && effects_.size() + room_for > effect_limit_)
    {
        LOG_DEBUG("Effect limit {} reached, evicting effect {}", effect_limit_, effects_.front().id);
        evicted.push_back(std::move(effects_.front()));
        effects_.pop_front();
    }
    return evicted;
}

void EffectsManager::notify_ended(std::vector<ActiveEffect> ended)
{
    for (auto& entry : ended)
    {
        if (!entry.effect.finished())
            entry.effect.cancel();
        if (entry.on_end)
            entry.on_end(entry.effect.state());
    }
}

EffectsManager::ActiveEffect* EffectsManager::find(EffectId id)
{
    auto it = std::ranges::find_if(effects_, [id](ActiveEffect const& e) { return e.id == id; });
    if (it != effects_.end())
        return &*it;
    auto pending = std::ranges::find_if(pending_, [id](ActiveEffect const& e) { return e.id == id; });
    return pending != pending_.end() ? &*pending : nullptr;
}

EffectsManager::ActiveEffect const* EffectsManager::find(EffectId id) const
{
    return const_cast<EffectsManager*>(this)->find(id);
}

} // namespace lumen
