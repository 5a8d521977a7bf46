#include "compositor.hpp"
#include "lumen/core/invariants.hpp"
#include "lumen/core/log.hpp"
#include "lumen/core/policy.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace lumen {

std::string_view to_string(CompositorEventType type)
{
    switch (type)
    {
        case CompositorEventType::WindowCreated:
            return "WindowCreated";
        case CompositorEventType::WindowDestroyed:
            return "WindowDestroyed";
        case CompositorEventType::WindowFocused:
            return "WindowFocused";
        case CompositorEventType::WindowMoved:
            return "WindowMoved";
        case CompositorEventType::WindowResized:
            return "WindowResized";
        case CompositorEventType::WindowMinimized:
            return "WindowMinimized";
        case CompositorEventType::WindowMaximized:
            return "WindowMaximized";
        case CompositorEventType::WindowRestored:
            return "WindowRestored";
        case CompositorEventType::WindowFullscreen:
            return "WindowFullscreen";
        case CompositorEventType::WindowOpacityChanged:
            return "WindowOpacityChanged";
        case CompositorEventType::OutputAdded:
            return "OutputAdded";
        case CompositorEventType::OutputRemoved:
            return "OutputRemoved";
        case CompositorEventType::OutputEnabled:
            return "OutputEnabled";
        case CompositorEventType::OutputModeChanged:
            return "OutputModeChanged";
        case CompositorEventType::FramePresented:
            return "FramePresented";
        case CompositorEventType::FrameDropped:
            return "FrameDropped";
    }
    return "Unknown";
}

Compositor::Compositor(CompositorConfig config, std::unique_ptr<RenderBackend> backend)
    : config_(config)
    , backend_(std::move(backend))
    , fps_counter_(config.fps_window)
{
}

Compositor::~Compositor()
{
    shutdown();
}

void Compositor::initialize()
{
    if (initialized_)
        return;

    if (backend_)
    {
        if (!backend_->initialize())
            throw std::runtime_error("Failed to initialize render backend " + std::string(backend_->name()));
        LOG_INFO("Compositor using {} render backend", backend_->name());
    }
    else
    {
        LOG_INFO("Compositor running without a render backend");
    }
    initialized_ = true;
}

void Compositor::shutdown()
{
    running_ = false;
    if (!initialized_)
        return;

    if (backend_)
        backend_->shutdown();
    initialized_ = false;
    LOG_DEBUG("Compositor shut down");
}

// ─────────────────────────────────────────────────────────────────────────────
// Window lifecycle and focus
// ─────────────────────────────────────────────────────────────────────────────

WindowId Compositor::add_window(Window window)
{
    if (window.id == NO_WINDOW || windows_.contains(window.id))
    {
        while (windows_.contains(next_window_id_) || next_window_id_ == NO_WINDOW)
            ++next_window_id_;
        window.id = next_window_id_++;
    }
    else if (window.id >= next_window_id_)
    {
        next_window_id_ = window.id + 1;
    }

    WindowId id = window.id;
    window.focused = false;
    window.children.clear();
    window.opacity = std::clamp(window.opacity, 0.0f, 1.0f);
    window.damage.clear();

    if (window.parent && !windows_.contains(*window.parent))
    {
        LOG_WARN("add_window: window {} names unknown parent {}, dropping link", id, *window.parent);
        window.parent.reset();
    }

    if (window.parent)
        windows_.at(*window.parent).children.push_back(id);

    auto& stored = windows_.emplace(id, std::move(window)).first->second;
    render_queue_.push_back(id);
    sync_z_order();
    damage_full(stored);

    LOG_DEBUG(
        "Window {} added ('{}', {}x{}+{}+{})",
        id,
        stored.title,
        stored.geometry.width,
        stored.geometry.height,
        stored.geometry.x,
        stored.geometry.y
    );
    check_invariants();
    emit_window_event(CompositorEventType::WindowCreated, id);
    return id;
}

bool Compositor::remove_window(WindowId id)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    // Children first, deepest first
    std::vector<WindowId> doomed;
    collect_subtree(id, doomed);

    detach_from_parent(*window);

    bool lost_focus = false;
    for (WindowId victim : doomed)
    {
        if (active_window_ == victim)
        {
            active_window_.reset();
            lost_focus = true;
        }
        windows_.erase(victim);
        std::erase(render_queue_, victim);
        LOG_DEBUG("Window {} removed", victim);
    }
    sync_z_order();

    if (lost_focus)
        refocus_after_loss(id);

    check_invariants();

    for (WindowId victim : doomed)
        emit_window_event(CompositorEventType::WindowDestroyed, victim);

    if (lost_focus && active_window_)
        emit_window_event(CompositorEventType::WindowFocused, *active_window_);
    return true;
}

bool Compositor::set_active_window(WindowId id)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    if (active_window_ && *active_window_ != id)
    {
        if (auto* previous = find_window(*active_window_))
            previous->focused = false;
    }
    window->focused = true;
    active_window_ = id;

    LOG_DEBUG("Window {} focused", id);
    check_invariants();
    emit_window_event(CompositorEventType::WindowFocused, id);
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Window state
// ─────────────────────────────────────────────────────────────────────────────

bool Compositor::raise_window(WindowId id)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    if (stacking_policy::raise(render_queue_, id))
    {
        sync_z_order();
        damage_full(*window);
        LOG_DEBUG("Window {} raised", id);
    }
    check_invariants();
    return true;
}

bool Compositor::lower_window(WindowId id)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    if (stacking_policy::lower(render_queue_, id))
    {
        sync_z_order();
        damage_full(*window);
        LOG_DEBUG("Window {} lowered", id);
    }
    check_invariants();
    return true;
}

bool Compositor::move_window(WindowId id, int32_t x, int32_t y)
{
    auto* window = find_window(id);
    if (!window || !window->movable)
        return false;

    window->geometry.x = x;
    window->geometry.y = y;
    damage_full(*window);

    CompositorEvent event;
    event.type = CompositorEventType::WindowMoved;
    event.window = id;
    event.x = x;
    event.y = y;
    emit_event(event);
    return true;
}

bool Compositor::resize_window(WindowId id, uint32_t width, uint32_t height)
{
    auto* window = find_window(id);
    if (!window || !window->resizable)
        return false;

    window->geometry.width = std::max<uint32_t>(width, 1);
    window->geometry.height = std::max<uint32_t>(height, 1);
    damage_full(*window);

    CompositorEvent event;
    event.type = CompositorEventType::WindowResized;
    event.window = id;
    event.width = window->geometry.width;
    event.height = window->geometry.height;
    emit_event(event);
    return true;
}

bool Compositor::minimize_window(WindowId id)
{
    auto* window = find_window(id);
    if (!window)
        return false;
    if (window->minimized)
        return true;

    window->minimized = true;
    bool lost_focus = active_window_ == id;
    if (lost_focus)
    {
        window->focused = false;
        active_window_.reset();
        refocus_after_loss(id);
    }

    LOG_DEBUG("Window {} minimized", id);
    check_invariants();
    emit_window_event(CompositorEventType::WindowMinimized, id);
    if (lost_focus && active_window_)
        emit_window_event(CompositorEventType::WindowFocused, *active_window_);
    return true;
}

bool Compositor::maximize_window(WindowId id)
{
    auto* window = find_window(id);
    if (!window || !window->resizable)
        return false;

    auto primary = primary_output();
    if (!primary)
    {
        LOG_WARN("maximize_window: no output to maximize window {} on", id);
        return false;
    }

    if (!window->maximized && !window->fullscreen)
        window->restore_geometry = window->geometry;

    window->geometry = outputs_.at(*primary).logical_geometry();
    window->maximized = true;
    window->minimized = false;
    damage_full(*window);

    LOG_DEBUG(
        "Window {} maximized to {}x{}+{}+{}",
        id,
        window->geometry.width,
        window->geometry.height,
        window->geometry.x,
        window->geometry.y
    );
    emit_window_event(CompositorEventType::WindowMaximized, id);
    return true;
}

bool Compositor::restore_window(WindowId id)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    window->minimized = false;
    if (window->maximized || window->fullscreen)
    {
        if (window->restore_geometry)
            window->geometry = *window->restore_geometry;
        window->restore_geometry.reset();
    }
    window->maximized = false;
    window->fullscreen = false;
    damage_full(*window);

    LOG_DEBUG("Window {} restored", id);
    check_invariants();
    emit_window_event(CompositorEventType::WindowRestored, id);
    return true;
}

bool Compositor::set_fullscreen(WindowId id, bool enabled)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    if (enabled == window->fullscreen)
        return true;

    if (enabled)
    {
        if (outputs_.empty())
        {
            LOG_WARN("set_fullscreen: no output for window {}", id);
            return false;
        }
        if (!window->maximized)
            window->restore_geometry = window->geometry;
        window->geometry = output_area_for(*window);
        window->fullscreen = true;
    }
    else
    {
        window->fullscreen = false;
        if (window->maximized)
        {
            if (auto primary = primary_output())
                window->geometry = outputs_.at(*primary).logical_geometry();
        }
        else if (window->restore_geometry)
        {
            window->geometry = *window->restore_geometry;
            window->restore_geometry.reset();
        }
    }
    damage_full(*window);

    LOG_DEBUG("Window {} fullscreen={}", id, enabled);
    CompositorEvent event;
    event.type = CompositorEventType::WindowFullscreen;
    event.window = id;
    event.flag = enabled;
    emit_event(event);
    return true;
}

bool Compositor::set_window_opacity(WindowId id, float opacity)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    window->opacity = std::clamp(opacity, 0.0f, 1.0f);
    damage_full(*window);

    CompositorEvent event;
    event.type = CompositorEventType::WindowOpacityChanged;
    event.window = id;
    event.opacity = window->opacity;
    emit_event(event);
    return true;
}

bool Compositor::set_window_scale(WindowId id, float scale)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    window->effect_scale = std::max(scale, 0.0f);
    damage_full(*window);
    return true;
}

bool Compositor::set_window_visible(WindowId id, bool visible)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    if (window->visible == visible)
        return true;

    window->visible = visible;
    damage_full(*window);
    LOG_DEBUG("Window {} visible={}", id, visible);
    return true;
}

bool Compositor::set_parent(WindowId child, std::optional<WindowId> parent)
{
    auto* window = find_window(child);
    if (!window)
        return false;

    if (parent)
    {
        if (!windows_.contains(*parent))
            return false;

        auto parent_of = [this](WindowId id) -> std::optional<WindowId>
        {
            auto it = windows_.find(id);
            return it != windows_.end() ? it->second.parent : std::nullopt;
        };
        if (stacking_policy::would_create_cycle(child, *parent, parent_of))
        {
            LOG_WARN("set_parent: refusing to parent {} under {} (cycle)", child, *parent);
            return false;
        }
    }

    detach_from_parent(*window);
    window->parent = parent;
    if (parent)
        windows_.at(*parent).children.push_back(child);

    LOG_DEBUG("Window {} parent set to {}", child, parent ? *parent : NO_WINDOW);
    check_invariants();
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Content and regions
// ─────────────────────────────────────────────────────────────────────────────

bool Compositor::submit_buffer(WindowId id, Buffer buffer)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    if (!buffer.valid())
    {
        LOG_WARN("submit_buffer: rejecting invalid {}x{} buffer for window {}", buffer.width, buffer.height, id);
        return false;
    }

    window->buffer = std::make_shared<Buffer const>(std::move(buffer));
    damage_full(*window);
    LOG_TRACE("Window {} buffer replaced", id);
    return true;
}

bool Compositor::damage_window(WindowId id, Rectangle const& region)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    auto clipped = damage_policy::clip_to_surface(window->local_bounds(), region);
    if (!clipped)
    {
        LOG_TRACE("Window {} damage {}x{}+{}+{} misses surface", id, region.width, region.height, region.x, region.y);
        return true;
    }
    window->damage.push_back(*clipped);
    return true;
}

bool Compositor::set_input_region(WindowId id, std::vector<Rectangle> regions)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    std::erase_if(regions, [](Rectangle const& r) { return r.empty(); });
    window->input_region = std::move(regions);
    return true;
}

bool Compositor::set_opacity_region(WindowId id, Rectangle const& region, float opacity)
{
    auto* window = find_window(id);
    if (!window)
        return false;

    auto clipped = damage_policy::clip_to_surface(window->local_bounds(), region);
    if (!clipped)
        return false;

    float value = std::clamp(opacity, 0.0f, 1.0f);
    auto it = std::ranges::find_if(
        window->opacity_regions,
        [&](OpacityRegion const& existing) { return existing.region == *clipped; }
    );
    if (it != window->opacity_regions.end())
        it->opacity = value;
    else
        window->opacity_regions.push_back({ *clipped, value });

    window->damage.push_back(*clipped);
    return true;
}

std::optional<WindowId> Compositor::window_at(Point p) const
{
    for (auto it = render_queue_.rbegin(); it != render_queue_.rend(); ++it)
    {
        auto const& window = windows_.at(*it);
        if (!window.renderable() || !window.geometry.contains(p))
            continue;

        if (window.input_region.empty())
            return window.id;

        Point local{ p.x - window.geometry.x, p.y - window.geometry.y };
        bool inside = std::ranges::any_of(window.input_region, [&](Rectangle const& r) { return r.contains(local); });
        if (inside)
            return window.id;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Outputs
// ─────────────────────────────────────────────────────────────────────────────

OutputId Compositor::add_output(OutputDevice output)
{
    while (outputs_.contains(next_output_id_) || next_output_id_ == NO_OUTPUT)
        ++next_output_id_;
    OutputId id = next_output_id_++;
    output.id = id;
    output.transform = Transform::rotation(output.rotation);

    bool has_primary = std::ranges::any_of(outputs_, [](auto const& entry) { return entry.second.primary; });
    if (has_primary)
        output.primary = false;
    else
        output.primary = true;

    LOG_INFO(
        "Output {} '{}' added ({}x{}@{:.2f}Hz, scale {}){}",
        id,
        output.name,
        output.width,
        output.height,
        output.refresh_rate,
        output.scale_factor,
        output.primary ? " [primary]" : ""
    );
    outputs_.emplace(id, std::move(output));

    CompositorEvent event;
    event.type = CompositorEventType::OutputAdded;
    event.output = id;
    emit_event(event);
    return id;
}

bool Compositor::remove_output(OutputId id)
{
    auto it = outputs_.find(id);
    if (it == outputs_.end())
        return false;

    bool was_primary = it->second.primary;
    LOG_INFO("Output {} '{}' removed", id, it->second.name);
    outputs_.erase(it);

    if (was_primary && !outputs_.empty())
        outputs_.begin()->second.primary = true;

    CompositorEvent event;
    event.type = CompositorEventType::OutputRemoved;
    event.output = id;
    emit_event(event);
    return true;
}

bool Compositor::set_output_enabled(OutputId id, bool enabled)
{
    auto it = outputs_.find(id);
    if (it == outputs_.end())
        return false;

    it->second.enabled = enabled;
    LOG_DEBUG("Output {} enabled={}", id, enabled);

    CompositorEvent event;
    event.type = CompositorEventType::OutputEnabled;
    event.output = id;
    event.flag = enabled;
    emit_event(event);
    return true;
}

bool Compositor::set_output_mode(OutputId id, uint32_t width, uint32_t height, double refresh_rate)
{
    auto it = outputs_.find(id);
    if (it == outputs_.end() || width == 0 || height == 0 || refresh_rate <= 0.0)
        return false;

    it->second.width = width;
    it->second.height = height;
    it->second.refresh_rate = refresh_rate;
    LOG_INFO("Output {} mode set to {}x{}@{:.2f}Hz", id, width, height, refresh_rate);

    CompositorEvent event;
    event.type = CompositorEventType::OutputModeChanged;
    event.output = id;
    event.width = width;
    event.height = height;
    event.refresh = refresh_rate;
    emit_event(event);
    return true;
}

bool Compositor::set_output_rotation(OutputId id, OutputRotation rotation)
{
    auto it = outputs_.find(id);
    if (it == outputs_.end())
        return false;

    it->second.rotation = rotation;
    it->second.transform = Transform::rotation(rotation);
    LOG_DEBUG("Output {} rotation changed", id);
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Frame loop
// ─────────────────────────────────────────────────────────────────────────────

void Compositor::render_frame(Clock::time_point now)
{
    auto started = Clock::now();
    last_frame_delta_ = last_frame_time_ ? now - *last_frame_time_ : Clock::duration::zero();
    last_frame_time_ = now;

    FrameInfo frame{ frame_count_, now, last_frame_delta_ };
    bool ok = true;
    std::vector<WindowId> drawn;
    std::vector<Rectangle> frame_damage;

    if (backend_)
        ok = backend_->begin_frame(frame);

    for (WindowId id : render_queue_)
    {
        auto& window = windows_.at(id);
        if (!window.renderable())
            continue;

        if (!config_.damage_tracking)
            damage_full(window);

        for (auto const& local : window.damage)
            frame_damage.push_back(damage_policy::to_screen(window.geometry, local));
        drawn.push_back(id);

        if (backend_ && ok)
        {
            double cx = window.geometry.width / 2.0;
            double cy = window.geometry.height / 2.0;
            Transform transform = Transform::translation(cx, cy)
                * Transform::scale(window.effect_scale, window.effect_scale) * Transform::translation(-cx, -cy);

            RenderCommand command;
            command.window = id;
            command.geometry = window.geometry;
            command.z_order = window.z_order;
            command.opacity = window.opacity;
            command.focused = window.focused;
            command.transform = transform;
            command.buffer = window.buffer;
            command.damage = window.damage;
            command.opacity_regions = window.opacity_regions;

            if (!backend_->submit(command))
                ok = false;
        }
    }

    if (backend_ && !backend_->end_frame())
        ok = false;

    // Damage is only consumed by a presented frame; a dropped frame leaves it for the next one
    last_frame_damage_.clear();
    if (ok)
    {
        for (WindowId id : drawn)
        {
            auto& window = windows_.at(id);
            window.damage.clear();
            window.last_frame_time = now;
        }
        last_frame_damage_ = std::move(frame_damage);
    }

    fps_counter_.add_frame(now);
    ++frame_count_;

    auto render_time = Clock::now() - started;
    if (render_time > std::chrono::milliseconds(config_.max_render_time_ms))
    {
        LOG_DEBUG(
            "Frame {} took {}ms (budget {}ms)",
            frame.sequence,
            std::chrono::duration_cast<std::chrono::milliseconds>(render_time).count(),
            config_.max_render_time_ms
        );
    }

    CompositorEvent event;
    if (ok)
    {
        event.type = CompositorEventType::FramePresented;
    }
    else
    {
        ++dropped_frames_;
        event.type = CompositorEventType::FrameDropped;
        LOG_WARN("Frame {} dropped by {} backend", frame.sequence, backend_->name());
    }
    emit_event(event);
}

void Compositor::run()
{
    if (!initialized_)
        initialize();

    running_ = true;
    LOG_INFO("Compositor loop started");
    while (running_)
    {
        auto now = Clock::now();
        if (pre_frame_hook_)
            pre_frame_hook_(now);
        if (!running_)
            break;

        render_frame(now);

        if (config_.frame_interval_ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.frame_interval_ms));
    }
    LOG_INFO("Compositor loop stopped after {} frames ({} dropped)", frame_count_, dropped_frames_);
}

void Compositor::add_event_handler(CompositorEventHandler handler)
{
    if (handler)
        event_handlers_.push_back(std::move(handler));
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

Window const* Compositor::window(WindowId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() ? &it->second : nullptr;
}

std::optional<WindowId> Compositor::topmost_window() const
{
    if (render_queue_.empty())
        return std::nullopt;
    return render_queue_.back();
}

OutputDevice const* Compositor::output(OutputId id) const
{
    auto it = outputs_.find(id);
    return it != outputs_.end() ? &it->second : nullptr;
}

std::optional<OutputId> Compositor::primary_output() const
{
    return output_policy::primary_output(outputs_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

Window* Compositor::find_window(WindowId id)
{
    auto it = windows_.find(id);
    return it != windows_.end() ? &it->second : nullptr;
}

void Compositor::emit_event(CompositorEvent const& event)
{
    LOG_TRACE("Event {} window={} output={}", to_string(event.type), event.window, event.output);

    // Copy: a handler may register another handler
    auto handlers = event_handlers_;
    for (auto const& handler : handlers)
    {
        if (!handler(event))
            break;
    }
}

void Compositor::emit_window_event(CompositorEventType type, WindowId id)
{
    CompositorEvent event;
    event.type = type;
    event.window = id;
    emit_event(event);
}

void Compositor::sync_z_order()
{
    for (size_t i = 0; i < render_queue_.size(); ++i)
        windows_.at(render_queue_[i]).z_order = static_cast<int32_t>(i);
}

void Compositor::damage_full(Window& window)
{
    if (window.geometry.empty())
        return;
    window.damage.assign(1, window.local_bounds());
}

void Compositor::refocus_after_loss(WindowId lost)
{
    auto is_renderable = [this](WindowId id) { return windows_.at(id).renderable(); };
    auto candidate = focus_policy::select_focus_candidate(render_queue_, is_renderable);

    // A minimized window that just lost focus should not get it straight back
    if (candidate && *candidate == lost && !windows_.at(lost).renderable())
    {
        std::vector<WindowId> others;
        std::ranges::copy_if(render_queue_, std::back_inserter(others), [lost](WindowId id) { return id != lost; });
        candidate = focus_policy::select_focus_candidate(others, is_renderable);
    }

    if (!candidate)
    {
        LOG_DEBUG("No window left to focus");
        return;
    }

    windows_.at(*candidate).focused = true;
    active_window_ = candidate;
    LOG_DEBUG("Focus moved to window {}", *candidate);
}

void Compositor::detach_from_parent(Window& window)
{
    if (!window.parent)
        return;
    if (auto* parent = find_window(*window.parent))
        std::erase(parent->children, window.id);
    window.parent.reset();
}

void Compositor::collect_subtree(WindowId id, std::vector<WindowId>& out) const
{
    auto it = windows_.find(id);
    if (it == windows_.end())
        return;
    for (WindowId child : it->second.children)
        collect_subtree(child, out);
    out.push_back(id);
}

Rectangle Compositor::output_area_for(Window const& window) const
{
    Point centre{ window.geometry.x + window.geometry.width / 2.0, window.geometry.y + window.geometry.height / 2.0 };
    auto id = output_policy::output_at(outputs_, centre);
    if (!id)
        id = primary_output();
    return outputs_.at(*id).logical_geometry();
}

void Compositor::check_invariants() const
{
    LUMEN_ASSERT_STACKING(windows_, render_queue_);
    LUMEN_ASSERT_FOCUS(windows_, active_window_);
    LUMEN_ASSERT_HIERARCHY(windows_);
}

} // namespace lumen
