#pragma once

#include "lumen/compositor/events.hpp"
#include "lumen/compositor/fps_counter.hpp"
#include "lumen/compositor/render_backend.hpp"
#include "lumen/config/config.hpp"
#include "lumen/core/types.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lumen {

/**
 * @brief Owns windows and outputs, their stacking, and the frame loop.
 *
 * Windows live in an id-indexed arena; the render queue holds ids in
 * back-to-front order, so the last element is the topmost window. Every
 * mutation goes through this class, which keeps z_order in sync with the
 * queue and broadcasts a CompositorEvent.
 *
 * Not thread-safe except for stop(): render_frame() and every mutator must be
 * called from the thread running the loop.
 */
class Compositor
{
public:
    using PreFrameHook = std::function<void(Clock::time_point)>;

    Compositor(CompositorConfig config, std::unique_ptr<RenderBackend> backend);
    ~Compositor();

    Compositor(Compositor const&) = delete;
    Compositor& operator=(Compositor const&) = delete;

    void initialize();
    void shutdown();
    bool initialized() const { return initialized_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Window lifecycle and focus
    // ─────────────────────────────────────────────────────────────────────────
    WindowId add_window(Window window);
    bool remove_window(WindowId id);
    bool set_active_window(WindowId id);

    // ─────────────────────────────────────────────────────────────────────────
    // Window state
    // ─────────────────────────────────────────────────────────────────────────
    bool raise_window(WindowId id);
    bool lower_window(WindowId id);
    bool move_window(WindowId id, int32_t x, int32_t y);
    bool resize_window(WindowId id, uint32_t width, uint32_t height);
    bool minimize_window(WindowId id);
    bool maximize_window(WindowId id);
    bool restore_window(WindowId id);
    bool set_fullscreen(WindowId id, bool enabled);
    bool set_window_opacity(WindowId id, float opacity);
    bool set_window_scale(WindowId id, float scale);
    bool set_window_visible(WindowId id, bool visible);
    bool set_parent(WindowId child, std::optional<WindowId> parent);

    // ─────────────────────────────────────────────────────────────────────────
    // Content and regions (window-local coordinates)
    // ─────────────────────────────────────────────────────────────────────────
    bool submit_buffer(WindowId id, Buffer buffer);
    bool damage_window(WindowId id, Rectangle const& region);
    bool set_input_region(WindowId id, std::vector<Rectangle> regions);
    bool set_opacity_region(WindowId id, Rectangle const& region, float opacity);

    std::optional<WindowId> window_at(Point p) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Outputs
    // ─────────────────────────────────────────────────────────────────────────
    OutputId add_output(OutputDevice output);
    bool remove_output(OutputId id);
    bool set_output_enabled(OutputId id, bool enabled);
    bool set_output_mode(OutputId id, uint32_t width, uint32_t height, double refresh_rate);
    bool set_output_rotation(OutputId id, OutputRotation rotation);

    // ─────────────────────────────────────────────────────────────────────────
    // Frame loop
    // ─────────────────────────────────────────────────────────────────────────
    void render_frame() { render_frame(Clock::now()); }
    void render_frame(Clock::time_point now);
    void run();
    void stop() { running_ = false; }
    bool running() const { return running_; }
    void set_pre_frame_hook(PreFrameHook hook) { pre_frame_hook_ = std::move(hook); }

    void add_event_handler(CompositorEventHandler handler);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────
    Window const* window(WindowId id) const;
    size_t window_count() const { return windows_.size(); }
    std::vector<WindowId> const& render_order() const { return render_queue_; }
    std::optional<WindowId> active_window() const { return active_window_; }
    std::optional<WindowId> topmost_window() const;

    OutputDevice const* output(OutputId id) const;
    std::map<OutputId, OutputDevice> const& outputs() const { return outputs_; }
    std::optional<OutputId> primary_output() const;

    double fps() const { return fps_counter_.fps(); }
    uint64_t frame_count() const { return frame_count_; }
    uint64_t dropped_frame_count() const { return dropped_frames_; }
    Clock::duration last_frame_delta() const { return last_frame_delta_; }
    std::vector<Rectangle> const& last_frame_damage() const { return last_frame_damage_; }
    CompositorConfig const& config() const { return config_; }
    RenderBackend* backend() const { return backend_.get(); }

private:
    CompositorConfig config_;
    std::unique_ptr<RenderBackend> backend_;

    std::unordered_map<WindowId, Window> windows_;
    std::vector<WindowId> render_queue_; // back-to-front, topmost last
    std::optional<WindowId> active_window_;
    WindowId next_window_id_ = 1;

    std::map<OutputId, OutputDevice> outputs_;
    OutputId next_output_id_ = 1;

    std::vector<CompositorEventHandler> event_handlers_;
    PreFrameHook pre_frame_hook_;

    FpsCounter fps_counter_;
    std::optional<Clock::time_point> last_frame_time_;
    Clock::duration last_frame_delta_{};
    uint64_t frame_count_ = 0;
    uint64_t dropped_frames_ = 0;
    std::vector<Rectangle> last_frame_damage_;

    std::atomic<bool> running_ = false;
    bool initialized_ = false;

    Window* find_window(WindowId id);
    void emit_event(CompositorEvent const& event);
    void emit_window_event(CompositorEventType type, WindowId id);
    void sync_z_order();
    void damage_full(Window& window);
    void refocus_after_loss(WindowId lost);
    void detach_from_parent(Window& window);
    void collect_subtree(WindowId id, std::vector<WindowId>& out) const;
    Rectangle output_area_for(Window const& window) const;
    void check_invariants() const;
};

} // namespace lumen
