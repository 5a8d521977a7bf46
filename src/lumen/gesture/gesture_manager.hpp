#pragma once

#include "lumen/config/config.hpp"
#include "lumen/gesture/recognizer.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace lumen {

/// Returning false stops the remaining callbacks for that gesture only.
using GestureCallback = std::function<bool(GestureInfo const&)>;

/**
 * @brief Owns the recognizer set and dispatches input events to it.
 *
 * Each event goes through two phases:
 * 1. Every recognizer whose kind is not active sees the event; a Began adds
 *    its kind to the active set.
 * 2. Every kind that was active before the event, and still is, sees the
 *    event; a terminal state removes the kind.
 *
 * Between the phases, each exclusive recognizer that began cancels the other
 * exclusive recognizers tracking the same contact. Kinds that began on the
 * same event never cancel each other; all of them fire, in registration order.
 *
 * Not thread-safe: feed events from one thread.
 */
class GestureManager
{
public:
    GestureManager() = default;

    GestureManager(GestureManager const&) = delete;
    GestureManager& operator=(GestureManager const&) = delete;

    /// Replaces an existing recognizer of the same kind, keeping its position.
    void register_recognizer(std::unique_ptr<GestureRecognizer> recognizer);
    void register_default_recognizers(GestureConfig const& config, Rectangle screen = { 0, 0, 1920, 1080 });

    void add_callback(GestureCallback callback);
    void clear_callbacks() { callbacks_.clear(); }

    /// Run one input event through the recognizers. Returns every gesture emitted, in order.
    std::vector<GestureInfo> process_event(InputEvent const& event);

    void reset_all();
    void set_screen_bounds(Rectangle screen);

    GestureRecognizer* recognizer(GestureKind kind) const;
    size_t recognizer_count() const { return recognizers_.size(); }
    bool has_active_recognizers() const { return !active_.empty(); }
    bool is_active(GestureKind kind) const;
    std::vector<GestureKind> const& active_kinds() const { return active_; }

private:
    std::vector<std::unique_ptr<GestureRecognizer>> recognizers_; // registration order
    std::vector<GestureKind> active_;
    std::vector<GestureCallback> callbacks_;
    Rectangle screen_{ 0, 0, 1920, 1080 };

    void activate(GestureKind kind);
    void deactivate(GestureKind kind);
    void dispatch(GestureInfo const& gesture) const;
};

} // namespace lumen
