#pragma once

#include "lumen/gesture/recognizer.hpp"
#include <vector>

namespace lumen {

// ─────────────────────────────────────────────────────────────────────────────
// Single-contact recognizers
// ─────────────────────────────────────────────────────────────────────────────

/// Press and release close together in space and time. Emits a single Ended.
class TapRecognizer : public GestureRecognizer
{
public:
    TapRecognizer(double threshold = 10.0, uint32_t timeout_ms = 300);

    GestureKind kind() const override { return GestureKind::Tap; }
    std::string_view name() const override { return "tap"; }
    std::optional<GestureInfo> update(InputEvent const& event) override;
    void reset() override { press_.clear(); }
    bool is_tracking() const override { return press_.active; }
    std::vector<Contact> contacts() const override { return press_.contacts(); }
    std::optional<GestureInfo> cancel(uint64_t timestamp_ms) override;

private:
    double threshold_;
    uint32_t timeout_ms_;
    PressState press_;
};

/// Two taps in quick succession near the same spot. Emits a single Ended with touch_count 2.
class DoubleTapRecognizer : public GestureRecognizer
{
public:
    DoubleTapRecognizer(
        double tap_threshold = 10.0,
        uint32_t tap_timeout_ms = 300,
        uint32_t interval_ms = 300,
        double max_distance = 30.0
    );

    GestureKind kind() const override { return GestureKind::DoubleTap; }
    std::string_view name() const override { return "double-tap"; }
    std::optional<GestureInfo> update(InputEvent const& event) override;
    void reset() override;
    bool is_tracking() const override { return press_.active || first_tap_.has_value(); }
    std::vector<Contact> contacts() const override { return press_.contacts(); }
    std::optional<GestureInfo> cancel(uint64_t timestamp_ms) override;

private:
    struct CompletedTap
    {
        Point position;
        uint64_t release_ms = 0;
    };

    double tap_threshold_;
    uint32_t tap_timeout_ms_;
    uint32_t interval_ms_;
    double max_distance_;
    PressState press_;
    std::optional<CompletedTap> first_tap_;

    void expire_first_tap(uint64_t now_ms);
};

/**
 * @brief Press held in place beyond a delay.
 *
 * Emits Began once the delay has elapsed, then Changed at most once per
 * feedback interval while held, then Ended on release. Moving beyond the
 * threshold before recognition abandons the press without any emission.
 * Idle ticks are evaluated at the last known position, so a stationary press
 * is recognized without any motion events.
 */
class LongPressRecognizer : public GestureRecognizer
{
public:
    LongPressRecognizer(double threshold = 15.0, uint32_t delay_ms = 500, uint32_t feedback_ms = 100);

    GestureKind kind() const override { return GestureKind::LongPress; }
    std::string_view name() const override { return "long-press"; }
    std::optional<GestureInfo> update(InputEvent const& event) override;
    void reset() override;
    bool is_tracking() const override { return press_.active; }
    std::vector<Contact> contacts() const override { return press_.contacts(); }
    std::optional<GestureInfo> cancel(uint64_t timestamp_ms) override;

    bool recognized() const { return recognized_; }

private:
    double threshold_;
    uint32_t delay_ms_;
    uint32_t feedback_ms_;
    PressState press_;
    bool recognized_ = false;
    uint64_t last_feedback_ms_ = 0;

    std::optional<GestureInfo> check(uint64_t timestamp_ms);
};

/// Fast directional drag. Direction is one of eight 45-degree sectors.
class SwipeRecognizer : public GestureRecognizer
{
public:
    SwipeRecognizer(double min_distance = 50.0, uint32_t max_time_ms = 500);

    GestureKind kind() const override { return GestureKind::Swipe; }
    std::string_view name() const override { return "swipe"; }
    std::optional<GestureInfo> update(InputEvent const& event) override;
    void reset() override;
    bool is_tracking() const override { return press_.active; }
    std::vector<Contact> contacts() const override { return press_.contacts(); }
    std::optional<GestureInfo> cancel(uint64_t timestamp_ms) override;

    static SwipeDirection direction_of(Point delta);

private:
    double min_distance_;
    uint32_t max_time_ms_;
    PressState press_;
    bool recognized_ = false;

    GestureInfo make(GestureState state, uint64_t timestamp_ms) const;
};

/// Drag that starts next to a screen edge and moves inward.
class EdgeSwipeRecognizer : public GestureRecognizer
{
public:
    EdgeSwipeRecognizer(
        Rectangle screen = { 0, 0, 1920, 1080 },
        double edge_threshold = 20.0,
        double min_distance = 50.0
    );

    GestureKind kind() const override { return GestureKind::EdgeSwipe; }
    std::string_view name() const override { return "edge-swipe"; }
    std::optional<GestureInfo> update(InputEvent const& event) override;
    void reset() override;
    bool is_tracking() const override { return press_.active; }
    std::vector<Contact> contacts() const override { return press_.contacts(); }
    std::optional<GestureInfo> cancel(uint64_t timestamp_ms) override;

    void set_screen_bounds(Rectangle screen) { screen_ = screen; }
    Rectangle screen_bounds() const { return screen_; }

    /// Nearest edge within the threshold, if any.
    std::optional<ScreenEdge> edge_at(Point p) const;

private:
    Rectangle screen_;
    double edge_threshold_;
    double min_distance_;
    PressState press_;
    ScreenEdge edge_ = ScreenEdge::Left;
    bool recognized_ = false;

    double inward_distance() const;
    GestureInfo make(GestureState state, uint64_t timestamp_ms) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Two-finger recognizers
// ─────────────────────────────────────────────────────────────────────────────

/// Positions of the (at most two) touches a two-finger recognizer follows.
struct TouchPair
{
    struct Touch
    {
        uint32_t id = 0;
        Point position;
    };

    std::vector<Touch> touches;
    std::optional<WindowId> target;
    std::string source_device;
    uint32_t modifiers = 0;
    uint64_t start_ms = 0;

    bool complete() const { return touches.size() == 2; }
    bool contains(uint32_t id) const;
    std::vector<Contact> contacts() const;
    Touch* find(uint32_t id);
    bool remove(uint32_t id);
    double span() const;
    double angle() const;
    Point centroid() const;
};

/// Two touches moving apart or together. Cooperative with other recognizers.
class PinchRecognizer : public GestureRecognizer
{
public:
    PinchRecognizer(double min_distance = 20.0, double min_scale_change = 0.05);

    GestureKind kind() const override { return GestureKind::Pinch; }
    std::string_view name() const override { return "pinch"; }
    std::optional<GestureInfo> update(InputEvent const& event) override;
    void reset() override;
    bool is_tracking() const override { return !pair_.touches.empty(); }
    std::vector<Contact> contacts() const override { return pair_.contacts(); }
    bool is_exclusive() const override { return false; }
    std::optional<GestureInfo> cancel(uint64_t timestamp_ms) override;

private:
    double min_distance_;
    double min_scale_change_;
    TouchPair pair_;
    double initial_span_ = 0.0;
    double scale_ = 1.0;
    double last_emitted_scale_ = 1.0;
    bool recognized_ = false;

    void rebase();
    GestureInfo make(GestureState state, uint64_t timestamp_ms) const;
};

/// Two touches turning about their centroid. Cooperative with other recognizers.
class RotateRecognizer : public GestureRecognizer
{
public:
    explicit RotateRecognizer(double min_angle = 0.05);

    GestureKind kind() const override { return GestureKind::Rotate; }
    std::string_view name() const override { return "rotate"; }
    std::optional<GestureInfo> update(InputEvent const& event) override;
    void reset() override;
    bool is_tracking() const override { return !pair_.touches.empty(); }
    std::vector<Contact> contacts() const override { return pair_.contacts(); }
    bool is_exclusive() const override { return false; }
    std::optional<GestureInfo> cancel(uint64_t timestamp_ms) override;

    /// Wrap an angle into (-pi, pi].
    static double normalize_angle(double radians);

private:
    double min_angle_;
    TouchPair pair_;
    double last_angle_ = 0.0;
    double rotation_ = 0.0;
    double last_emitted_rotation_ = 0.0;
    bool recognized_ = false;

    void rebase();
    GestureInfo make(GestureState state, uint64_t timestamp_ms) const;
};

} // namespace lumen
