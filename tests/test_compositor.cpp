#include "lumen/compositor/compositor.hpp"
#include "lumen/compositor/headless_backend.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace lumen;

namespace {

struct Fixture
{
    HeadlessBackend* backend = nullptr;
    Compositor compositor;
    std::vector<CompositorEvent> events;

    Fixture()
        : compositor(CompositorConfig{}, make_backend())
    {
        compositor.initialize();
        compositor.add_event_handler(
            [this](CompositorEvent const& event)
            {
                events.push_back(event);
                return true;
            }
        );
    }

    std::unique_ptr<RenderBackend> make_backend()
    {
        auto headless = std::make_unique<HeadlessBackend>();
        backend = headless.get();
        return headless;
    }

    WindowId add(Rectangle geometry, std::string title = "")
    {
        Window window;
        window.title = std::move(title);
        window.geometry = geometry;
        return compositor.add_window(std::move(window));
    }

    size_t count(CompositorEventType type) const
    {
        return static_cast<size_t>(
            std::ranges::count_if(events, [type](CompositorEvent const& e) { return e.type == type; })
        );
    }
};

} // namespace

TEST_CASE("Added windows go on top of the render queue", "[compositor][stacking]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 100, 100 });
    WindowId b = f.add({ 50, 50, 100, 100 });

    REQUIRE(f.compositor.window_count() == 2);
    REQUIRE(f.compositor.render_order() == std::vector<WindowId>{ a, b });
    REQUIRE(f.compositor.window(a)->z_order == 0);
    REQUIRE(f.compositor.window(b)->z_order == 1);
    REQUIRE(f.compositor.topmost_window() == b);
    REQUIRE(f.count(CompositorEventType::WindowCreated) == 2);
}

TEST_CASE("add_window assigns a fresh id when the given one is zero or taken", "[compositor]")
{
    Fixture f;
    Window window;
    window.id = 7;
    window.geometry = { 0, 0, 10, 10 };

    WindowId first = f.compositor.add_window(window);
    WindowId second = f.compositor.add_window(window);
    WindowId third = f.add({ 0, 0, 10, 10 });

    REQUIRE(first == 7);
    REQUIRE(second != 7);
    REQUIRE(second != NO_WINDOW);
    REQUIRE(third != first);
    REQUIRE(third != second);
}

TEST_CASE("New windows start fully damaged", "[compositor][damage]")
{
    Fixture f;
    WindowId id = f.add({ 10, 20, 100, 50 });

    auto const* window = f.compositor.window(id);
    REQUIRE(window->damage.size() == 1);
    REQUIRE(window->damage[0] == Rectangle{ 0, 0, 100, 50 });
}

TEST_CASE("Removing the focused window moves focus to the topmost visible window", "[compositor][focus]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 100, 100 });
    WindowId b = f.add({ 0, 0, 100, 100 });
    WindowId c = f.add({ 0, 0, 100, 100 });

    f.compositor.minimize_window(b);
    REQUIRE(f.compositor.set_active_window(c));
    f.events.clear();

    REQUIRE(f.compositor.remove_window(c));
    REQUIRE(f.compositor.active_window() == a);
    REQUIRE(f.compositor.window(a)->focused);
    REQUIRE_FALSE(f.compositor.window(b)->focused);

    REQUIRE(f.events.size() == 2);
    REQUIRE(f.events[0].type == CompositorEventType::WindowDestroyed);
    REQUIRE(f.events[0].window == c);
    REQUIRE(f.events[1].type == CompositorEventType::WindowFocused);
    REQUIRE(f.events[1].window == a);
}

TEST_CASE("Focus falls back to the queue tail when nothing is renderable", "[compositor][focus]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 100, 100 });
    WindowId b = f.add({ 0, 0, 100, 100 });
    WindowId c = f.add({ 0, 0, 100, 100 });

    f.compositor.minimize_window(a);
    f.compositor.minimize_window(b);
    f.compositor.set_active_window(c);
    f.compositor.remove_window(c);

    REQUIRE(f.compositor.active_window() == b);
}

TEST_CASE("Removing the last window leaves nothing focused", "[compositor][focus]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 100, 100 });
    f.compositor.set_active_window(a);
    f.compositor.remove_window(a);

    REQUIRE_FALSE(f.compositor.active_window().has_value());
    REQUIRE(f.compositor.window_count() == 0);
    REQUIRE(f.compositor.render_order().empty());
}

TEST_CASE("Operations on unknown windows fail without side effects", "[compositor]")
{
    Fixture f;
    f.add({ 0, 0, 100, 100 });
    f.events.clear();

    REQUIRE_FALSE(f.compositor.remove_window(999));
    REQUIRE_FALSE(f.compositor.set_active_window(999));
    REQUIRE_FALSE(f.compositor.raise_window(999));
    REQUIRE_FALSE(f.compositor.move_window(999, 1, 1));
    REQUIRE_FALSE(f.compositor.set_window_opacity(999, 0.5f));
    REQUIRE_FALSE(f.compositor.damage_window(999, { 0, 0, 1, 1 }));
    REQUIRE(f.events.empty());
    REQUIRE(f.compositor.window_count() == 1);
}

TEST_CASE("Only one window is focused at a time", "[compositor][focus]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 100, 100 });
    WindowId b = f.add({ 0, 0, 100, 100 });

    f.compositor.set_active_window(a);
    f.compositor.set_active_window(b);

    REQUIRE_FALSE(f.compositor.window(a)->focused);
    REQUIRE(f.compositor.window(b)->focused);
    REQUIRE(f.compositor.active_window() == b);
}

TEST_CASE("Raise and lower keep z_order equal to the queue index", "[compositor][stacking]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 10, 10 });
    WindowId b = f.add({ 0, 0, 10, 10 });
    WindowId c = f.add({ 0, 0, 10, 10 });

    REQUIRE(f.compositor.raise_window(a));
    REQUIRE(f.compositor.render_order() == std::vector<WindowId>{ b, c, a });

    REQUIRE(f.compositor.lower_window(c));
    REQUIRE(f.compositor.render_order() == std::vector<WindowId>{ c, b, a });

    auto const& order = f.compositor.render_order();
    for (size_t i = 0; i < order.size(); ++i)
        REQUIRE(f.compositor.window(order[i])->z_order == static_cast<int32_t>(i));
}

TEST_CASE("Removing a parent removes its children first", "[compositor][hierarchy]")
{
    Fixture f;
    WindowId parent = f.add({ 0, 0, 100, 100 });

    Window child;
    child.geometry = { 10, 10, 20, 20 };
    child.parent = parent;
    WindowId child_id = f.compositor.add_window(child);

    Window grandchild;
    grandchild.geometry = { 12, 12, 5, 5 };
    grandchild.parent = child_id;
    WindowId grandchild_id = f.compositor.add_window(grandchild);

    REQUIRE(f.compositor.window(parent)->children == std::vector<WindowId>{ child_id });
    f.events.clear();

    REQUIRE(f.compositor.remove_window(parent));
    REQUIRE(f.compositor.window_count() == 0);

    REQUIRE(f.events.size() == 3);
    REQUIRE(f.events[0].window == grandchild_id);
    REQUIRE(f.events[1].window == child_id);
    REQUIRE(f.events[2].window == parent);
}

TEST_CASE("Removing a child detaches it from its parent", "[compositor][hierarchy]")
{
    Fixture f;
    WindowId parent = f.add({ 0, 0, 100, 100 });
    Window child;
    child.geometry = { 0, 0, 10, 10 };
    child.parent = parent;
    WindowId child_id = f.compositor.add_window(child);

    f.compositor.remove_window(child_id);
    REQUIRE(f.compositor.window(parent)->children.empty());
}

TEST_CASE("Unknown parents are dropped on add", "[compositor][hierarchy]")
{
    Fixture f;
    Window orphan;
    orphan.geometry = { 0, 0, 10, 10 };
    orphan.parent = 4242;
    WindowId id = f.compositor.add_window(orphan);

    REQUIRE_FALSE(f.compositor.window(id)->parent.has_value());
}

TEST_CASE("set_parent refuses self-parenting and cycles", "[compositor][hierarchy]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 10, 10 });
    WindowId b = f.add({ 0, 0, 10, 10 });

    REQUIRE_FALSE(f.compositor.set_parent(a, a));
    REQUIRE(f.compositor.set_parent(b, a));
    REQUIRE_FALSE(f.compositor.set_parent(a, b));

    REQUIRE(f.compositor.set_parent(b, std::nullopt));
    REQUIRE(f.compositor.window(a)->children.empty());
    REQUIRE(f.compositor.set_parent(a, b));
    REQUIRE(f.compositor.window(a)->parent == b);
}

TEST_CASE("Damage is clipped to the window surface", "[compositor][damage]")
{
    Fixture f;
    WindowId id = f.add({ 100, 100, 50, 50 });
    f.compositor.render_frame();

    REQUIRE(f.compositor.damage_window(id, { 40, 40, 20, 20 }));
    REQUIRE(f.compositor.window(id)->damage == std::vector<Rectangle>{ { 40, 40, 10, 10 } });

    // Entirely outside: accepted but discarded
    REQUIRE(f.compositor.damage_window(id, { 60, 60, 5, 5 }));
    REQUIRE(f.compositor.window(id)->damage.size() == 1);
}

TEST_CASE("A frame reports screen-space damage and clears it", "[compositor][frame]")
{
    Fixture f;
    WindowId id = f.add({ 100, 200, 50, 50 });
    f.compositor.render_frame();
    REQUIRE(f.compositor.last_frame_damage() == std::vector<Rectangle>{ { 100, 200, 50, 50 } });
    REQUIRE(f.compositor.window(id)->damage.empty());

    f.compositor.damage_window(id, { 5, 5, 10, 10 });
    f.compositor.render_frame();
    REQUIRE(f.compositor.last_frame_damage() == std::vector<Rectangle>{ { 105, 205, 10, 10 } });

    f.compositor.render_frame();
    REQUIRE(f.compositor.last_frame_damage().empty());
}

TEST_CASE("Hidden and minimized windows are not submitted", "[compositor][frame]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 10, 10 });
    WindowId b = f.add({ 0, 0, 10, 10 });
    WindowId c = f.add({ 0, 0, 10, 10 });

    f.compositor.set_window_visible(a, false);
    f.compositor.minimize_window(b);
    f.compositor.render_frame();

    auto const& submitted = f.backend->last_frame();
    REQUIRE(submitted.size() == 1);
    REQUIRE(submitted[0].window == c);
    REQUIRE(submitted[0].z_order == 2);
}

TEST_CASE("Windows are submitted back to front", "[compositor][frame]")
{
    Fixture f;
    WindowId a = f.add({ 0, 0, 10, 10 });
    WindowId b = f.add({ 0, 0, 10, 10 });
    f.compositor.raise_window(a);
    f.compositor.render_frame();

    auto const& submitted = f.backend->last_frame();
    REQUIRE(submitted.size() == 2);
    REQUIRE(submitted[0].window == b);
    REQUIRE(submitted[1].window == a);
}

TEST_CASE("Backend failure turns the frame into a dropped frame", "[compositor][frame]")
{
    Fixture f;
    f.add({ 0, 0, 10, 10 });
    f.backend->fail_next_frames(1);

    f.compositor.render_frame();
    f.compositor.render_frame();

    REQUIRE(f.compositor.frame_count() == 2);
    REQUIRE(f.compositor.dropped_frame_count() == 1);
    REQUIRE(f.count(CompositorEventType::FrameDropped) == 1);
    REQUIRE(f.count(CompositorEventType::FramePresented) == 1);
    REQUIRE(f.backend->frames_completed() == 1);
}

TEST_CASE("Damage survives a dropped frame", "[compositor][frame][damage]")
{
    Fixture f;
    WindowId id = f.add({ 0, 0, 100, 100 });
    f.compositor.render_frame();

    f.compositor.damage_window(id, { 10, 10, 5, 5 });
    f.backend->fail_next_frames(1);
    f.compositor.render_frame();

    REQUIRE(f.count(CompositorEventType::FrameDropped) == 1);
    REQUIRE(f.compositor.last_frame_damage().empty());
    REQUIRE(f.compositor.window(id)->damage == std::vector<Rectangle>{ { 10, 10, 5, 5 } });

    f.compositor.render_frame();
    REQUIRE(f.backend->last_frame()[0].damage_count == 1);
    REQUIRE(f.compositor.last_frame_damage() == std::vector<Rectangle>{ { 10, 10, 5, 5 } });
    REQUIRE(f.compositor.window(id)->damage.empty());
}

TEST_CASE("Compositor without a backend always presents", "[compositor][frame]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    compositor.initialize();
    Window window;
    window.geometry = { 0, 0, 10, 10 };
    compositor.add_window(window);

    compositor.render_frame();
    REQUIRE(compositor.frame_count() == 1);
    REQUIRE(compositor.dropped_frame_count() == 0);
}

TEST_CASE("FPS is measured from frame timestamps", "[compositor][frame]")
{
    Fixture f;
    auto t0 = Clock::time_point{} + std::chrono::seconds(10);

    f.compositor.render_frame(t0);
    REQUIRE(f.compositor.fps() == 0.0);

    for (int i = 1; i <= 10; ++i)
        f.compositor.render_frame(t0 + std::chrono::milliseconds(10 * i));

    REQUIRE(f.compositor.fps() == Catch::Approx(100.0));
    REQUIRE(f.compositor.last_frame_delta() == std::chrono::milliseconds(10));
}

TEST_CASE("FPS is zero when all frames share a timestamp", "[compositor][frame]")
{
    Fixture f;
    auto t0 = Clock::time_point{} + std::chrono::seconds(1);
    f.compositor.render_frame(t0);
    f.compositor.render_frame(t0);
    REQUIRE(f.compositor.fps() == 0.0);
}

TEST_CASE("Event handlers can veto propagation", "[compositor][events]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    int first = 0;
    int second = 0;
    compositor.add_event_handler(
        [&](CompositorEvent const&)
        {
            ++first;
            return false;
        }
    );
    compositor.add_event_handler(
        [&](CompositorEvent const&)
        {
            ++second;
            return true;
        }
    );

    Window window;
    window.geometry = { 0, 0, 10, 10 };
    compositor.add_window(window);

    REQUIRE(first == 1);
    REQUIRE(second == 0);
}

TEST_CASE("Opacity is clamped and reported", "[compositor]")
{
    Fixture f;
    WindowId id = f.add({ 0, 0, 10, 10 });

    REQUIRE(f.compositor.set_window_opacity(id, 1.5f));
    REQUIRE(f.compositor.window(id)->opacity == 1.0f);
    REQUIRE(f.compositor.set_window_opacity(id, -2.0f));
    REQUIRE(f.compositor.window(id)->opacity == 0.0f);

    REQUIRE(f.events.back().type == CompositorEventType::WindowOpacityChanged);
    REQUIRE(f.events.back().opacity == 0.0f);
}

TEST_CASE("Move and resize respect window capabilities", "[compositor]")
{
    Fixture f;
    Window fixed;
    fixed.geometry = { 0, 0, 10, 10 };
    fixed.movable = false;
    fixed.resizable = false;
    WindowId id = f.compositor.add_window(fixed);
    WindowId other = f.add({ 0, 0, 10, 10 });

    REQUIRE_FALSE(f.compositor.move_window(id, 5, 5));
    REQUIRE_FALSE(f.compositor.resize_window(id, 20, 20));
    REQUIRE(f.compositor.window(id)->geometry == Rectangle{ 0, 0, 10, 10 });

    REQUIRE(f.compositor.move_window(other, 5, 6));
    REQUIRE(f.compositor.resize_window(other, 0, 30));
    REQUIRE(f.compositor.window(other)->geometry == Rectangle{ 5, 6, 1, 30 });
}

TEST_CASE("Hit testing walks from the top and honors input regions", "[compositor][input]")
{
    Fixture f;
    WindowId bottom = f.add({ 0, 0, 200, 200 });
    WindowId top = f.add({ 50, 50, 100, 100 });

    REQUIRE(f.compositor.window_at({ 60, 60 }) == top);
    REQUIRE(f.compositor.window_at({ 10, 10 }) == bottom);
    REQUIRE_FALSE(f.compositor.window_at({ 500, 500 }).has_value());

    // Only the top-left quarter of `top` accepts input
    f.compositor.set_input_region(top, { { 0, 0, 50, 50 } });
    REQUIRE(f.compositor.window_at({ 60, 60 }) == top);
    REQUIRE(f.compositor.window_at({ 140, 140 }) == bottom);

    f.compositor.minimize_window(top);
    REQUIRE(f.compositor.window_at({ 60, 60 }) == bottom);
}

TEST_CASE("Invalid buffers are rejected", "[compositor][buffer]")
{
    Fixture f;
    WindowId id = f.add({ 0, 0, 10, 10 });

    Buffer bad;
    REQUIRE_FALSE(f.compositor.submit_buffer(id, bad));
    REQUIRE(f.compositor.window(id)->buffer == nullptr);

    Buffer good;
    good.width = 10;
    good.height = 10;
    good.stride = 40;
    REQUIRE(f.compositor.submit_buffer(id, good));
    REQUIRE(f.compositor.window(id)->buffer != nullptr);
    REQUIRE(f.compositor.window(id)->buffer->width == 10);
}

TEST_CASE("Opacity regions are clipped and updated in place", "[compositor][regions]")
{
    Fixture f;
    WindowId id = f.add({ 0, 0, 100, 100 });

    REQUIRE(f.compositor.set_opacity_region(id, { 90, 90, 20, 20 }, 0.5f));
    REQUIRE(f.compositor.set_opacity_region(id, { 90, 90, 10, 10 }, 2.0f));
    REQUIRE_FALSE(f.compositor.set_opacity_region(id, { 200, 200, 10, 10 }, 0.5f));

    auto const& regions = f.compositor.window(id)->opacity_regions;
    REQUIRE(regions.size() == 1);
    REQUIRE(regions[0].region == Rectangle{ 90, 90, 10, 10 });
    REQUIRE(regions[0].opacity == 1.0f);
}

TEST_CASE("Damage tracking off repaints every window each frame", "[compositor][damage]")
{
    CompositorConfig config;
    config.damage_tracking = false;
    auto backend = std::make_unique<HeadlessBackend>();
    auto* headless = backend.get();
    Compositor compositor(config, std::move(backend));
    compositor.initialize();

    Window window;
    window.geometry = { 0, 0, 10, 10 };
    compositor.add_window(window);

    compositor.render_frame();
    compositor.render_frame();
    REQUIRE(compositor.last_frame_damage() == std::vector<Rectangle>{ { 0, 0, 10, 10 } });
    REQUIRE(headless->last_frame()[0].damage_count == 1);
}
