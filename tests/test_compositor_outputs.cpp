#include "lumen/compositor/compositor.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace lumen;

namespace {

OutputDevice make_output(std::string name, int32_t x, uint32_t width, uint32_t height, double scale = 1.0)
{
    OutputDevice output;
    output.name = std::move(name);
    output.x = x;
    output.width = width;
    output.height = height;
    output.scale_factor = scale;
    return output;
}

WindowId add_window(Compositor& compositor, Rectangle geometry)
{
    Window window;
    window.geometry = geometry;
    return compositor.add_window(window);
}

} // namespace

TEST_CASE("The first output becomes primary", "[compositor][outputs]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    OutputId first = compositor.add_output(make_output("A", 0, 1920, 1080));
    OutputId second = compositor.add_output(make_output("B", 1920, 1920, 1080));

    REQUIRE(first != second);
    REQUIRE(compositor.primary_output() == first);
    REQUIRE(compositor.output(first)->primary);
    REQUIRE_FALSE(compositor.output(second)->primary);
}

TEST_CASE("Only one output stays primary", "[compositor][outputs]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    compositor.add_output(make_output("A", 0, 1920, 1080));

    OutputDevice claims_primary = make_output("B", 1920, 1920, 1080);
    claims_primary.primary = true;
    OutputId second = compositor.add_output(claims_primary);

    REQUIRE_FALSE(compositor.output(second)->primary);
}

TEST_CASE("Removing the primary output promotes the lowest remaining id", "[compositor][outputs]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    std::vector<CompositorEventType> seen;
    compositor.add_event_handler(
        [&](CompositorEvent const& event)
        {
            seen.push_back(event.type);
            return true;
        }
    );

    OutputId a = compositor.add_output(make_output("A", 0, 1920, 1080));
    OutputId b = compositor.add_output(make_output("B", 1920, 1920, 1080));
    OutputId c = compositor.add_output(make_output("C", 3840, 1920, 1080));

    REQUIRE(compositor.remove_output(a));
    REQUIRE(compositor.primary_output() == b);
    REQUIRE_FALSE(compositor.output(c)->primary);
    REQUIRE_FALSE(compositor.remove_output(a));

    REQUIRE(seen.back() == CompositorEventType::OutputRemoved);
}

TEST_CASE("Output mode changes validate their arguments", "[compositor][outputs]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    OutputId id = compositor.add_output(make_output("A", 0, 1920, 1080));

    REQUIRE_FALSE(compositor.set_output_mode(id, 0, 1080, 60.0));
    REQUIRE_FALSE(compositor.set_output_mode(id, 1920, 1080, 0.0));
    REQUIRE_FALSE(compositor.set_output_mode(99, 1920, 1080, 60.0));

    REQUIRE(compositor.set_output_mode(id, 2560, 1440, 144.0));
    REQUIRE(compositor.output(id)->width == 2560);
    REQUIRE(compositor.output(id)->refresh_rate == 144.0);
}

TEST_CASE("Output rotation updates the output transform", "[compositor][outputs]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    OutputId id = compositor.add_output(make_output("A", 0, 1920, 1080));

    REQUIRE(compositor.output(id)->transform.is_identity());
    REQUIRE(compositor.set_output_rotation(id, OutputRotation::Rotate90));
    REQUIRE(compositor.output(id)->transform == Transform::rotation(OutputRotation::Rotate90));
    REQUIRE(compositor.output(id)->logical_geometry() == Rectangle{ 0, 0, 1080, 1920 });
}

TEST_CASE("Maximize fills the primary output and restore brings the geometry back", "[compositor][state]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    compositor.add_output(make_output("A", 0, 3840, 2160, 2.0));
    WindowId id = add_window(compositor, { 100, 100, 300, 200 });

    REQUIRE(compositor.maximize_window(id));
    REQUIRE(compositor.window(id)->maximized);
    REQUIRE(compositor.window(id)->geometry == Rectangle{ 0, 0, 1920, 1080 });

    REQUIRE(compositor.restore_window(id));
    REQUIRE_FALSE(compositor.window(id)->maximized);
    REQUIRE(compositor.window(id)->geometry == Rectangle{ 100, 100, 300, 200 });
}

TEST_CASE("Maximize without outputs fails", "[compositor][state]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    WindowId id = add_window(compositor, { 0, 0, 10, 10 });

    REQUIRE_FALSE(compositor.maximize_window(id));
    REQUIRE_FALSE(compositor.window(id)->maximized);
}

TEST_CASE("Fullscreen uses the output under the window centre", "[compositor][state]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    compositor.add_output(make_output("A", 0, 1920, 1080));
    compositor.add_output(make_output("B", 1920, 2560, 1440));
    WindowId id = add_window(compositor, { 2000, 100, 400, 300 });

    REQUIRE(compositor.set_fullscreen(id, true));
    REQUIRE(compositor.window(id)->fullscreen);
    REQUIRE(compositor.window(id)->geometry == Rectangle{ 1920, 0, 2560, 1440 });

    REQUIRE(compositor.set_fullscreen(id, false));
    REQUIRE(compositor.window(id)->geometry == Rectangle{ 2000, 100, 400, 300 });
}

TEST_CASE("Leaving fullscreen keeps a maximized window maximized", "[compositor][state]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    compositor.add_output(make_output("A", 0, 1920, 1080));
    WindowId id = add_window(compositor, { 10, 10, 100, 100 });

    compositor.maximize_window(id);
    compositor.set_fullscreen(id, true);
    compositor.set_fullscreen(id, false);

    REQUIRE(compositor.window(id)->maximized);
    REQUIRE(compositor.window(id)->geometry == Rectangle{ 0, 0, 1920, 1080 });

    compositor.restore_window(id);
    REQUIRE(compositor.window(id)->geometry == Rectangle{ 10, 10, 100, 100 });
}

TEST_CASE("Minimizing the focused window hands focus on", "[compositor][state]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    WindowId a = add_window(compositor, { 0, 0, 10, 10 });
    WindowId b = add_window(compositor, { 0, 0, 10, 10 });

    compositor.set_active_window(b);
    REQUIRE(compositor.minimize_window(b));
    REQUIRE(compositor.active_window() == a);
    REQUIRE_FALSE(compositor.window(b)->focused);

    REQUIRE(compositor.restore_window(b));
    REQUIRE_FALSE(compositor.window(b)->minimized);
    REQUIRE(compositor.active_window() == a);
}

TEST_CASE("Minimizing the only window leaves nothing focused", "[compositor][state]")
{
    Compositor compositor(CompositorConfig{}, nullptr);
    WindowId a = add_window(compositor, { 0, 0, 10, 10 });

    compositor.set_active_window(a);
    compositor.minimize_window(a);
    REQUIRE_FALSE(compositor.active_window().has_value());
    REQUIRE_FALSE(compositor.window(a)->focused);
}
