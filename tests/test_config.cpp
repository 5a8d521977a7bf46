#include "lumen/config/config.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lumen;

namespace {

/// Writes a TOML file into the temp directory and removes it on scope exit.
class TempConfig
{
public:
    explicit TempConfig(std::string const& contents)
    {
        path_ = std::filesystem::temp_directory_path()
            / ("lumen-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter_++) + ".toml");
        std::ofstream out(path_);
        out << contents;
    }

    ~TempConfig()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("Default config has one primary output and sane effect settings", "[config]")
{
    Config cfg = default_config();

    REQUIRE(cfg.outputs.size() == 1);
    REQUIRE(cfg.outputs[0].primary);
    REQUIRE(cfg.outputs[0].width == 1920);
    REQUIRE(cfg.effects.enabled);
    REQUIRE(cfg.effects.effect_limit == 32);
    REQUIRE(cfg.effects.preset == "performance");
    REQUIRE(cfg.backend.type == "headless");
    REQUIRE(cfg.gestures.long_press_delay_ms == 500);
    REQUIRE(cfg.gestures.tap_timeout_ms == 300);
    REQUIRE(cfg.log.level == "info");
}

TEST_CASE("Config file overrides only the keys it names", "[config]")
{
    TempConfig file(R"(
[log]
level = "debug"

[compositor]
fps_window = 30
damage_tracking = false

[gestures]
long_press_delay_ms = 800
swipe_min_distance = 75.5

[effects]
preset = "fancy"
start_scale = 0.5
)");

    auto cfg = load_config(file.path());
    REQUIRE(cfg.has_value());

    REQUIRE(cfg->log.level == "debug");
    REQUIRE(cfg->compositor.fps_window == 30);
    REQUIRE_FALSE(cfg->compositor.damage_tracking);
    REQUIRE(cfg->compositor.max_render_time_ms == 16);

    REQUIRE(cfg->gestures.long_press_delay_ms == 800);
    REQUIRE(cfg->gestures.swipe_min_distance == Catch::Approx(75.5));
    REQUIRE(cfg->gestures.tap_threshold == Catch::Approx(10.0));

    REQUIRE(cfg->effects.preset == "fancy");
    REQUIRE(cfg->effects.start_scale == Catch::Approx(0.5f));
    REQUIRE(cfg->effects.enabled);

    REQUIRE(cfg->outputs.size() == 1);
}

TEST_CASE("Outputs array replaces the default output", "[config]")
{
    TempConfig file(R"(
[backend]
type = "x11"
preview_width = 800

[[outputs]]
name = "DP-1"
width = 2560
height = 1440
scale = 2.0
primary = true

[[outputs]]
name = "HDMI-1"
x = 1280
refresh = 144.0
)");

    auto cfg = load_config(file.path());
    REQUIRE(cfg.has_value());

    REQUIRE(cfg->backend.type == "x11");
    REQUIRE(cfg->backend.preview_width == 800);
    REQUIRE(cfg->backend.preview_height == 720);

    REQUIRE(cfg->outputs.size() == 2);
    REQUIRE(cfg->outputs[0].name == "DP-1");
    REQUIRE(cfg->outputs[0].width == 2560);
    REQUIRE(cfg->outputs[0].scale == Catch::Approx(2.0));
    REQUIRE(cfg->outputs[0].primary);
    REQUIRE(cfg->outputs[1].name == "HDMI-1");
    REQUIRE(cfg->outputs[1].x == 1280);
    REQUIRE(cfg->outputs[1].refresh == Catch::Approx(144.0));
    REQUIRE_FALSE(cfg->outputs[1].primary);
}

TEST_CASE("Negative values for unsigned settings are ignored", "[config]")
{
    TempConfig file(R"(
[effects]
effect_limit = -4
)");

    auto cfg = load_config(file.path());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->effects.effect_limit == 32);
}

TEST_CASE("Malformed config returns nullopt", "[config]")
{
    TempConfig file("[compositor\nfps_window = ");
    REQUIRE_FALSE(load_config(file.path()).has_value());
}

TEST_CASE("Missing config file returns nullopt", "[config]")
{
    REQUIRE_FALSE(load_config("/nonexistent/lumen/config.toml").has_value());
}
