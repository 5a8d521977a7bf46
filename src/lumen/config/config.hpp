#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

struct CompositorConfig
{
    uint32_t max_render_time_ms = 16;
    size_t fps_window = 100;       // Frame timestamps kept for the FPS estimate
    uint32_t frame_interval_ms = 1; // Advisory sleep between frames in run()
    bool damage_tracking = true;
};

struct GestureConfig
{
    double tap_threshold = 10.0;
    uint32_t tap_timeout_ms = 300;
    uint32_t double_tap_interval_ms = 300;
    double double_tap_distance = 30.0;

    double long_press_threshold = 15.0;
    uint32_t long_press_delay_ms = 500;
    uint32_t long_press_feedback_ms = 100;

    double swipe_min_distance = 50.0;
    uint32_t swipe_max_time_ms = 500;

    double pinch_min_distance = 20.0;
    double pinch_min_scale_change = 0.05;

    double rotate_min_angle = 0.05; // radians

    double edge_threshold = 20.0;
    double edge_min_distance = 50.0;
};

struct EffectsConfig
{
    bool enabled = true;
    size_t effect_limit = 32;
    uint32_t default_duration_ms = 250;
    std::string preset = "performance";
    float start_scale = 0.8f;
};

struct BackendConfig
{
    std::string type = "headless"; // "headless" or "x11"
    uint16_t preview_width = 1280;
    uint16_t preview_height = 720;
};

struct OutputConfig
{
    std::string name;
    uint32_t width = 1920;
    uint32_t height = 1080;
    double refresh = 60.0;
    double scale = 1.0;
    int32_t x = 0;
    int32_t y = 0;
    bool primary = false;
};

struct LogConfig
{
    std::string level = "info"; // spdlog level name
};

struct Config
{
    LogConfig log;
    CompositorConfig compositor;
    GestureConfig gestures;
    EffectsConfig effects;
    BackendConfig backend;
    std::vector<OutputConfig> outputs;
};

std::optional<Config> load_config(std::string const& path);
Config default_config();

} // namespace lumen
