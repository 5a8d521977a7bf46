#include "config.hpp"
#include "lumen/core/log.hpp"
#include <toml++/toml.hpp>

namespace lumen {

namespace {

template <typename T>
void read_uint(toml::table const& tbl, char const* key, T& out)
{
    if (auto v = tbl[key].value<int64_t>())
    {
        if (*v >= 0)
            out = static_cast<T>(*v);
        else
            LOG_WARN("Config: ignoring negative value {} for '{}'", *v, key);
    }
}

void read_double(toml::table const& tbl, char const* key, double& out)
{
    if (auto v = tbl[key].value<double>())
        out = *v;
}

} // namespace

Config default_config()
{
    Config cfg;

    cfg.compositor.max_render_time_ms = 16;
    cfg.compositor.fps_window = 100;
    cfg.compositor.frame_interval_ms = 1;
    cfg.compositor.damage_tracking = true;

    cfg.effects.enabled = true;
    cfg.effects.effect_limit = 32;
    cfg.effects.default_duration_ms = 250;
    cfg.effects.preset = "performance";

    cfg.backend.type = "headless";

    // A single 1080p output so the headless session has somewhere to maximize to
    cfg.outputs = {
        { "HEADLESS-1", 1920, 1080, 60.0, 1.0, 0, 0, true },
    };

    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        auto tbl = toml::parse_file(path);
        Config cfg = default_config();

        if (auto log = tbl["log"].as_table())
        {
            if (auto v = (*log)["level"].value<std::string>())
                cfg.log.level = *v;
        }

        // Compositor
        if (auto compositor = tbl["compositor"].as_table())
        {
            read_uint(*compositor, "max_render_time_ms", cfg.compositor.max_render_time_ms);
            read_uint(*compositor, "fps_window", cfg.compositor.fps_window);
            read_uint(*compositor, "frame_interval_ms", cfg.compositor.frame_interval_ms);
            if (auto v = (*compositor)["damage_tracking"].value<bool>())
                cfg.compositor.damage_tracking = *v;
        }

        // Gestures
        if (auto gestures = tbl["gestures"].as_table())
        {
            auto& g = cfg.gestures;
            read_double(*gestures, "tap_threshold", g.tap_threshold);
            read_uint(*gestures, "tap_timeout_ms", g.tap_timeout_ms);
            read_uint(*gestures, "double_tap_interval_ms", g.double_tap_interval_ms);
            read_double(*gestures, "double_tap_distance", g.double_tap_distance);
            read_double(*gestures, "long_press_threshold", g.long_press_threshold);
            read_uint(*gestures, "long_press_delay_ms", g.long_press_delay_ms);
            read_uint(*gestures, "long_press_feedback_ms", g.long_press_feedback_ms);
            read_double(*gestures, "swipe_min_distance", g.swipe_min_distance);
            read_uint(*gestures, "swipe_max_time_ms", g.swipe_max_time_ms);
            read_double(*gestures, "pinch_min_distance", g.pinch_min_distance);
            read_double(*gestures, "pinch_min_scale_change", g.pinch_min_scale_change);
            read_double(*gestures, "rotate_min_angle", g.rotate_min_angle);
            read_double(*gestures, "edge_threshold", g.edge_threshold);
            read_double(*gestures, "edge_min_distance", g.edge_min_distance);
        }

        // Effects
        if (auto effects = tbl["effects"].as_table())
        {
            if (auto v = (*effects)["enabled"].value<bool>())
                cfg.effects.enabled = *v;
            read_uint(*effects, "effect_limit", cfg.effects.effect_limit);
            read_uint(*effects, "default_duration_ms", cfg.effects.default_duration_ms);
            if (auto v = (*effects)["preset"].value<std::string>())
                cfg.effects.preset = *v;
            if (auto v = (*effects)["start_scale"].value<double>())
                cfg.effects.start_scale = static_cast<float>(*v);
        }

        // Backend
        if (auto backend = tbl["backend"].as_table())
        {
            if (auto v = (*backend)["type"].value<std::string>())
                cfg.backend.type = *v;
            read_uint(*backend, "preview_width", cfg.backend.preview_width);
            read_uint(*backend, "preview_height", cfg.backend.preview_height);
        }

        // Outputs
        if (auto outputs = tbl["outputs"].as_array())
        {
            cfg.outputs.clear();
            for (auto const& item : *outputs)
            {
                if (auto out = item.as_table())
                {
                    OutputConfig output;
                    if (auto v = (*out)["name"].value<std::string>())
                        output.name = *v;
                    read_uint(*out, "width", output.width);
                    read_uint(*out, "height", output.height);
                    read_double(*out, "refresh", output.refresh);
                    read_double(*out, "scale", output.scale);
                    if (auto v = (*out)["x"].value<int64_t>())
                        output.x = static_cast<int32_t>(*v);
                    if (auto v = (*out)["y"].value<int64_t>())
                        output.y = static_cast<int32_t>(*v);
                    if (auto v = (*out)["primary"].value<bool>())
                        output.primary = *v;
                    cfg.outputs.push_back(output);
                }
            }
        }

        return cfg;
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error: {}", err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error: {}", e.what());
        return std::nullopt;
    }
}

} // namespace lumen
