#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <lumen/compositor/headless_backend.hpp>
#include <lumen/compositor/xcb_backend.hpp>
#include <lumen/config/config.hpp>
#include <lumen/core/log.hpp>
#include <lumen/session.hpp>
#include <string>

namespace fs = std::filesystem;

namespace {

lumen::Session* g_session = nullptr;

void handle_signal(int)
{
    if (g_session)
        g_session->stop();
}

std::string get_config_path(int argc, char* argv[])
{
    // Command line argument takes priority
    if (argc > 1)
    {
        return argv[1];
    }

    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        return std::string(xdg) + "/lumen/config.toml";
    }

    if (char const* home = std::getenv("HOME"))
    {
        return std::string(home) + "/.config/lumen/config.toml";
    }

    return "";
}

lumen::Rectangle scene_bounds(lumen::Config const& config)
{
    lumen::Rectangle scene;
    for (auto const& output : config.outputs)
    {
        double scale = output.scale > 0.0 ? output.scale : 1.0;
        scene = scene.united(
            { output.x,
              output.y,
              static_cast<uint32_t>(output.width / scale),
              static_cast<uint32_t>(output.height / scale) }
        );
    }
    if (scene.empty())
        scene = { 0, 0, 1920, 1080 };
    return scene;
}

} // namespace

int main(int argc, char* argv[])
{
    lumen::log::init();

    try
    {
        LOG_INFO("Starting lumen compositor");

        std::string config_path = get_config_path(argc, argv);
        lumen::Config config;

        if (!config_path.empty() && fs::exists(config_path))
        {
            LOG_INFO("Loading config from: {}", config_path);
            auto loaded = lumen::load_config(config_path);
            if (loaded)
            {
                config = *loaded;
            }
            else
            {
                LOG_WARN("Failed to load config, using defaults");
                config = lumen::default_config();
            }
        }
        else
        {
            LOG_INFO("No config file found, using defaults");
            config = lumen::default_config();
        }

        if (!lumen::log::set_level(config.log.level))
            LOG_WARN("Unknown log level '{}', keeping trace", config.log.level);

        std::unique_ptr<lumen::RenderBackend> backend;
        lumen::XcbPreviewBackend* preview = nullptr;
        if (config.backend.type == "x11")
        {
            auto xcb = std::make_unique<lumen::XcbPreviewBackend>(
                config.backend.preview_width,
                config.backend.preview_height,
                scene_bounds(config)
            );
            preview = xcb.get();
            backend = std::move(xcb);
        }
        else
        {
            if (config.backend.type != "headless")
                LOG_WARN("Unknown backend '{}', using headless", config.backend.type);
            backend = std::make_unique<lumen::HeadlessBackend>();
        }

        lumen::Session session(std::move(config), std::move(backend));
        if (preview)
        {
            session.set_input_poller([preview](std::vector<lumen::InputEvent>& out)
                                     { return preview->poll_input(out); });
        }

        g_session = &session;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        session.initialize();
        session.run();

        g_session = nullptr;
    }
    catch (std::exception const& e)
    {
        g_session = nullptr;
        LOG_ERROR("Error: {}", e.what());
        lumen::log::shutdown();
        return 1;
    }

    LOG_INFO("Lumen exiting");
    lumen::log::shutdown();
    return 0;
}
