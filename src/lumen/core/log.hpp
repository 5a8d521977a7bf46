#pragma once

// Logging for Lumen using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Per-event logging (every input event, every recognizer step)
//   - DEBUG: Window state changes, effect lifecycle, arbitration decisions
//   - INFO:  Startup, config loaded, outputs attached
//   - WARN:  Recoverable problems (unknown preset, bad config value)
//   - ERROR: Failed setup, dropped backends
//
// Release builds compile TRACE and DEBUG out. The runtime level set from
// [log] in the config file filters further.
//
// Usage:
//   LOG_DEBUG("Raising window {}", window_id);
//   LOG_INFO("Output {} added ({}x{})", name, width, height);

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <string_view>
#include <vector>

namespace lumen::log {

inline constexpr char const* DEFAULT_LOG_FILE = "/tmp/lumen.log";

// Call once at startup, before the config is read
inline void init(std::string const& file_path = DEFAULT_LOG_FILE)
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{ console_sink };
    std::string file_error;
    try
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }
    catch (spdlog::spdlog_ex const& e)
    {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("lumen", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace); // Runtime level (compile-time is separate)
    logger->flush_on(spdlog::level::debug);

    spdlog::set_default_logger(logger);

    if (!file_error.empty())
        spdlog::warn("Logging to stderr only: {}", file_error);
}

/// Set the runtime level by name ("trace" .. "critical", "off"). False for an unknown name.
inline bool set_level(std::string_view name)
{
    auto level = spdlog::level::from_str(std::string(name));
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off")
        return false;
    spdlog::set_level(level);
    return true;
}

inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace lumen::log

// Convenience macros using spdlog's compile-time filtered macros
// These are zero-cost when level is below SPDLOG_ACTIVE_LEVEL

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

// Input event logging helper (trace level)
#define LOG_INPUT(type, x, y, timestamp) \
    SPDLOG_TRACE("Input: type={} pos=({:.1f}, {:.1f}) t={}", type, x, y, timestamp)
