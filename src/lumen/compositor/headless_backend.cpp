#include "headless_backend.hpp"
#include "lumen/core/log.hpp"

namespace lumen {

bool HeadlessBackend::initialize()
{
    LOG_INFO("Headless render backend initialized");
    initialized_ = true;
    return true;
}

void HeadlessBackend::shutdown()
{
    initialized_ = false;
}

bool HeadlessBackend::begin_frame(FrameInfo const& frame)
{
    ++frames_begun_;
    current_frame_.clear();
    failing_frame_ = failures_pending_ > 0;
    if (failing_frame_)
    {
        --failures_pending_;
        LOG_TRACE("HeadlessBackend: failing frame {} on request", frame.sequence);
    }
    return true;
}

bool HeadlessBackend::submit(RenderCommand const& command)
{
    ++commands_submitted_;
    current_frame_.push_back({ command.window, command.damage.size(), command.opacity, command.z_order });
    return !failing_frame_;
}

bool HeadlessBackend::end_frame()
{
    last_frame_ = std::move(current_frame_);
    current_frame_.clear();
    if (failing_frame_)
        return false;
    ++frames_completed_;
    return true;
}

} // namespace lumen
