#pragma once

#include "lumen/compositor/render_backend.hpp"
#include <vector>

namespace lumen {

/**
 * @brief Backend that accepts frames without drawing anything.
 *
 * Used when no display is available and by tests: it records which windows
 * were submitted in the last frame and can be told to fail frames to exercise
 * the FrameDropped path.
 */
class HeadlessBackend : public RenderBackend
{
public:
    struct Submission
    {
        WindowId window = NO_WINDOW;
        size_t damage_count = 0;
        float opacity = 1.0f;
        int32_t z_order = 0;
    };

    std::string_view name() const override { return "headless"; }
    bool initialize() override;
    void shutdown() override;

    bool begin_frame(FrameInfo const& frame) override;
    bool submit(RenderCommand const& command) override;
    bool end_frame() override;

    void fail_next_frames(size_t count) { failures_pending_ = count; }

    bool initialized() const { return initialized_; }
    uint64_t frames_begun() const { return frames_begun_; }
    uint64_t frames_completed() const { return frames_completed_; }
    uint64_t commands_submitted() const { return commands_submitted_; }
    std::vector<Submission> const& last_frame() const { return last_frame_; }

private:
    bool initialized_ = false;
    bool failing_frame_ = false;
    size_t failures_pending_ = 0;
    uint64_t frames_begun_ = 0;
    uint64_t frames_completed_ = 0;
    uint64_t commands_submitted_ = 0;
    std::vector<Submission> current_frame_;
    std::vector<Submission> last_frame_;
};

} // namespace lumen
