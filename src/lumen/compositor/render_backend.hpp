#pragma once

#include "lumen/core/types.hpp"
#include <span>
#include <string_view>

namespace lumen {

struct FrameInfo
{
    uint64_t sequence = 0;
    Clock::time_point time;
    Clock::duration delta{};
};

/**
 * @brief Everything a backend needs to draw one window for one frame.
 *
 * `damage` is window-local; an empty span means the content is unchanged and
 * the backend may reuse whatever it cached for this window.
 */
struct RenderCommand
{
    WindowId window = NO_WINDOW;
    Rectangle geometry;
    int32_t z_order = 0;
    float opacity = 1.0f;
    bool focused = false;
    Transform transform; ///< Effect transform, about the window centre
    std::shared_ptr<Buffer const> buffer;
    std::span<Rectangle const> damage;
    std::span<OpacityRegion const> opacity_regions;
};

/**
 * @brief Capability interface for whatever actually puts pixels on screen.
 *
 * The compositor drives one begin/submit.../end sequence per frame. Any call
 * returning false turns the frame into a dropped frame; the loop keeps going.
 */
class RenderBackend
{
public:
    virtual ~RenderBackend() = default;

    virtual std::string_view name() const = 0;
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;

    virtual bool begin_frame(FrameInfo const& frame) = 0;
    virtual bool submit(RenderCommand const& command) = 0;
    virtual bool end_frame() = 0;
};

} // namespace lumen
