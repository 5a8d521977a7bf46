#pragma once

#include "lumen/compositor/render_backend.hpp"
#include "lumen/core/connection.hpp"
#include "lumen/gesture/types.hpp"
#include <memory>
#include <vector>

namespace lumen {

/**
 * @brief Debug backend that previews the scene in a single X11 window.
 *
 * Every submitted window is drawn as a rectangle outline scaled from the
 * global logical space into the preview window; the focused window is drawn
 * in a highlight colour. No pixel content is rasterized.
 *
 * The same X window doubles as an input source: poll_input() turns button
 * and motion events on it into pointer InputEvents in logical coordinates.
 */
class XcbPreviewBackend : public RenderBackend
{
public:
    XcbPreviewBackend(uint16_t width, uint16_t height, Rectangle scene);
    ~XcbPreviewBackend() override;

    XcbPreviewBackend(XcbPreviewBackend const&) = delete;
    XcbPreviewBackend& operator=(XcbPreviewBackend const&) = delete;

    std::string_view name() const override { return "x11-preview"; }
    bool initialize() override;
    void shutdown() override;

    bool begin_frame(FrameInfo const& frame) override;
    bool submit(RenderCommand const& command) override;
    bool end_frame() override;

    /// Drain pending X events. Returns false once the preview window was closed.
    bool poll_input(std::vector<InputEvent>& out);

    void set_scene(Rectangle scene) { scene_ = scene; }

private:
    std::unique_ptr<Connection> conn_;
    uint16_t width_;
    uint16_t height_;
    Rectangle scene_;
    xcb_window_t window_ = XCB_NONE;
    xcb_gcontext_t normal_gc_ = 0;
    xcb_gcontext_t focused_gc_ = 0;
    xcb_atom_t wm_protocols_ = XCB_NONE;
    xcb_atom_t wm_delete_window_ = XCB_NONE;
    bool closed_ = false;

    xcb_rectangle_t to_preview(Rectangle const& r) const;
    Point to_scene(int16_t x, int16_t y) const;
    xcb_atom_t intern_atom(char const* name) const;
};

} // namespace lumen
