#include "xcb_backend.hpp"
#include "lumen/core/log.hpp"
#include <xcb/xcb_icccm.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace lumen {

namespace {

constexpr uint32_t BACKGROUND_COLOR = 0x202020;
constexpr uint32_t OUTLINE_COLOR = 0x808080;
constexpr uint32_t FOCUSED_COLOR = 0x4c9aff;

uint32_t modifiers_from_state(uint16_t state)
{
    uint32_t mods = 0;
    if (state & XCB_MOD_MASK_SHIFT)
        mods |= modifier::SHIFT;
    if (state & XCB_MOD_MASK_CONTROL)
        mods |= modifier::CONTROL;
    if (state & XCB_MOD_MASK_1)
        mods |= modifier::ALT;
    if (state & XCB_MOD_MASK_4)
        mods |= modifier::SUPER;
    return mods;
}

PointerButton button_from_detail(xcb_button_t detail)
{
    switch (detail)
    {
        case 1:
            return PointerButton::Left;
        case 2:
            return PointerButton::Middle;
        case 3:
            return PointerButton::Right;
        default:
            return PointerButton::None;
    }
}

} // namespace

XcbPreviewBackend::XcbPreviewBackend(uint16_t width, uint16_t height, Rectangle scene)
    : width_(std::max<uint16_t>(width, 1))
    , height_(std::max<uint16_t>(height, 1))
    , scene_(scene)
{
}

XcbPreviewBackend::~XcbPreviewBackend()
{
    shutdown();
}

bool XcbPreviewBackend::initialize()
{
    try
    {
        conn_ = std::make_unique<Connection>();
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("X11 preview backend: {}", e.what());
        return false;
    }

    auto* screen = conn_->screen();
    window_ = xcb_generate_id(conn_->get());

    uint32_t event_mask = XCB_EVENT_MASK_EXPOSURE | XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_BUTTON_RELEASE
        | XCB_EVENT_MASK_POINTER_MOTION | XCB_EVENT_MASK_STRUCTURE_NOTIFY;
    uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK;
    uint32_t values[2] = { BACKGROUND_COLOR, event_mask };

    xcb_create_window(
        conn_->get(),
        XCB_COPY_FROM_PARENT,
        window_,
        screen->root,
        0,
        0,
        width_,
        height_,
        0,
        XCB_WINDOW_CLASS_INPUT_OUTPUT,
        screen->root_visual,
        mask,
        values
    );

    char const* title = "lumen preview";
    xcb_icccm_set_wm_name(conn_->get(), window_, XCB_ATOM_STRING, 8, strlen(title), title);
    // WM_CLASS is instance and class, each NUL-terminated
    char const wm_class[] = "lumen\0Lumen";
    xcb_icccm_set_wm_class(conn_->get(), window_, sizeof(wm_class), wm_class);

    wm_protocols_ = intern_atom("WM_PROTOCOLS");
    wm_delete_window_ = intern_atom("WM_DELETE_WINDOW");
    if (wm_protocols_ != XCB_NONE && wm_delete_window_ != XCB_NONE)
        xcb_icccm_set_wm_protocols(conn_->get(), window_, wm_protocols_, 1, &wm_delete_window_);

    normal_gc_ = xcb_generate_id(conn_->get());
    uint32_t gc_mask = XCB_GC_FOREGROUND | XCB_GC_LINE_WIDTH;
    uint32_t normal_values[2] = { OUTLINE_COLOR, 1 };
    xcb_create_gc(conn_->get(), normal_gc_, window_, gc_mask, normal_values);

    focused_gc_ = xcb_generate_id(conn_->get());
    uint32_t focused_values[2] = { FOCUSED_COLOR, 2 };
    xcb_create_gc(conn_->get(), focused_gc_, window_, gc_mask, focused_values);

    xcb_map_window(conn_->get(), window_);
    conn_->flush();

    LOG_INFO("X11 preview window {:#x} created ({}x{})", window_, width_, height_);
    return true;
}

void XcbPreviewBackend::shutdown()
{
    if (!conn_)
        return;

    xcb_free_gc(conn_->get(), focused_gc_);
    xcb_free_gc(conn_->get(), normal_gc_);
    if (window_ != XCB_NONE)
        xcb_destroy_window(conn_->get(), window_);
    conn_->flush();

    window_ = XCB_NONE;
    conn_.reset();
}

bool XcbPreviewBackend::begin_frame(FrameInfo const&)
{
    if (!conn_ || closed_ || conn_->has_error())
        return false;

    xcb_clear_area(conn_->get(), 0, window_, 0, 0, 0, 0);
    return true;
}

bool XcbPreviewBackend::submit(RenderCommand const& command)
{
    if (!conn_)
        return false;

    // Apply the effect scale about the window centre before projecting
    Point top_left = command.transform.apply({ 0.0, 0.0 });
    Point bottom_right =
        command.transform.apply({ static_cast<double>(command.geometry.width), static_cast<double>(command.geometry.height) });

    Rectangle scaled{ static_cast<int32_t>(command.geometry.x + top_left.x),
                      static_cast<int32_t>(command.geometry.y + top_left.y),
                      static_cast<uint32_t>(std::max(0.0, bottom_right.x - top_left.x)),
                      static_cast<uint32_t>(std::max(0.0, bottom_right.y - top_left.y)) };

    xcb_rectangle_t rect = to_preview(scaled);
    xcb_poly_rectangle(conn_->get(), window_, command.focused ? focused_gc_ : normal_gc_, 1, &rect);
    return true;
}

bool XcbPreviewBackend::end_frame()
{
    if (!conn_)
        return false;

    conn_->flush();
    return !conn_->has_error();
}

bool XcbPreviewBackend::poll_input(std::vector<InputEvent>& out)
{
    if (!conn_)
        return false;

    while (auto* raw = xcb_poll_for_event(conn_->get()))
    {
        std::unique_ptr<xcb_generic_event_t, decltype(&free)> event(raw, free);
        uint8_t response_type = event->response_type & ~0x80;

        switch (response_type)
        {
            case XCB_BUTTON_PRESS:
            case XCB_BUTTON_RELEASE:
            {
                auto const& e = reinterpret_cast<xcb_button_press_event_t const&>(*event);
                auto button = button_from_detail(e.detail);
                if (button == PointerButton::None)
                    break; // Scroll wheel

                InputEvent input;
                input.type = response_type == XCB_BUTTON_PRESS ? InputEventType::PointerPress
                                                               : InputEventType::PointerRelease;
                input.button = button;
                input.position = to_scene(e.event_x, e.event_y);
                input.modifiers = modifiers_from_state(e.state);
                input.timestamp_ms = e.time;
                input.source_device = "x11-pointer";
                out.push_back(std::move(input));
                break;
            }
            case XCB_MOTION_NOTIFY:
            {
                auto const& e = reinterpret_cast<xcb_motion_notify_event_t const&>(*event);
                InputEvent input;
                input.type = InputEventType::PointerMove;
                input.position = to_scene(e.event_x, e.event_y);
                input.modifiers = modifiers_from_state(e.state);
                input.timestamp_ms = e.time;
                input.source_device = "x11-pointer";
                out.push_back(std::move(input));
                break;
            }
            case XCB_CONFIGURE_NOTIFY:
            {
                auto const& e = reinterpret_cast<xcb_configure_notify_event_t const&>(*event);
                if (e.width > 0 && e.height > 0)
                {
                    width_ = e.width;
                    height_ = e.height;
                }
                break;
            }
            case XCB_CLIENT_MESSAGE:
            {
                auto const& e = reinterpret_cast<xcb_client_message_event_t const&>(*event);
                if (e.type == wm_protocols_ && e.data.data32[0] == wm_delete_window_)
                {
                    LOG_INFO("X11 preview window closed");
                    closed_ = true;
                }
                break;
            }
            default:
                break;
        }
    }

    if (conn_->has_error())
    {
        LOG_ERROR("X11 connection lost");
        closed_ = true;
    }
    return !closed_;
}

xcb_rectangle_t XcbPreviewBackend::to_preview(Rectangle const& r) const
{
    double sx = scene_.width > 0 ? static_cast<double>(width_) / scene_.width : 1.0;
    double sy = scene_.height > 0 ? static_cast<double>(height_) / scene_.height : 1.0;

    auto clamp16 = [](double v) { return static_cast<int16_t>(std::clamp(v, -32768.0, 32767.0)); };
    auto clampu16 = [](double v) { return static_cast<uint16_t>(std::clamp(v, 1.0, 65535.0)); };

    return { clamp16((r.x - scene_.x) * sx),
             clamp16((r.y - scene_.y) * sy),
             clampu16(r.width * sx),
             clampu16(r.height * sy) };
}

Point XcbPreviewBackend::to_scene(int16_t x, int16_t y) const
{
    double sx = width_ > 0 ? static_cast<double>(scene_.width) / width_ : 1.0;
    double sy = height_ > 0 ? static_cast<double>(scene_.height) / height_ : 1.0;
    return { scene_.x + x * sx, scene_.y + y * sy };
}

xcb_atom_t XcbPreviewBackend::intern_atom(char const* name) const
{
    auto cookie = xcb_intern_atom(conn_->get(), 0, strlen(name), name);
    auto* reply = xcb_intern_atom_reply(conn_->get(), cookie, nullptr);
    if (!reply)
        return XCB_NONE;

    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

} // namespace lumen
