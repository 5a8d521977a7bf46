#include "connection.hpp"
#include <stdexcept>
#include <string>

namespace lumen {

namespace {

char const* describe_connection_error(int code)
{
    switch (code)
    {
        case XCB_CONN_ERROR:
            return "socket, pipe or stream error";
        case XCB_CONN_CLOSED_EXT_NOTSUPPORTED:
            return "extension not supported";
        case XCB_CONN_CLOSED_MEM_INSUFFICIENT:
            return "out of memory";
        case XCB_CONN_CLOSED_REQ_LEN_EXCEED:
            return "request length exceeded";
        case XCB_CONN_CLOSED_PARSE_ERR:
            return "invalid DISPLAY";
        case XCB_CONN_CLOSED_INVALID_SCREEN:
            return "no such screen";
        default:
            return "unknown error";
    }
}

} // namespace

Connection::Connection(char const* display)
    : conn_(nullptr, xcb_disconnect)
    , screen_(nullptr)
{
    int screen_number = 0;
    conn_.reset(xcb_connect(display, &screen_number));

    if (int code = xcb_connection_has_error(conn_.get()))
    {
        throw std::runtime_error(
            std::string("Failed to connect to X server ") + (display ? display : "$DISPLAY") + ": "
            + describe_connection_error(code)
        );
    }

    // The screen named by the display string, not always the first one
    auto it = xcb_setup_roots_iterator(xcb_get_setup(conn_.get()));
    for (int i = 0; i < screen_number && it.rem > 0; ++i)
        xcb_screen_next(&it);

    screen_ = it.rem > 0 ? it.data : nullptr;
    if (!screen_)
    {
        throw std::runtime_error("Failed to get screen " + std::to_string(screen_number));
    }
}

} // namespace lumen
