#pragma once

#include <memory>
#include <xcb/xcb.h>

namespace lumen {

/// Owning handle to an X server connection and the screen its display string names.
class Connection
{
public:
    /// nullptr connects to $DISPLAY. Throws std::runtime_error when the server is unreachable.
    explicit Connection(char const* display = nullptr);
    ~Connection() = default;

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;
    Connection(Connection&&) = default;
    Connection& operator=(Connection&&) = default;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }

    bool has_error() const { return xcb_connection_has_error(conn_.get()) != 0; }
    void flush() { xcb_flush(conn_.get()); }

private:
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_;
};

} // namespace lumen
