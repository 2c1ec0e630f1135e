#pragma once

#include "window_error.hpp"

#include <cstdint>
#include <cstdlib>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <xcb/xcb.h>

template <typename T>
using XcbReply = std::unique_ptr<T, decltype(&std::free)>;

// Decoded GetProperty reply. format == 0 means the property is not set.
struct X11Property {
    xcb_atom_t type = XCB_ATOM_NONE;
    uint8_t format = 0;
    std::vector<uint8_t> bytes;

    static X11Property from_reply(const xcb_get_property_reply_t* reply);

    bool absent() const { return format == 0; }
    // Empty unless format is 32.
    std::vector<uint32_t> values32() const;
};

// One connection to the X server, closed on destruction.
class X11Connection {
public:
    X11Connection();
    ~X11Connection();

    X11Connection(const X11Connection&) = delete;
    X11Connection& operator=(const X11Connection&) = delete;

    // Empty display name means $DISPLAY.
    std::expected<void, WindowError> connect(const std::string& display);

    xcb_connection_t* get() const { return conn_; }
    xcb_window_t root() const { return root_; }

    std::expected<xcb_atom_t, WindowError> atom(std::string_view name);

    // length is in 32-bit units, as on the wire.
    std::expected<X11Property, WindowError> get_property(xcb_window_t window, xcb_atom_t property,
                                                         xcb_atom_t type, uint32_t length);

    // Waits for a reply. A null reply is turned into a WindowError naming `what`.
    template <typename Reply, typename Cookie>
    std::expected<XcbReply<Reply>, WindowError> wait(
        Cookie cookie, Reply* (*reply_fn)(xcb_connection_t*, Cookie, xcb_generic_error_t**),
        std::string_view what) const {
        xcb_generic_error_t* err = nullptr;
        XcbReply<Reply> reply(reply_fn(conn_, cookie, &err), &std::free);
        if (reply) return reply;
        return std::unexpected(to_error(err, what));
    }

    // Waits for the outcome of a *_checked request.
    std::expected<void, WindowError> check(xcb_void_cookie_t cookie, std::string_view what) const;

    void flush() const;

private:
    // Takes ownership of err, which may be null.
    WindowError to_error(xcb_generic_error_t* err, std::string_view what) const;

    xcb_connection_t* conn_ = nullptr;
    xcb_window_t root_ = XCB_WINDOW_NONE;
    std::unordered_map<std::string, xcb_atom_t> atoms_;
};
