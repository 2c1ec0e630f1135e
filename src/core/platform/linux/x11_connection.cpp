#include "platform/linux/x11_connection.hpp"

#include <cstring>
#include <format>

X11Property X11Property::from_reply(const xcb_get_property_reply_t* reply) {
    X11Property prop;
    prop.type = reply->type;
    prop.format = reply->format;

    // xcb_get_property_value() is not const-correct
    auto* r = const_cast<xcb_get_property_reply_t*>(reply);
    int len = xcb_get_property_value_length(r);
    if (len > 0) {
        auto* data = static_cast<const uint8_t*>(xcb_get_property_value(r));
        prop.bytes.assign(data, data + len);
    }
    return prop;
}

std::vector<uint32_t> X11Property::values32() const {
    std::vector<uint32_t> values;
    if (format != 32) return values;

    values.resize(bytes.size() / sizeof(uint32_t));
    std::memcpy(values.data(), bytes.data(), values.size() * sizeof(uint32_t));
    return values;
}

X11Connection::X11Connection() = default;

X11Connection::~X11Connection() {
    if (conn_) xcb_disconnect(conn_);
}

std::expected<void, WindowError> X11Connection::connect(const std::string& display) {
    int screen_num = 0;
    conn_ = xcb_connect(display.empty() ? nullptr : display.c_str(), &screen_num);

    // xcb_connect never returns null, but the connection may be in an error state
    if (int err = xcb_connection_has_error(conn_); err != 0) {
        const char* name = display.empty() ? std::getenv("DISPLAY") : display.c_str();
        return std::unexpected(WindowError::transport(
            std::format("cannot open display '{}' (xcb error {})", name ? name : "", err)));
    }

    auto it = xcb_setup_roots_iterator(xcb_get_setup(conn_));
    for (int i = 0; i < screen_num && it.rem > 0; ++i) xcb_screen_next(&it);
    if (it.rem == 0 || !it.data) {
        return std::unexpected(WindowError::transport(
            std::format("display has no screen {}", screen_num)));
    }
    root_ = it.data->root;
    return {};
}

std::expected<xcb_atom_t, WindowError> X11Connection::atom(std::string_view name) {
    std::string key(name);
    if (auto it = atoms_.find(key); it != atoms_.end()) return it->second;

    auto cookie = xcb_intern_atom(conn_, 0, static_cast<uint16_t>(name.size()), name.data());
    auto reply = wait(cookie, xcb_intern_atom_reply, std::format("intern {}", name));
    if (!reply) return std::unexpected(reply.error());

    xcb_atom_t atom = (*reply)->atom;
    atoms_.emplace(std::move(key), atom);
    return atom;
}

std::expected<X11Property, WindowError> X11Connection::get_property(xcb_window_t window,
                                                                    xcb_atom_t property,
                                                                    xcb_atom_t type,
                                                                    uint32_t length) {
    auto cookie = xcb_get_property(conn_, 0, window, property, type, 0, length);
    auto reply = wait(cookie, xcb_get_property_reply, "get property");
    if (!reply) return std::unexpected(reply.error());
    return X11Property::from_reply(reply->get());
}

std::expected<void, WindowError> X11Connection::check(xcb_void_cookie_t cookie,
                                                      std::string_view what) const {
    xcb_generic_error_t* err = xcb_request_check(conn_, cookie);
    if (!err && !xcb_connection_has_error(conn_)) return {};
    return std::unexpected(to_error(err, what));
}

void X11Connection::flush() const {
    xcb_flush(conn_);
}

WindowError X11Connection::to_error(xcb_generic_error_t* err, std::string_view what) const {
    if (!err) {
        return WindowError::transport(
            std::format("{}: connection lost (xcb error {})", what, xcb_connection_has_error(conn_)));
    }

    uint8_t code = err->error_code;
    uint32_t resource = err->resource_id;
    std::free(err);

    if (code == XCB_WINDOW || code == XCB_DRAWABLE) {
        return WindowError::invalid_handle(
            std::format("{}: window 0x{:x} does not exist", what, resource));
    }
    return WindowError::property(std::format("{}: request rejected (X error {})", what, code));
}
