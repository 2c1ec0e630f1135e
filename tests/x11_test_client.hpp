#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>
#include <xcb/xcb.h>

// Independent X client that owns the windows a test inspects. Windows die
// with the connection.
class X11TestClient {
public:
    X11TestClient() {
        int screen_num = 0;
        conn_ = xcb_connect(nullptr, &screen_num);
        if (xcb_connection_has_error(conn_)) return;

        auto it = xcb_setup_roots_iterator(xcb_get_setup(conn_));
        for (int i = 0; i < screen_num && it.rem > 0; ++i) xcb_screen_next(&it);
        screen_ = it.data;
    }

    ~X11TestClient() { xcb_disconnect(conn_); }

    X11TestClient(const X11TestClient&) = delete;
    X11TestClient& operator=(const X11TestClient&) = delete;

    bool ok() const { return screen_ != nullptr && !xcb_connection_has_error(conn_); }
    xcb_window_t root() const { return screen_->root; }

    xcb_atom_t atom(const char* name) {
        auto cookie = xcb_intern_atom(conn_, 0, static_cast<uint16_t>(std::strlen(name)), name);
        auto* reply = xcb_intern_atom_reply(conn_, cookie, nullptr);
        if (!reply) return XCB_ATOM_NONE;
        xcb_atom_t a = reply->atom;
        std::free(reply);
        return a;
    }

    // Titled top-level window claiming `pid` as its owner.
    xcb_window_t create_window(uint32_t pid, const std::string& title,
                               int16_t x = 40, int16_t y = 30,
                               uint16_t width = 320, uint16_t height = 200, bool map = true) {
        xcb_window_t w = xcb_generate_id(conn_);
        xcb_create_window(conn_, XCB_COPY_FROM_PARENT, w, screen_->root, x, y, width, height, 0,
                          XCB_WINDOW_CLASS_INPUT_OUTPUT, screen_->root_visual, 0, nullptr);

        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, w, XCB_ATOM_WM_NAME, XCB_ATOM_STRING, 8,
                            static_cast<uint32_t>(title.size()), title.data());
        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, w, atom("_NET_WM_NAME"),
                            atom("UTF8_STRING"), 8, static_cast<uint32_t>(title.size()), title.data());
        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, w, atom("_NET_WM_PID"),
                            XCB_ATOM_CARDINAL, 32, 1, &pid);

        if (map) xcb_map_window(conn_, w);
        sync();
        return w;
    }

    // Top-level window with no properties at all.
    xcb_window_t create_plain_window(bool map) {
        xcb_window_t w = xcb_generate_id(conn_);
        xcb_create_window(conn_, XCB_COPY_FROM_PARENT, w, screen_->root, 10, 10, 100, 100, 0,
                          XCB_WINDOW_CLASS_INPUT_OUTPUT, screen_->root_visual, 0, nullptr);
        if (map) xcb_map_window(conn_, w);
        sync();
        return w;
    }

    void set_string(xcb_window_t w, xcb_atom_t property, xcb_atom_t type, const std::string& value) {
        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, w, property, type, 8,
                            static_cast<uint32_t>(value.size()), value.data());
        sync();
    }

    void delete_property(xcb_window_t w, const char* name) {
        xcb_delete_property(conn_, w, atom(name));
        sync();
    }

    void set_property32(xcb_window_t w, const char* name, xcb_atom_t type, std::vector<uint32_t> values) {
        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, w, atom(name), type, 32,
                            static_cast<uint32_t>(values.size()), values.data());
        sync();
    }

    void destroy_window(xcb_window_t w) {
        xcb_destroy_window(conn_, w);
        sync();
    }

    void focus(xcb_window_t w) {
        xcb_set_input_focus(conn_, XCB_INPUT_FOCUS_POINTER_ROOT, w, XCB_CURRENT_TIME);
        sync();
    }

    std::vector<uint32_t> property32(xcb_window_t w, const char* name, xcb_atom_t type) {
        auto cookie = xcb_get_property(conn_, 0, w, atom(name), type, 0, 1024);
        auto* reply = xcb_get_property_reply(conn_, cookie, nullptr);
        std::vector<uint32_t> values;
        if (!reply) return values;
        if (reply->format == 32) {
            auto* data = static_cast<uint32_t*>(xcb_get_property_value(reply));
            int n = xcb_get_property_value_length(reply) / 4;
            values.assign(data, data + n);
        }
        std::free(reply);
        return values;
    }

    bool root_has_property(const char* name) {
        auto cookie = xcb_get_property(conn_, 0, screen_->root, atom(name), XCB_GET_PROPERTY_TYPE_ANY, 0, 1);
        auto* reply = xcb_get_property_reply(conn_, cookie, nullptr);
        bool present = reply && reply->format != 0;
        std::free(reply);
        return present;
    }

    // EWMH window managers advertise themselves on the root window.
    bool window_manager_running() { return root_has_property("_NET_SUPPORTING_WM_CHECK"); }

    // Round trip so every request sent so far has been processed.
    void sync() {
        std::free(xcb_get_input_focus_reply(conn_, xcb_get_input_focus(conn_), nullptr));
    }

private:
    xcb_connection_t* conn_ = nullptr;
    xcb_screen_t* screen_ = nullptr;
};

// Window managers react asynchronously; poll for up to two seconds.
template <typename Pred>
bool eventually(Pred pred) {
    for (int i = 0; i < 40; ++i) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return pred();
}
