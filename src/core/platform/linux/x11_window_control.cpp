#include "platform/window_control.hpp"
#include "platform/linux/x11_connection.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>
#include <print>

namespace {

// EWMH _NET_WM_STATE client message fields
constexpr uint32_t NET_WM_STATE_ADD = 1;
constexpr uint32_t SOURCE_APPLICATION = 1;

// Upper bound (in 32-bit units) for list properties we read in one go
constexpr uint32_t MAX_LIST_LENGTH = 1u << 16;

std::expected<xcb_window_t, WindowError> to_xcb_window(WindowHandle window) {
    if (window.id == 0 || window.id > std::numeric_limits<xcb_window_t>::max()) {
        return std::unexpected(WindowError::invalid_handle(
            std::format("{} is not an X11 window id", format_window_handle(window))));
    }
    return static_cast<xcb_window_t>(window.id);
}

std::expected<std::vector<xcb_window_t>, WindowError> root_children(X11Connection& conn) {
    auto reply = conn.wait(xcb_query_tree(conn.get(), conn.root()), xcb_query_tree_reply,
                           "query root tree");
    if (!reply) return std::unexpected(reply.error());

    auto* children = xcb_query_tree_children(reply->get());
    int count = xcb_query_tree_children_length(reply->get());
    return std::vector<xcb_window_t>(children, children + count);
}

// Managed top-level windows. Without an EWMH window manager there is no
// _NET_CLIENT_LIST and the root's children are the top-level windows.
std::expected<std::vector<xcb_window_t>, WindowError> top_level_windows(X11Connection& conn,
                                                                        bool verbose) {
    auto client_list = conn.atom("_NET_CLIENT_LIST");
    if (!client_list) return std::unexpected(client_list.error());

    auto prop = conn.get_property(conn.root(), *client_list, XCB_ATOM_WINDOW, MAX_LIST_LENGTH);
    if (!prop) return std::unexpected(prop.error());

    if (prop->absent()) {
        if (verbose) std::println(stderr, "x11: no _NET_CLIENT_LIST, using root children");
        return root_children(conn);
    }
    if (prop->type != XCB_ATOM_WINDOW || prop->format != 32) {
        return std::unexpected(WindowError::property(
            std::format("_NET_CLIENT_LIST has type {} format {}", prop->type, prop->format)));
    }

    auto values = prop->values32();
    return std::vector<xcb_window_t>(values.begin(), values.end());
}

std::optional<ProcessId> pid_from_property(const X11Property& prop) {
    auto values = prop.values32();
    if (prop.type != XCB_ATOM_CARDINAL || values.empty()) return std::nullopt;
    return values.front();
}

// Owner PID of each window, in order. Windows that vanished or carry no
// _NET_WM_PID map to nullopt. Requests are pipelined.
std::expected<std::vector<std::optional<ProcessId>>, WindowError> window_pids(
    X11Connection& conn, const std::vector<xcb_window_t>& windows, bool verbose) {
    auto pid_atom = conn.atom("_NET_WM_PID");
    if (!pid_atom) return std::unexpected(pid_atom.error());

    std::vector<xcb_get_property_cookie_t> cookies;
    cookies.reserve(windows.size());
    for (auto w : windows) {
        cookies.push_back(xcb_get_property(conn.get(), 0, w, *pid_atom, XCB_ATOM_CARDINAL, 0, 1));
    }

    std::vector<std::optional<ProcessId>> pids;
    pids.reserve(windows.size());
    for (size_t i = 0; i < cookies.size(); ++i) {
        auto reply = conn.wait(cookies[i], xcb_get_property_reply, "get _NET_WM_PID");
        if (!reply) {
            if (reply.error().kind == WindowErrorKind::Transport) return std::unexpected(reply.error());
            if (verbose) std::println(stderr, "x11: skipping 0x{:x}: {}", windows[i], reply.error().message);
            pids.push_back(std::nullopt);
            continue;
        }
        pids.push_back(pid_from_property(X11Property::from_reply(reply->get())));
    }
    return pids;
}

std::expected<std::optional<ProcessId>, WindowError> window_pid(X11Connection& conn,
                                                                xcb_window_t window) {
    auto pid_atom = conn.atom("_NET_WM_PID");
    if (!pid_atom) return std::unexpected(pid_atom.error());

    auto prop = conn.get_property(window, *pid_atom, XCB_ATOM_CARDINAL, 1);
    if (!prop) return std::unexpected(prop.error());
    return pid_from_property(*prop);
}

std::expected<bool, WindowError> has_title(X11Connection& conn, xcb_window_t window) {
    auto net_wm_name = conn.atom("_NET_WM_NAME");
    if (!net_wm_name) return std::unexpected(net_wm_name.error());

    for (xcb_atom_t name_atom : {*net_wm_name, xcb_atom_t(XCB_ATOM_WM_NAME)}) {
        auto prop = conn.get_property(window, name_atom, XCB_GET_PROPERTY_TYPE_ANY, 1);
        if (!prop) return std::unexpected(prop.error());
        if (!prop->bytes.empty()) return true;
    }
    return false;
}

std::expected<WindowCandidate, WindowError> describe_candidate(X11Connection& conn,
                                                               xcb_window_t window) {
    auto attrs = conn.wait(xcb_get_window_attributes(conn.get(), window),
                           xcb_get_window_attributes_reply, "get window attributes");
    if (!attrs) return std::unexpected(attrs.error());

    auto titled = has_title(conn, window);
    if (!titled) return std::unexpected(titled.error());

    WindowCandidate candidate;
    candidate.handle = WindowHandle{window};
    candidate.visible = (*attrs)->map_state == XCB_MAP_STATE_VIEWABLE;
    candidate.has_title = *titled;
    return candidate;
}

// Looks up windows owned by pid in one connection.
std::expected<std::vector<xcb_window_t>, WindowError> owned_windows(X11Connection& conn,
                                                                    ProcessId pid, bool verbose) {
    auto windows = top_level_windows(conn, verbose);
    if (!windows) return std::unexpected(windows.error());

    auto pids = window_pids(conn, *windows, verbose);
    if (!pids) return std::unexpected(pids.error());

    std::vector<xcb_window_t> owned;
    for (size_t i = 0; i < windows->size(); ++i) {
        if ((*pids)[i] == pid) owned.push_back((*windows)[i]);
    }
    return owned;
}

// Stale windows and missing properties mean "unknown"; only transport
// failures propagate.
std::expected<std::optional<ProcessId>, WindowError> pid_or_unknown(
    std::expected<std::optional<ProcessId>, WindowError> result, bool verbose) {
    if (result) return result;
    if (result.error().kind == WindowErrorKind::Transport) return result;
    if (verbose) std::println(stderr, "x11: active window pid unavailable: {}", result.error().message);
    return std::optional<ProcessId>{};
}

// Input focus fallback for window managers without _NET_ACTIVE_WINDOW. The
// focus may sit on a child window, so walk up until a window names its owner.
std::expected<std::optional<ProcessId>, WindowError> focused_window_pid(X11Connection& conn,
                                                                        bool verbose) {
    auto focus = conn.wait(xcb_get_input_focus(conn.get()), xcb_get_input_focus_reply,
                           "get input focus");
    if (!focus) return std::unexpected(focus.error());

    xcb_window_t window = (*focus)->focus;
    while (window != XCB_WINDOW_NONE && window != XCB_INPUT_FOCUS_POINTER_ROOT &&
           window != conn.root()) {
        auto pid = pid_or_unknown(window_pid(conn, window), verbose);
        if (!pid || *pid) return pid;

        auto tree = conn.wait(xcb_query_tree(conn.get(), window), xcb_query_tree_reply, "query tree");
        if (!tree) {
            if (tree.error().kind == WindowErrorKind::Transport) return std::unexpected(tree.error());
            return std::optional<ProcessId>{};
        }
        window = (*tree)->parent;
    }
    return std::optional<ProcessId>{};
}

} // namespace

std::expected<WindowInfo, WindowError> WindowControl::get_window_info(WindowHandle window) const {
    auto w = to_xcb_window(window);
    if (!w) return std::unexpected(w.error());

    X11Connection conn;
    if (auto r = conn.connect(options_.display); !r) return std::unexpected(r.error());

    // GetGeometry is relative to the parent (the WM frame when reparented),
    // so the origin comes from translating into root coordinates.
    auto geom_cookie = xcb_get_geometry(conn.get(), *w);
    auto pos_cookie = xcb_translate_coordinates(conn.get(), *w, conn.root(), 0, 0);

    auto geom = conn.wait(geom_cookie, xcb_get_geometry_reply, "get geometry");
    if (!geom) return std::unexpected(geom.error());
    auto pos = conn.wait(pos_cookie, xcb_translate_coordinates_reply, "translate coordinates");
    if (!pos) return std::unexpected(pos.error());

    WindowInfo info;
    info.x = (*pos)->dst_x;
    info.y = (*pos)->dst_y;
    info.width = (*geom)->width;
    info.height = (*geom)->height;
    return info;
}

std::expected<std::vector<WindowHandle>, WindowError> WindowControl::find_windows_by_pid(
    ProcessId pid) const {
    X11Connection conn;
    if (auto r = conn.connect(options_.display); !r) return std::unexpected(r.error());

    auto owned = owned_windows(conn, pid, options_.verbose);
    if (!owned) return std::unexpected(owned.error());

    std::vector<WindowHandle> handles;
    handles.reserve(owned->size());
    for (auto w : *owned) handles.push_back(WindowHandle{w});
    return handles;
}

std::expected<std::optional<WindowHandle>, WindowError> WindowControl::find_window_by_pid(
    ProcessId pid) const {
    X11Connection conn;
    if (auto r = conn.connect(options_.display); !r) return std::unexpected(r.error());

    auto owned = owned_windows(conn, pid, options_.verbose);
    if (!owned) return std::unexpected(owned.error());

    std::vector<WindowCandidate> candidates;
    for (auto w : *owned) {
        auto candidate = describe_candidate(conn, w);
        if (candidate) {
            candidates.push_back(*candidate);
            continue;
        }
        if (candidate.error().kind == WindowErrorKind::Transport) return std::unexpected(candidate.error());
        // Closed since enumeration; still the process's window as far as the
        // list goes, but it can never be visible.
        candidates.push_back(WindowCandidate{WindowHandle{w}, false, false});
    }
    return select_main_window(candidates, options_.main_window);
}

std::expected<std::optional<ProcessId>, WindowError> WindowControl::get_active_window_pid() const {
    X11Connection conn;
    if (auto r = conn.connect(options_.display); !r) return std::unexpected(r.error());

    auto active_atom = conn.atom("_NET_ACTIVE_WINDOW");
    if (!active_atom) return std::unexpected(active_atom.error());

    auto prop = conn.get_property(conn.root(), *active_atom, XCB_ATOM_WINDOW, 1);
    if (!prop) return std::unexpected(prop.error());

    if (prop->absent()) {
        if (options_.verbose) std::println(stderr, "x11: no _NET_ACTIVE_WINDOW, using input focus");
        return focused_window_pid(conn, options_.verbose);
    }

    auto values = prop->values32();
    if (values.empty() || values.front() == XCB_WINDOW_NONE) return std::optional<ProcessId>{};
    return pid_or_unknown(window_pid(conn, values.front()), options_.verbose);
}

std::expected<void, WindowError> WindowControl::hide_window(WindowHandle window) const {
    auto w = to_xcb_window(window);
    if (!w) return std::unexpected(w.error());

    X11Connection conn;
    if (auto r = conn.connect(options_.display); !r) return std::unexpected(r.error());

    auto attrs = conn.wait(xcb_get_window_attributes(conn.get(), *w),
                           xcb_get_window_attributes_reply, "get window attributes");
    if (!attrs) return std::unexpected(attrs.error());

    auto net_wm_state = conn.atom("_NET_WM_STATE");
    if (!net_wm_state) return std::unexpected(net_wm_state.error());
    auto skip_taskbar = conn.atom("_NET_WM_STATE_SKIP_TASKBAR");
    if (!skip_taskbar) return std::unexpected(skip_taskbar.error());
    auto skip_pager = conn.atom("_NET_WM_STATE_SKIP_PAGER");
    if (!skip_pager) return std::unexpected(skip_pager.error());

    auto current = conn.get_property(*w, *net_wm_state, XCB_ATOM_ATOM, MAX_LIST_LENGTH);
    if (!current) return std::unexpected(current.error());
    if (!current->absent() && (current->type != XCB_ATOM_ATOM || current->format != 32)) {
        // Replacing it would drop whatever the owner stored there
        return std::unexpected(WindowError::property(std::format(
            "_NET_WM_STATE on {} has type {} format {}", format_window_handle(window),
            current->type, current->format)));
    }

    auto states = current->values32();
    for (xcb_atom_t a : {*skip_taskbar, *skip_pager}) {
        if (std::ranges::find(states, a) == states.end()) states.push_back(a);
    }

    auto set = conn.check(
        xcb_change_property_checked(conn.get(), XCB_PROP_MODE_REPLACE, *w, *net_wm_state,
                                    XCB_ATOM_ATOM, 32, static_cast<uint32_t>(states.size()),
                                    states.data()),
        "set _NET_WM_STATE");
    if (!set) return std::unexpected(set.error());

    // A mapped window's state belongs to the window manager, which only acts
    // on the client message.
    if ((*attrs)->map_state != XCB_MAP_STATE_UNMAPPED) {
        xcb_client_message_event_t event{};
        event.response_type = XCB_CLIENT_MESSAGE;
        event.format = 32;
        event.window = *w;
        event.type = *net_wm_state;
        event.data.data32[0] = NET_WM_STATE_ADD;
        event.data.data32[1] = *skip_taskbar;
        event.data.data32[2] = *skip_pager;
        event.data.data32[3] = SOURCE_APPLICATION;

        auto sent = conn.check(
            xcb_send_event_checked(conn.get(), 0, conn.root(),
                                   XCB_EVENT_MASK_SUBSTRUCTURE_REDIRECT |
                                       XCB_EVENT_MASK_SUBSTRUCTURE_NOTIFY,
                                   reinterpret_cast<const char*>(&event)),
            "send _NET_WM_STATE message");
        if (!sent) {
            return std::unexpected(WindowError::partial(std::format(
                "_NET_WM_STATE set on {} but window manager request failed: {}",
                format_window_handle(window), sent.error().describe())));
        }
    }

    conn.flush();
    return {};
}
