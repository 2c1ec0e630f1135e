#include "platform/window_control.hpp"

#include <cstdint>
#include <format>
#include <print>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace {

HWND to_hwnd(WindowHandle window) {
    return reinterpret_cast<HWND>(static_cast<uintptr_t>(window.id));
}

WindowHandle from_hwnd(HWND hwnd) {
    return WindowHandle{static_cast<uint64_t>(reinterpret_cast<uintptr_t>(hwnd))};
}

WindowError stale(WindowHandle window) {
    return WindowError::invalid_handle(std::format("window {} does not exist", format_window_handle(window)));
}

// Owned by find_owned_windows' stack frame; reaches the callback via LPARAM.
struct EnumAccumulator {
    DWORD pid;
    std::vector<HWND> windows;
};

BOOL CALLBACK collect_owned_window(HWND hwnd, LPARAM lparam) {
    auto& acc = *reinterpret_cast<EnumAccumulator*>(lparam);
    DWORD owner = 0;
    if (GetWindowThreadProcessId(hwnd, &owner) != 0 && owner == acc.pid) {
        acc.windows.push_back(hwnd);
    }
    return TRUE;
}

// EnumWindows visits top-level windows in Z order.
std::expected<std::vector<HWND>, WindowError> find_owned_windows(ProcessId pid) {
    EnumAccumulator acc{static_cast<DWORD>(pid), {}};

    SetLastError(ERROR_SUCCESS);
    if (!EnumWindows(collect_owned_window, reinterpret_cast<LPARAM>(&acc))) {
        DWORD err = GetLastError();
        if (err != ERROR_SUCCESS) {
            return std::unexpected(WindowError::transport(std::format("EnumWindows failed (error {})", err)));
        }
    }
    return std::move(acc.windows);
}

} // namespace

std::expected<WindowInfo, WindowError> WindowControl::get_window_info(WindowHandle window) const {
    HWND hwnd = to_hwnd(window);
    if (!IsWindow(hwnd)) return std::unexpected(stale(window));

    RECT rect{};
    if (!GetWindowRect(hwnd, &rect)) {
        DWORD err = GetLastError();
        if (err == ERROR_INVALID_WINDOW_HANDLE) return std::unexpected(stale(window));
        return std::unexpected(WindowError::property(std::format("GetWindowRect failed (error {})", err)));
    }
    return WindowInfo::from_rect(rect.left, rect.top, rect.right, rect.bottom);
}

std::expected<std::vector<WindowHandle>, WindowError> WindowControl::find_windows_by_pid(
    ProcessId pid) const {
    auto owned = find_owned_windows(pid);
    if (!owned) return std::unexpected(owned.error());

    std::vector<WindowHandle> handles;
    handles.reserve(owned->size());
    for (HWND hwnd : *owned) handles.push_back(from_hwnd(hwnd));
    return handles;
}

std::expected<std::optional<WindowHandle>, WindowError> WindowControl::find_window_by_pid(
    ProcessId pid) const {
    auto owned = find_owned_windows(pid);
    if (!owned) return std::unexpected(owned.error());

    std::vector<WindowCandidate> candidates;
    candidates.reserve(owned->size());
    for (HWND hwnd : *owned) {
        WindowCandidate candidate;
        candidate.handle = from_hwnd(hwnd);
        candidate.visible = IsWindowVisible(hwnd) != FALSE;
        candidate.has_title = GetWindowTextLengthW(hwnd) > 0;
        candidates.push_back(candidate);
    }
    return select_main_window(candidates, options_.main_window);
}

std::expected<std::optional<ProcessId>, WindowError> WindowControl::get_active_window_pid() const {
    HWND hwnd = GetForegroundWindow();
    if (!hwnd) return std::optional<ProcessId>{};

    DWORD pid = 0;
    if (GetWindowThreadProcessId(hwnd, &pid) == 0 || pid == 0) {
        if (options_.verbose) std::println(stderr, "win32: foreground window has no owner process");
        return std::optional<ProcessId>{};
    }
    return std::optional<ProcessId>{static_cast<ProcessId>(pid)};
}

// The shell only re-reads the extended style when the window is shown, so the
// style flip happens while it is hidden.
std::expected<void, WindowError> WindowControl::hide_window(WindowHandle window) const {
    HWND hwnd = to_hwnd(window);
    if (!IsWindow(hwnd)) return std::unexpected(stale(window));

    ShowWindow(hwnd, SW_HIDE);

    SetLastError(ERROR_SUCCESS);
    LONG_PTR style = GetWindowLongPtrW(hwnd, GWL_EXSTYLE);
    DWORD err = GetLastError();
    if (style == 0 && err != ERROR_SUCCESS) {
        ShowWindow(hwnd, SW_SHOW);
        return std::unexpected(WindowError::partial(std::format(
            "window {} was hidden but reading its style failed (error {})", format_window_handle(window), err)));
    }

    style = (style | WS_EX_TOOLWINDOW) & ~static_cast<LONG_PTR>(WS_EX_APPWINDOW);

    // SetWindowLongPtr returns the previous value, which may legitimately be 0
    SetLastError(ERROR_SUCCESS);
    if (SetWindowLongPtrW(hwnd, GWL_EXSTYLE, style) == 0 && (err = GetLastError()) != ERROR_SUCCESS) {
        ShowWindow(hwnd, SW_SHOW);
        return std::unexpected(WindowError::partial(std::format(
            "window {} was hidden but setting WS_EX_TOOLWINDOW failed (error {})", format_window_handle(window), err)));
    }

    ShowWindow(hwnd, SW_SHOW);
    if (!IsWindowVisible(hwnd)) {
        return std::unexpected(WindowError::partial(std::format(
            "window {} is marked as a tool window but could not be shown again", format_window_handle(window))));
    }
    return {};
}
