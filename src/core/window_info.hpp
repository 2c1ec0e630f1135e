#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using ProcessId = uint32_t;

// Opaque native window identifier (X11 XID or Win32 HWND). Owned by the
// window system; may go stale at any point after it was obtained.
struct WindowHandle {
    uint64_t id = 0;

    bool operator==(const WindowHandle&) const = default;
};

struct WindowInfo {
    int32_t x = 0;
    int32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    // Degenerate rectangles clamp to a zero size.
    static WindowInfo from_rect(int32_t left, int32_t top, int32_t right, int32_t bottom);

    bool operator==(const WindowInfo&) const = default;
};

// Accepts decimal or 0x-prefixed hex, as printed by xwininfo/xprop or Spy++.
std::optional<WindowHandle> parse_window_handle(std::string_view text);
std::optional<ProcessId> parse_process_id(std::string_view text);

std::string format_window_handle(WindowHandle window);
