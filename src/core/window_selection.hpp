#pragma once

#include "window_info.hpp"

#include <optional>
#include <span>
#include <string_view>

enum class MainWindowPolicy {
    VisibleTitled, // first visible window with a title, else first window
    First,         // first window in enumeration order
};

struct WindowCandidate {
    WindowHandle handle;
    bool visible = false;
    bool has_title = false;
};

// Picks a process's "main" window from its top-level windows, given in
// enumeration order. Returns nullopt only for an empty candidate list.
std::optional<WindowHandle> select_main_window(std::span<const WindowCandidate> candidates,
                                               MainWindowPolicy policy);

std::optional<MainWindowPolicy> parse_main_window_policy(std::string_view name);
std::string_view to_string(MainWindowPolicy policy);
