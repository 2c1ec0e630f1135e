#include "window_selection.hpp"

#include <algorithm>

std::optional<WindowHandle> select_main_window(std::span<const WindowCandidate> candidates,
                                               MainWindowPolicy policy) {
    if (candidates.empty()) return std::nullopt;

    if (policy == MainWindowPolicy::VisibleTitled) {
        auto it = std::ranges::find_if(candidates, [](const WindowCandidate& c) {
            return c.visible && c.has_title;
        });
        if (it != candidates.end()) return it->handle;
    }
    return candidates.front().handle;
}

std::optional<MainWindowPolicy> parse_main_window_policy(std::string_view name) {
    if (name == "visible_titled") return MainWindowPolicy::VisibleTitled;
    if (name == "first") return MainWindowPolicy::First;
    return std::nullopt;
}

std::string_view to_string(MainWindowPolicy policy) {
    switch (policy) {
        case MainWindowPolicy::VisibleTitled: return "visible_titled";
        case MainWindowPolicy::First: return "first";
    }
    return "unknown";
}
