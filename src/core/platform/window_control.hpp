#pragma once

#include "window_error.hpp"
#include "window_info.hpp"
#include "window_selection.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

// Queries and controls top-level desktop windows. The member functions are
// defined once per window system (x11_window_control.cpp or
// win32_window_control.cpp); the build picks exactly one.
//
// Every call opens its own connection to the window system and closes it
// before returning. Instances hold no mutable state.
class WindowControl {
public:
    struct Options {
        std::string display;  // X11 display name, empty for $DISPLAY
        MainWindowPolicy main_window = MainWindowPolicy::VisibleTitled;
        bool verbose = false;
    };

    WindowControl() = default;
    explicit WindowControl(Options options) : options_(std::move(options)) {}

    // Absolute screen rectangle of the window.
    std::expected<WindowInfo, WindowError> get_window_info(WindowHandle window) const;

    // The process's main window per Options::main_window, or nullopt if it owns none.
    std::expected<std::optional<WindowHandle>, WindowError> find_window_by_pid(ProcessId pid) const;

    // All top-level windows owned by the process, in enumeration order.
    std::expected<std::vector<WindowHandle>, WindowError> find_windows_by_pid(ProcessId pid) const;

    // Owner of the focused window, or nullopt when nothing usable has focus.
    std::expected<std::optional<ProcessId>, WindowError> get_active_window_pid() const;

    // Removes the window from the taskbar and task switcher. It stays on screen.
    std::expected<void, WindowError> hide_window(WindowHandle window) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};
