#pragma once

#include "platform/window_control.hpp"

#include <string>

struct Config {
    std::string display;  // X11 display name, empty for $DISPLAY
    MainWindowPolicy main_window = MainWindowPolicy::VisibleTitled;
    bool verbose = false;

    WindowControl::Options window_options() const;

    static Config load(const std::string& path);
    static Config load_default();
};
