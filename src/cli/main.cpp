#include "cli_args.hpp"
#include "config.hpp"
#include "platform/window_control.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  info <window>      Show a window's screen position and size");
    std::println(stderr, "  find <pid>         Show the main window of a process");
    std::println(stderr, "  find-all <pid>     List all top-level windows of a process");
    std::println(stderr, "  active             Show the PID owning the active window");
    std::println(stderr, "  hide <window>      Remove a window from the taskbar and task switcher");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH                  Config file path");
    std::println(stderr, "  -d, --display NAME                 X11 display (default $DISPLAY)");
    std::println(stderr, "  --policy visible_titled|first      Main window selection for 'find'");
    std::println(stderr, "  --json                             Print results as JSON");
    std::println(stderr, "  -v, --verbose                      Enable verbose logging");
    std::println(stderr, "  -h, --help                         Show this help");
}

static int report(const WindowError& err) {
    std::println(stderr, "Error ({}): {}", to_string(err.kind), err.message);
    return 1;
}

int main(int argc, char* argv[]) {
    auto args = parse_cli_args(std::vector<std::string>(argv + 1, argv + argc));
    if (!args) {
        std::println(stderr, "{}", args.error());
        usage(argv[0]);
        return 1;
    }
    if (args->help) {
        usage(argv[0]);
        return 0;
    }

    const auto& positional = args->positional;
    if (positional.empty()) {
        usage(argv[0]);
        return 1;
    }
    const bool as_json = args->as_json;

    Config config = args->config_path.empty() ? Config::load_default() : Config::load(args->config_path);
    if (args->display) config.display = *args->display;
    if (args->policy) config.main_window = *args->policy;
    if (args->verbose) config.verbose = true;

    WindowControl control(config.window_options());
    const std::string& command = positional[0];

    auto window_arg = [&]() -> std::optional<WindowHandle> {
        if (positional.size() < 2) return std::nullopt;
        return parse_window_handle(positional[1]);
    };
    auto pid_arg = [&]() -> std::optional<ProcessId> {
        if (positional.size() < 2) return std::nullopt;
        return parse_process_id(positional[1]);
    };

    if (command == "info") {
        auto window = window_arg();
        if (!window) {
            std::println(stderr, "info: expected a window id (decimal or 0x hex)");
            return 1;
        }
        auto info = control.get_window_info(*window);
        if (!info) return report(info.error());

        if (as_json) {
            json j = {{"x", info->x}, {"y", info->y}, {"width", info->width}, {"height", info->height}};
            std::println("{}", j.dump());
        } else {
            std::println("{}x{}+{}+{}", info->width, info->height, info->x, info->y);
        }
    } else if (command == "find" || command == "find-all") {
        auto pid = pid_arg();
        if (!pid) {
            std::println(stderr, "{}: expected a process id", command);
            return 1;
        }

        std::vector<WindowHandle> windows;
        if (command == "find") {
            auto found = control.find_window_by_pid(*pid);
            if (!found) return report(found.error());
            if (*found) windows.push_back(**found);
        } else {
            auto found = control.find_windows_by_pid(*pid);
            if (!found) return report(found.error());
            windows = std::move(*found);
        }

        if (as_json) {
            json j = json::array();
            for (auto w : windows) j.push_back(format_window_handle(w));
            if (command == "find") j = windows.empty() ? json(nullptr) : j.front();
            std::println("{}", j.dump());
        } else {
            for (auto w : windows) std::println("{}", format_window_handle(w));
        }
    } else if (command == "active") {
        auto pid = control.get_active_window_pid();
        if (!pid) return report(pid.error());

        if (as_json) {
            std::println("{}", *pid ? json(**pid).dump() : json(nullptr).dump());
        } else if (*pid) {
            std::println("{}", **pid);
        }
    } else if (command == "hide") {
        auto window = window_arg();
        if (!window) {
            std::println(stderr, "hide: expected a window id (decimal or 0x hex)");
            return 1;
        }
        auto hidden = control.hide_window(*window);
        if (!hidden) return report(hidden.error());

        if (as_json) {
            json j = {{"status", "ok"}};
            std::println("{}", j.dump());
        } else {
            std::println("OK");
        }
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    return 0;
}
