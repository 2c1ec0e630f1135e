#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

WindowControl::Options Config::window_options() const {
    WindowControl::Options opts;
    opts.display = display;
    opts.main_window = main_window;
    opts.verbose = verbose;
    return opts;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("display")) cfg.display = j["display"].get<std::string>();
        if (j.contains("verbose")) cfg.verbose = j["verbose"].get<bool>();

        if (j.contains("main_window")) {
            auto name = j["main_window"].get<std::string>();
            if (auto policy = parse_main_window_policy(name)) {
                cfg.main_window = *policy;
            } else {
                std::println(stderr, "config: unknown main_window policy '{}', using {}",
                             name, to_string(cfg.main_window));
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
