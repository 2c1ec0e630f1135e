#pragma once

#include "window_selection.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct CliArgs {
    std::string config_path;
    std::optional<std::string> display;
    std::optional<MainWindowPolicy> policy;
    bool as_json = false;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> positional;  // command and its operand
};

// Parses everything after the program name. The error is a message for the user.
std::expected<CliArgs, std::string> parse_cli_args(const std::vector<std::string>& args);
