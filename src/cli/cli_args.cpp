#include "cli_args.hpp"

#include <format>

std::expected<CliArgs, std::string> parse_cli_args(const std::vector<std::string>& args) {
    CliArgs out;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        if (arg == "--config" || arg == "-c" || arg == "--display" || arg == "-d" || arg == "--policy") {
            auto v = value();
            if (!v) return std::unexpected(std::format("{} requires a value", arg));

            if (arg == "--policy") {
                out.policy = parse_main_window_policy(*v);
                if (!out.policy) return std::unexpected(std::format("Unknown policy: {}", *v));
            } else if (arg == "--display" || arg == "-d") {
                out.display = *v;
            } else {
                out.config_path = *v;
            }
        } else if (arg == "--json") {
            out.as_json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            out.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            out.help = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return std::unexpected(std::format("Unknown option: {}", arg));
        } else {
            out.positional.push_back(arg);
        }
    }
    return out;
}
