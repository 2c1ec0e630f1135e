#include "window_info.hpp"

#include <charconv>
#include <format>
#include <limits>

WindowInfo WindowInfo::from_rect(int32_t left, int32_t top, int32_t right, int32_t bottom) {
    WindowInfo info;
    info.x = left;
    info.y = top;
    int64_t w = static_cast<int64_t>(right) - left;
    int64_t h = static_cast<int64_t>(bottom) - top;
    info.width = w > 0 ? static_cast<uint32_t>(w) : 0;
    info.height = h > 0 ? static_cast<uint32_t>(h) : 0;
    return info;
}

namespace {

std::optional<uint64_t> parse_unsigned(std::string_view text) {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty()) return std::nullopt;

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

} // namespace

std::optional<WindowHandle> parse_window_handle(std::string_view text) {
    auto value = parse_unsigned(text);
    if (!value || *value == 0) return std::nullopt;
    return WindowHandle{*value};
}

std::optional<ProcessId> parse_process_id(std::string_view text) {
    auto value = parse_unsigned(text);
    if (!value || *value > std::numeric_limits<ProcessId>::max()) return std::nullopt;
    return static_cast<ProcessId>(*value);
}

std::string format_window_handle(WindowHandle window) {
    return std::format("0x{:x}", window.id);
}
