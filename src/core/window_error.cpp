#include "window_error.hpp"

#include <format>

std::string_view to_string(WindowErrorKind kind) {
    switch (kind) {
        case WindowErrorKind::Transport: return "transport";
        case WindowErrorKind::Property: return "property";
        case WindowErrorKind::InvalidHandle: return "invalid handle";
        case WindowErrorKind::PartialOperation: return "partial operation";
    }
    return "unknown";
}

std::string WindowError::describe() const {
    return std::format("{}: {}", to_string(kind), message);
}
