#pragma once

#include <string>
#include <string_view>
#include <utility>

enum class WindowErrorKind {
    Transport,        // display connection could not be opened or broke
    Property,         // property missing/malformed, or request rejected
    InvalidHandle,    // window no longer exists
    PartialOperation, // multi-step mutation stopped after a step was applied
};

struct WindowError {
    WindowErrorKind kind;
    std::string message;

    static WindowError transport(std::string msg) { return {WindowErrorKind::Transport, std::move(msg)}; }
    static WindowError property(std::string msg) { return {WindowErrorKind::Property, std::move(msg)}; }
    static WindowError invalid_handle(std::string msg) { return {WindowErrorKind::InvalidHandle, std::move(msg)}; }
    static WindowError partial(std::string msg) { return {WindowErrorKind::PartialOperation, std::move(msg)}; }

    // "<kind>: <message>"
    std::string describe() const;
};

std::string_view to_string(WindowErrorKind kind);
