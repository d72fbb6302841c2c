// src/triggers/command.hpp
#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace triggers {

/**
 * Command - Everything a trigger can ask for
 *
 * Dock/Undock/Verify/Abort are routed to a bay; Reboot/Rescan/Rediscover are
 * system-level and handled by the application.
 */
enum class Command {
    Dock,
    Undock,
    Verify,
    Abort,
    Reboot,
    Rescan,
    Rediscover
};

inline const char* to_string(Command c) {
    switch (c) {
        case Command::Dock:       return "dock";
        case Command::Undock:     return "undock";
        case Command::Verify:     return "verify";
        case Command::Abort:      return "abort";
        case Command::Reboot:     return "reboot";
        case Command::Rescan:     return "rescan";
        case Command::Rediscover: return "rediscover";
    }
    return "unknown";
}

inline bool is_system_command(Command c) {
    return c == Command::Reboot || c == Command::Rescan || c == Command::Rediscover;
}

inline bool is_bay_command(Command c) {
    return !is_system_command(c);
}

/**
 * parse_command() - Case-insensitive, surrounding whitespace ignored
 */
inline std::optional<Command> parse_command(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string s = text.substr(first, last - first + 1);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "dock")       return Command::Dock;
    if (s == "undock")     return Command::Undock;
    if (s == "verify")     return Command::Verify;
    if (s == "abort")      return Command::Abort;
    if (s == "reboot")     return Command::Reboot;
    if (s == "rescan")     return Command::Rescan;
    if (s == "rediscover") return Command::Rediscover;
    return std::nullopt;
}

} // namespace triggers
