#pragma once

#include <string>
#include <vector>

namespace utils {

// Single-quotes an argument for /bin/sh
inline std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

inline std::string joinCommand(const std::vector<std::string>& args) {
    std::string command;
    for (const auto& arg : args) {
        if (!command.empty()) {
            command += ' ';
        }
        command += shellQuote(arg);
    }
    return command;
}

} // namespace utils
