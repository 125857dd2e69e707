#include "tintlog/log/level.hpp"

#include <algorithm>
#include <cctype>

#include "tintlog/log/errors.hpp"

namespace tintlog::log {

Level level_from_string(std::string_view level_str) {
    std::string lower_level(level_str);
    std::transform(lower_level.begin(), lower_level.end(), lower_level.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_level == "error") return Level::ERROR;
    if (lower_level == "warn") return Level::WARN;
    if (lower_level == "info") return Level::INFO;
    if (lower_level == "debug") return Level::DEBUG;
    if (lower_level == "trace") return Level::TRACE;

    throw ConfigError("Invalid log level '" + std::string(level_str) +
                      "' (expected one of error, warn, info, debug, trace)");
}

std::string level_to_string(Level level) {
    switch (level) {
        case Level::ERROR:
            return "error";
        case Level::WARN:
            return "warn";
        case Level::INFO:
            return "info";
        case Level::DEBUG:
            return "debug";
        case Level::TRACE:
            return "trace";
        default:
            return "unknown";
    }
}

std::string_view level_tag(Level level) noexcept {
    switch (level) {
        case Level::ERROR:
            return "ERROR";
        case Level::WARN:
            return "WARN ";
        case Level::INFO:
            return "INFO ";
        case Level::DEBUG:
            return "DEBUG";
        case Level::TRACE:
            return "TRACE";
        default:
            return "?????";
    }
}

std::ostream& operator<<(std::ostream& os, Level level) {
    return os << level_to_string(level);
}

}  // namespace tintlog::log
