#pragma once

#include <array>
#include <ostream>
#include <string>
#include <string_view>

namespace tintlog::log {

// Ordered by increasing verbosity. A record is emitted when its level is
// less than or equal to the configured threshold.
enum class Level { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3, TRACE = 4 };

inline constexpr std::array<Level, 5> ALL_LEVELS = {
    Level::ERROR, Level::WARN, Level::INFO, Level::DEBUG, Level::TRACE};

constexpr bool is_enabled(Level incoming, Level threshold) noexcept {
    return static_cast<int>(incoming) <= static_cast<int>(threshold);
}

// Case-insensitive; throws ConfigError for anything but the five names.
Level level_from_string(std::string_view level_str);
std::string level_to_string(Level level);

// Fixed-width tag used in rendered lines ("ERROR", "WARN ", ...).
std::string_view level_tag(Level level) noexcept;

std::ostream& operator<<(std::ostream& os, Level level);

}  // namespace tintlog::log
