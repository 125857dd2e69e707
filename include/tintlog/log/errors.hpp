#pragma once

#include <stdexcept>
#include <string>

namespace tintlog::log {

// Malformed logger configuration (unknown level/preset/color name, empty
// time format, unreadable config file).
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// init_logger() called after the process-wide logger was already installed.
class InitError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace tintlog::log
