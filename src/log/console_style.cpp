#include "tintlog/log/console_style.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

#include "tintlog/log/errors.hpp"

namespace tintlog::log {

namespace {

const char* color_code(Color color) {
    switch (color) {
        case Color::RED:
            return "31";
        case Color::GREEN:
            return "32";
        case Color::YELLOW:
            return "33";
        case Color::BLUE:
            return "34";
        case Color::MAGENTA:
            return "35";
        case Color::CYAN:
            return "36";
        case Color::BRIGHT_GREEN:
            return "92";
        case Color::BRIGHT_BLUE:
            return "94";
        default:
            return "39";
    }
}

bool env_set(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
}

}  // namespace

ColorMode color_mode_from_string(std::string_view mode_str) {
    std::string lower_mode(mode_str);
    std::transform(lower_mode.begin(), lower_mode.end(), lower_mode.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_mode == "auto") return ColorMode::AUTO;
    if (lower_mode == "always") return ColorMode::ALWAYS;
    if (lower_mode == "never") return ColorMode::NEVER;

    throw ConfigError("Invalid color mode '" + std::string(mode_str) +
                      "' (expected one of auto, always, never)");
}

std::string color_mode_to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::AUTO:
            return "auto";
        case ColorMode::ALWAYS:
            return "always";
        case ColorMode::NEVER:
            return "never";
        default:
            return "unknown";
    }
}

std::ostream& operator<<(std::ostream& os, ColorMode mode) {
    return os << color_mode_to_string(mode);
}

Style level_style(Level level) noexcept {
    switch (level) {
        case Level::ERROR:
            return {Color::RED, true};
        case Level::WARN:
            return {Color::YELLOW, true};
        case Level::INFO:
            return {Color::GREEN, true};
        case Level::DEBUG:
            return {Color::BLUE, true};
        case Level::TRACE:
        default:
            return {Color::MAGENTA, true};
    }
}

void paint(std::string& out, std::string_view text, Style style,
           bool enabled) {
    if (!enabled) {
        out.append(text);
        return;
    }
    out.append("\033[");
    if (style.bold) out.append("1;");
    out.append(color_code(style.color));
    out.push_back('m');
    out.append(text);
    out.append("\033[0m");
}

bool should_colorize(ColorMode mode, int stream_fd) {
    switch (mode) {
        case ColorMode::ALWAYS:
            return true;
        case ColorMode::NEVER:
            return false;
        case ColorMode::AUTO:
        default:
            break;
    }

    if (stream_fd < 0) return false;
    if (env_set("NO_COLOR")) return false;

    const char* force = std::getenv("CLICOLOR_FORCE");
    if (force != nullptr && force[0] != '\0' && std::strcmp(force, "0") != 0)
        return true;

    const char* term = std::getenv("TERM");
    if (term != nullptr && std::strcmp(term, "dumb") == 0) return false;

    return ::isatty(stream_fd) == 1;
}

}  // namespace tintlog::log
