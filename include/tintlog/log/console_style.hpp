#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "tintlog/log/level.hpp"

namespace tintlog::log {

enum class ColorMode { AUTO, ALWAYS, NEVER };

ColorMode color_mode_from_string(std::string_view mode_str);
std::string color_mode_to_string(ColorMode mode);
std::ostream& operator<<(std::ostream& os, ColorMode mode);

enum class Color {
    RED,
    GREEN,
    YELLOW,
    BLUE,
    MAGENTA,
    CYAN,
    BRIGHT_GREEN,
    BRIGHT_BLUE
};

struct Style {
    Color color;
    bool bold = false;
};

Style level_style(Level level) noexcept;

// Appends `text` to `out`, wrapped in ANSI SGR codes when `enabled`.
void paint(std::string& out, std::string_view text, Style style,
           bool enabled);

// `stream_fd` is the descriptor behind the destination stream (1 or 2), or
// -1 for streams that are not a standard stream. AUTO never colors the
// latter.
bool should_colorize(ColorMode mode, int stream_fd);

}  // namespace tintlog::log
