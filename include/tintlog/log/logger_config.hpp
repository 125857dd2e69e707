#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "tintlog/config/config.hpp"
#include "tintlog/log/console_style.hpp"
#include "tintlog/log/level.hpp"

namespace tintlog::log {

// Fields included in a rendered line.
//   FULL   - timestamp, level, thread, location, message
//   THREAD - level, thread, location, message
//   SIMPLE - level, message
enum class Preset { FULL, THREAD, SIMPLE };

Preset preset_from_string(std::string_view preset_str);
std::string preset_to_string(Preset preset);
std::ostream& operator<<(std::ostream& os, Preset preset);

std::vector<std::string> default_external_markers();

class LoggerConfig : public config::ConfigurationProperties {
public:
    Level level = Level::INFO;
    bool only_project_logs = false;
    std::size_t path_depth = 2;
    std::string time_format = "%Y-%m-%d %H:%M:%S";
    Preset preset = Preset::FULL;

    // Displayed paths start at this directory when present; empty disables.
    std::string path_anchor = "src";
    std::vector<std::string> project_roots;
    std::vector<std::string> external_markers = default_external_markers();
    ColorMode color = ColorMode::AUTO;
    // Name of an environment variable overriding `level`; empty disables.
    std::string level_env;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "logger"; }

    // `level`, or the parsed value of the `level_env` variable when it is
    // set. Throws ConfigError for an unparsable override.
    Level effective_level() const;
};

// Reads the "logger" section of a YAML, JSON or INI file. A file without
// that section yields the defaults. Throws ConfigError.
LoggerConfig load_logger_config(const std::string& config_file);
LoggerConfig load_logger_config(const std::string& config_file,
                                config::ConfigFormat format);

class LoggerBuilder {
public:
    LoggerBuilder() = default;

    LoggerBuilder& level(Level level);
    LoggerBuilder& level(std::string_view level);
    LoggerBuilder& only_project_logs(bool only_project_logs);
    LoggerBuilder& path_depth(std::size_t depth);
    LoggerBuilder& time_format(std::string format);
    LoggerBuilder& preset(Preset preset);
    LoggerBuilder& preset(std::string_view preset);

    LoggerBuilder& path_anchor(std::string anchor);
    LoggerBuilder& project_root(std::string root);
    LoggerBuilder& external_marker(std::string marker);
    LoggerBuilder& clear_external_markers();
    LoggerBuilder& color(ColorMode mode);
    LoggerBuilder& color(std::string_view mode);
    LoggerBuilder& level_env(std::string variable);

    LoggerConfig build() const;

private:
    LoggerConfig config_;
};

}  // namespace tintlog::log
