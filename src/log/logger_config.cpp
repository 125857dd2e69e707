#include "tintlog/log/logger_config.hpp"

#include <algorithm>
#include <boost/property_tree/exceptions.hpp>
#include <cctype>
#include <cstdlib>
#include <utility>

#include "tintlog/log/errors.hpp"

namespace tintlog::log {

Preset preset_from_string(std::string_view preset_str) {
    std::string lower_preset(preset_str);
    std::transform(lower_preset.begin(), lower_preset.end(),
                   lower_preset.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_preset == "full") return Preset::FULL;
    if (lower_preset == "thread") return Preset::THREAD;
    if (lower_preset == "simple") return Preset::SIMPLE;

    throw ConfigError("Invalid logger preset '" + std::string(preset_str) +
                      "' (expected one of FULL, THREAD, SIMPLE)");
}

std::string preset_to_string(Preset preset) {
    switch (preset) {
        case Preset::FULL:
            return "FULL";
        case Preset::THREAD:
            return "THREAD";
        case Preset::SIMPLE:
            return "SIMPLE";
        default:
            return "UNKNOWN";
    }
}

std::ostream& operator<<(std::ostream& os, Preset preset) {
    return os << preset_to_string(preset);
}

std::vector<std::string> default_external_markers() {
    return {"third_party", "3rdparty", "vendor", "external",
            "extern",      "deps",     "_deps"};
}

void LoggerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    try {
        if (auto level_str = get_optional_value<std::string>(pt, "level"))
            level = level_from_string(*level_str);
        if (auto preset_str = get_optional_value<std::string>(pt, "preset"))
            preset = preset_from_string(*preset_str);
        if (auto color_str = get_optional_value<std::string>(pt, "color"))
            color = color_mode_from_string(*color_str);

        read_value(pt, "only_project_logs", only_project_logs);

        long long depth = static_cast<long long>(path_depth);
        read_value(pt, "path_depth", depth);
        if (depth < 0) {
            throw ConfigError("Logger path_depth must not be negative: " +
                              std::to_string(depth));
        }
        path_depth = static_cast<std::size_t>(depth);

        read_value(pt, "time_format", time_format);
        read_value(pt, "path_anchor", path_anchor);
        read_value(pt, "level_env", level_env);

        load_list(pt, "project_roots", project_roots);
        load_list(pt, "external_markers", external_markers);
    } catch (const boost::property_tree::ptree_error& e) {
        throw ConfigError(std::string("Invalid logger configuration: ") +
                          e.what());
    }
}

void LoggerConfig::validate() const {
    if (time_format.empty()) {
        throw ConfigError("Logger time_format cannot be empty");
    }

    for (const auto& marker : external_markers) {
        if (marker.empty()) {
            throw ConfigError("Logger external_markers cannot contain empty "
                              "entries");
        }
    }
}

Level LoggerConfig::effective_level() const {
    if (level_env.empty()) return level;

    const char* value = std::getenv(level_env.c_str());
    if (value == nullptr || value[0] == '\0') return level;

    try {
        return level_from_string(value);
    } catch (const ConfigError& e) {
        throw ConfigError("Environment variable " + level_env + ": " +
                          e.what());
    }
}

LoggerConfig load_logger_config(const std::string& config_file) {
    return load_logger_config(config_file,
                              config::format_from_path(config_file));
}

LoggerConfig load_logger_config(const std::string& config_file,
                                config::ConfigFormat format) {
    boost::property_tree::ptree tree;
    try {
        tree = config::load_property_tree(config_file, format);
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }

    LoggerConfig config;
    if (auto section = tree.get_child_optional(config.properties_name())) {
        config.from_ptree(*section);
    }
    config.validate();
    return config;
}

LoggerBuilder& LoggerBuilder::level(Level level) {
    config_.level = level;
    return *this;
}

LoggerBuilder& LoggerBuilder::level(std::string_view level) {
    config_.level = level_from_string(level);
    return *this;
}

LoggerBuilder& LoggerBuilder::only_project_logs(bool only_project_logs) {
    config_.only_project_logs = only_project_logs;
    return *this;
}

LoggerBuilder& LoggerBuilder::path_depth(std::size_t depth) {
    config_.path_depth = depth;
    return *this;
}

LoggerBuilder& LoggerBuilder::time_format(std::string format) {
    config_.time_format = std::move(format);
    return *this;
}

LoggerBuilder& LoggerBuilder::preset(Preset preset) {
    config_.preset = preset;
    return *this;
}

LoggerBuilder& LoggerBuilder::preset(std::string_view preset) {
    config_.preset = preset_from_string(preset);
    return *this;
}

LoggerBuilder& LoggerBuilder::path_anchor(std::string anchor) {
    config_.path_anchor = std::move(anchor);
    return *this;
}

LoggerBuilder& LoggerBuilder::project_root(std::string root) {
    config_.project_roots.push_back(std::move(root));
    return *this;
}

LoggerBuilder& LoggerBuilder::external_marker(std::string marker) {
    config_.external_markers.push_back(std::move(marker));
    return *this;
}

LoggerBuilder& LoggerBuilder::clear_external_markers() {
    config_.external_markers.clear();
    return *this;
}

LoggerBuilder& LoggerBuilder::color(ColorMode mode) {
    config_.color = mode;
    return *this;
}

LoggerBuilder& LoggerBuilder::color(std::string_view mode) {
    config_.color = color_mode_from_string(mode);
    return *this;
}

LoggerBuilder& LoggerBuilder::level_env(std::string variable) {
    config_.level_env = std::move(variable);
    return *this;
}

LoggerConfig LoggerBuilder::build() const {
    config_.validate();
    return config_;
}

}  // namespace tintlog::log
