#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tintlog::config {

enum class ConfigFormat { YAML, JSON, INI };

// Picks the format from the file extension (.json, .ini, .yaml/.yml);
// anything else is read as YAML.
ConfigFormat format_from_path(const std::string& config_file);

boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

// Throws std::runtime_error naming the file when it cannot be read or
// parsed.
boost::property_tree::ptree load_property_tree(const std::string& config_file,
                                               ConfigFormat format);

// Base class for a configuration section read from a property tree.
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;

protected:
    // Overwrites `target` only when the key is present. Throws
    // boost::property_tree::ptree_bad_data when the value does not convert.
    template <typename T>
    void read_value(const boost::property_tree::ptree& pt,
                    const std::string& path, T& target) const {
        if (pt.get_child_optional(path)) target = pt.get<T>(path);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) const {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }

    // Accepts a sequence node (YAML/JSON) or a comma separated scalar (INI).
    // Leaves `vec` untouched when the key is absent.
    void load_list(const boost::property_tree::ptree& pt,
                   const std::string& path,
                   std::vector<std::string>& vec) const;
};

}  // namespace tintlog::config
