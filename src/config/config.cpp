#include "tintlog/config/config.hpp"

#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace tintlog::config {

ConfigFormat format_from_path(const std::string& config_file) {
    std::string extension = std::filesystem::path(config_file).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (extension == ".json") return ConfigFormat::JSON;
    if (extension == ".ini") return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

// Helper to convert YAML::Node to boost::property_tree::ptree
boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.push_back({"", yaml_to_ptree(*it)});  // Empty key for array elements
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree load_property_tree(const std::string& config_file,
                                               ConfigFormat format) {
    boost::property_tree::ptree config_tree;
    try {
        switch (format) {
            case ConfigFormat::YAML: {
                YAML::Node yaml_node = YAML::LoadFile(config_file);
                config_tree = yaml_to_ptree(yaml_node);
                break;
            }
            case ConfigFormat::JSON:
                boost::property_tree::read_json(config_file, config_tree);
                break;
            case ConfigFormat::INI:
                boost::property_tree::read_ini(config_file, config_tree);
                break;
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
    return config_tree;
}

void ConfigurationProperties::load_list(const boost::property_tree::ptree& pt,
                                        const std::string& path,
                                        std::vector<std::string>& vec) const {
    auto child_pt = pt.get_child_optional(path);
    if (!child_pt) return;

    vec.clear();
    if (!child_pt->empty()) {
        for (const auto& v : *child_pt) {
            vec.push_back(v.second.get_value<std::string>());
        }
        return;
    }

    std::vector<std::string> parts;
    const auto scalar = child_pt->get_value<std::string>();
    boost::algorithm::split(parts, scalar, boost::algorithm::is_any_of(","));
    for (auto& part : parts) {
        boost::algorithm::trim(part);
        if (!part.empty()) vec.push_back(std::move(part));
    }
}

}  // namespace tintlog::config
