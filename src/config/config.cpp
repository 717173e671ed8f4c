#include "wirebox/config/config.hpp"

#include <algorithm>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "wirebox/log/logger.hpp"

namespace wirebox::config {

namespace pt = boost::property_tree;

ConfigFormat format_from_path(const std::string& path) {
    const auto dot = path.find_last_of('.');
    std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == "yaml" || ext == "yml") return ConfigFormat::YAML;
    if (ext == "json") return ConfigFormat::JSON;
    if (ext == "ini") return ConfigFormat::INI;

    throw std::invalid_argument("Unknown config file extension: " + path);
}

pt::ptree ConfigManager::yaml_to_ptree(const YAML::Node& node) {
    pt::ptree tree;
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                tree.add_child(entry.first.as<std::string>(),
                               yaml_to_ptree(entry.second));
            }
            break;
        case YAML::NodeType::Sequence:
            // Sequence items become children with empty keys, as read_json
            // produces for arrays
            for (const auto& item : node) {
                tree.push_back(std::make_pair("", yaml_to_ptree(item)));
            }
            break;
        case YAML::NodeType::Scalar:
            tree.put_value(node.Scalar());
            break;
        default:
            break;
    }
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    WIREBOX_LOG_INFO << "Loading config file: " << config_file;

    pt::ptree tree;
    try {
        switch (format) {
            case ConfigFormat::YAML:
                tree = yaml_to_ptree(YAML::LoadFile(config_file));
                break;
            case ConfigFormat::JSON:
                pt::read_json(config_file, tree);
                break;
            case ConfigFormat::INI:
                pt::read_ini(config_file, tree);
                break;
        }
    } catch (const std::exception& e) {
        WIREBOX_LOG_ERROR << "Failed to load config file: " << config_file
                          << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }

    install_tree(std::move(tree), config_file);
}

void ConfigManager::load_config(const std::string& config_file) {
    load_config(config_file, format_from_path(config_file));
}

void ConfigManager::load_config_string(const std::string& content,
                                       ConfigFormat format) {
    pt::ptree tree;
    try {
        std::istringstream input(content);
        switch (format) {
            case ConfigFormat::YAML:
                tree = yaml_to_ptree(YAML::Load(input));
                break;
            case ConfigFormat::JSON:
                pt::read_json(input, tree);
                break;
            case ConfigFormat::INI:
                pt::read_ini(input, tree);
                break;
        }
    } catch (const std::exception& e) {
        WIREBOX_LOG_ERROR << "Failed to parse inline config: " << e.what();
        throw std::runtime_error(std::string("Failed to parse inline config: ") +
                                 e.what());
    }

    install_tree(std::move(tree), "<inline>");
}

std::shared_ptr<ConfigurationProperties> ConfigManager::get_config_by_name(
    const std::string& name) const {
    auto it = by_name_.find(name);
    return it != by_name_.end() ? it->second : nullptr;
}

void ConfigManager::reset() {
    by_type_.clear();
    by_name_.clear();
    tree_.clear();
    loaded_ = false;
}

void ConfigManager::install_tree(pt::ptree tree, const std::string& source) {
    tree_ = std::move(tree);
    loaded_ = true;

    for (auto& [name, properties] : by_name_) {
        apply(*properties);
    }

    WIREBOX_LOG_INFO << "Applied configuration from " << source << " to "
                     << by_name_.size() << " properties";
}

void ConfigManager::apply(ConfigurationProperties& properties) const {
    const std::string name = properties.properties_name();

    auto section = tree_.get_child_optional(name);
    if (!section) {
        WIREBOX_LOG_DEBUG << "No '" << name << "' section, keeping defaults";
        return;
    }

    try {
        properties.from_ptree(*section);
        properties.validate();
    } catch (const std::exception& e) {
        WIREBOX_LOG_ERROR << "Invalid '" << name
                          << "' configuration: " << e.what();
        throw;
    }
    WIREBOX_LOG_DEBUG << "Loaded '" << name << "' configuration";
}

}  // namespace wirebox::config
