#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/type_index.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace wirebox::config {

enum class ConfigFormat { YAML, JSON, INI };

// Picks the format from the file extension (.yaml/.yml, .json, .ini).
// Throws std::invalid_argument for anything else.
ConfigFormat format_from_path(const std::string& path);

// A typed view over one top-level section of the configuration tree.
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;

    // Called with the section subtree; absent keys keep their current value
    virtual void from_ptree(const boost::property_tree::ptree& section) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;

protected:
    template <typename T>
    static T get_value(const boost::property_tree::ptree& section,
                       const std::string& path, const T& fallback) {
        return section.get<T>(path, fallback);
    }

    template <typename T>
    static std::optional<T> get_optional_value(
        const boost::property_tree::ptree& section, const std::string& path) {
        if (auto value = section.get_optional<T>(path)) {
            return *value;
        }
        return std::nullopt;
    }

    // Replaces out with the sequence at path, if the path exists
    template <typename T>
    static bool load_vector(const boost::property_tree::ptree& section,
                            const std::string& path, std::vector<T>& out) {
        auto child = section.get_child_optional(path);
        if (!child) {
            return false;
        }
        out.clear();
        for (const auto& item : *child) {
            out.push_back(item.second.get_value<T>());
        }
        return true;
    }
};

// Process-wide configuration registry. Properties registered after a load
// are populated from the tree already loaded.
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager manager;
        return manager;
    }

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void load_config(const std::string& config_file, ConfigFormat format);
    void load_config(const std::string& config_file);
    void load_config_string(const std::string& content, ConfigFormat format);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> properties) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        if (loaded_) {
            apply(*properties);
        }
        by_type_[boost::typeindex::type_id<T>()] = properties;
        by_name_[properties->properties_name()] = properties;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        auto it = by_type_.find(boost::typeindex::type_id<T>());
        if (it == by_type_.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(it->second);
    }

    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const;

    // Drops every registration and the loaded tree
    void reset();

    const boost::property_tree::ptree& get_config_tree() const {
        return tree_;
    }

private:
    ConfigManager() = default;

    void install_tree(boost::property_tree::ptree tree,
                      const std::string& source);
    void apply(ConfigurationProperties& properties) const;

    static boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

    std::map<boost::typeindex::type_index,
             std::shared_ptr<ConfigurationProperties>>
        by_type_;
    std::map<std::string, std::shared_ptr<ConfigurationProperties>> by_name_;
    boost::property_tree::ptree tree_;
    bool loaded_ = false;
};

}  // namespace wirebox::config
