#pragma once

#include <string>
#include <vector>

#include "wirebox/config/config.hpp"

namespace wirebox::di {

// Container configuration, read from the "container" section
class ContainerConfig : public config::ConfigurationProperties {
public:
    // Log every singleton materialization at trace level
    bool trace_resolution = false;

    // Providers skipped by the register and boot passes, by name
    std::vector<std::string> disabled_providers;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "container"; }
};

}  // namespace wirebox::di
