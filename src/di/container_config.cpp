#include "wirebox/di/container_config.hpp"

#include <stdexcept>

namespace wirebox::di {

void ContainerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    trace_resolution = get_value(pt, "trace_resolution", trace_resolution);
    load_vector(pt, "disabled_providers", disabled_providers);
}

void ContainerConfig::validate() const {
    for (const auto& name : disabled_providers) {
        if (name.empty()) {
            throw std::invalid_argument(
                "Disabled provider names cannot be empty");
        }
    }
}

}  // namespace wirebox::di
