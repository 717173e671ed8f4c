#include "wirebox/log/log_config.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <stdexcept>

namespace wirebox::log {

LogLevel parse_level(const std::string& name) {
    const std::string lowered = boost::algorithm::to_lower_copy(name);

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::FATAL;

    throw std::invalid_argument("Invalid log level: " + name);
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "trace";
        case LogLevel::DEBUG:
            return "debug";
        case LogLevel::INFO:
            return "info";
        case LogLevel::WARN:
            return "warn";
        case LogLevel::ERROR:
            return "error";
        case LogLevel::FATAL:
            return "fatal";
    }
    return "unknown";
}

void LogConfig::from_ptree(const boost::property_tree::ptree& section) {
    if (auto name = get_optional_value<std::string>(section, "level")) {
        level = parse_level(*name);
    }

    if (auto node = section.get_child_optional("console")) {
        console.enabled = get_value(*node, "enabled", console.enabled);
        console.use_stderr = get_value(*node, "stderr", console.use_stderr);
        console.pattern = get_value(*node, "pattern", console.pattern);
    }

    if (auto node = section.get_child_optional("file")) {
        file.enabled = get_value(*node, "enabled", file.enabled);
        file.path = get_value(*node, "path", file.path);
        file.rotation_size =
            get_value(*node, "rotation_size", file.rotation_size);
        file.max_files = get_value(*node, "max_files", file.max_files);
        file.auto_flush = get_value(*node, "auto_flush", file.auto_flush);
        file.pattern = get_value(*node, "pattern", file.pattern);
    }
}

void LogConfig::validate() const {
    if (!file.enabled) {
        return;
    }
    if (file.path.empty()) {
        throw std::invalid_argument("log.file.path is required when file "
                                    "logging is enabled");
    }
    if (file.rotation_size == 0) {
        throw std::invalid_argument("log.file.rotation_size must be positive");
    }
    if (file.max_files <= 0) {
        throw std::invalid_argument("log.file.max_files must be positive");
    }
}

}  // namespace wirebox::log
