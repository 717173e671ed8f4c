#pragma once

#include <cstdint>
#include <string>

#include "wirebox/config/config.hpp"

namespace wirebox::log {

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Accepts the level names case-insensitively, plus "warning" and "critical".
// Throws std::invalid_argument for an unknown name.
LogLevel parse_level(const std::string& name);
const char* level_name(LogLevel level);

// The "log" configuration section:
//
//   log:
//     level: debug
//     console: { enabled: true, stderr: false, pattern: "..." }
//     file: { enabled: true, path: logs/app.log, rotation_size: 1048576 }
class LogConfig : public config::ConfigurationProperties {
public:
    struct Console {
        bool enabled = true;
        bool use_stderr = false;
        std::string pattern = "[%TimeStamp%] [%Severity%] %Message%";
    };

    struct File {
        bool enabled = false;
        std::string path = "logs/wirebox.log";
        std::uintmax_t rotation_size = 10 * 1024 * 1024;
        int max_files = 5;
        bool auto_flush = true;
        std::string pattern =
            "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";
    };

    LogLevel level = LogLevel::INFO;
    Console console;
    File file;

    void from_ptree(const boost::property_tree::ptree& section) override;
    void validate() const override;
    std::string properties_name() const override { return "log"; }
};

}  // namespace wirebox::log
