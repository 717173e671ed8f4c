#include "wirebox/log/logger.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <iostream>

namespace logging = boost::log;
namespace keywords = boost::log::keywords;

namespace wirebox::log {

LogLevel Logger::level_ = LogLevel::INFO;
std::vector<boost::shared_ptr<logging::sinks::sink>> Logger::sinks_;

logging::trivial::severity_level to_severity(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return logging::trivial::trace;
        case LogLevel::DEBUG:
            return logging::trivial::debug;
        case LogLevel::INFO:
            return logging::trivial::info;
        case LogLevel::WARN:
            return logging::trivial::warning;
        case LogLevel::ERROR:
            return logging::trivial::error;
        case LogLevel::FATAL:
            return logging::trivial::fatal;
    }
    return logging::trivial::info;
}

void Logger::init(const LogConfig &config) {
    // Re-initialising replaces our own sinks instead of stacking them
    for (auto &sink : sinks_) {
        logging::core::get()->remove_sink(sink);
    }
    sinks_.clear();

    // %Severity% in patterns
    logging::register_simple_formatter_factory<logging::trivial::severity_level,
                                               char>("Severity");

    if (config.console.enabled) {
        std::ostream &stream = config.console.use_stderr ? std::cerr : std::cout;
        sinks_.push_back(logging::add_console_log(
            stream,
            keywords::format = logging::parse_formatter(config.console.pattern)));
    }

    if (config.file.enabled) {
        const boost::filesystem::path path(config.file.path);
        boost::filesystem::path directory = path.parent_path();
        if (directory.empty()) {
            directory = ".";
        }
        boost::filesystem::create_directories(directory);

        sinks_.push_back(logging::add_file_log(
            keywords::file_name = config.file.path,
            keywords::target = directory.string(),
            keywords::rotation_size = config.file.rotation_size,
            keywords::max_files = config.file.max_files,
            keywords::auto_flush = config.file.auto_flush,
            keywords::open_mode = std::ios_base::app,
            keywords::format = logging::parse_formatter(config.file.pattern)));
    }

    logging::add_common_attributes();
    set_level(config.level);

    WIREBOX_LOG_INFO << "Logger initialized with " << sinks_.size()
                     << " sink(s)";
}

void Logger::shutdown() {
    WIREBOX_LOG_INFO << "Logger shutting down";
    for (auto &sink : sinks_) {
        sink->flush();
        logging::core::get()->remove_sink(sink);
    }
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    level_ = level;
    logging::core::get()->set_filter(
        logging::expressions::attr<logging::trivial::severity_level>(
            "Severity") >= to_severity(level));
}

}  // namespace wirebox::log
