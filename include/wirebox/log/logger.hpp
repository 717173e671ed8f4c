#pragma once
#include <boost/log/sinks/sink.hpp>
#include <boost/log/trivial.hpp>
#include <boost/shared_ptr.hpp>
#include <vector>

#include "wirebox/log/log_config.hpp"

namespace wirebox::log {

boost::log::trivial::severity_level to_severity(LogLevel level);

// Sets up the Boost.Log core from a LogConfig. Only the sinks installed by
// init() are removed by shutdown(); sinks added elsewhere are left alone.
class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();

    static void set_level(LogLevel level);
    static LogLevel level() { return level_; }

private:
    static LogLevel level_;
    static std::vector<boost::shared_ptr<boost::log::sinks::sink>> sinks_;
};

}  // namespace wirebox::log

#define WIREBOX_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define WIREBOX_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define WIREBOX_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define WIREBOX_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define WIREBOX_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define WIREBOX_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
