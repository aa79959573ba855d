#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "confwire/log/log_config.hpp"

namespace confwire::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);
    static const LogConfig &config() { return config_; }

private:
    static void set_filter(LogConfig::LogLevel level);

    static LogConfig config_;
};

}  // namespace confwire::log

#define CONFWIRE_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define CONFWIRE_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define CONFWIRE_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define CONFWIRE_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define CONFWIRE_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define CONFWIRE_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
