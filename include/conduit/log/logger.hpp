#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "conduit/log/log_config.hpp"

namespace conduit::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace conduit::log

#define CONDUIT_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define CONDUIT_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define CONDUIT_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define CONDUIT_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define CONDUIT_LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define CONDUIT_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define CONDUIT_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
