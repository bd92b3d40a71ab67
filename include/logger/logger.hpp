#ifndef HVAULT_LOGGER_HPP
#define HVAULT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace hvault::logging {

struct LogConfig {
  // Minimum severity that reaches the sinks
  boost::log::trivial::severity_level level = boost::log::trivial::info;
  // Empty means log to the console (std::clog)
  std::string file;
};

// Installs a console or rotating file sink and applies the severity filter.
// Any previously installed sinks are removed.
void init_logging(const LogConfig& config);

// Changes the minimum severity at runtime
void set_log_level(boost::log::trivial::severity_level level);

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a severity.
// Throws std::invalid_argument for anything else.
boost::log::trivial::severity_level parse_severity(const std::string& name);

} // namespace hvault::logging

#endif // HVAULT_LOGGER_HPP
