#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace hvault::logging {

namespace {

auto make_formatter() {
  namespace expr = boost::log::expressions;
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " " << expr::smessage;
}

} // namespace

void init_logging(const LogConfig& config) {
  namespace keywords = boost::log::keywords;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    if (config.file.empty()) {
      boost::log::add_console_log(
        std::clog,
        keywords::format = make_formatter(),
        keywords::auto_flush = true
      );
    } else {
      std::filesystem::path log_path = std::filesystem::absolute(config.file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }

      boost::log::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::format = make_formatter(),
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    boost::log::add_common_attributes();
    set_log_level(config.level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized ("
                           << (config.file.empty() ? std::string("console") : config.file) << ")";
}

void set_log_level(boost::log::trivial::severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  boost::log::trivial::severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

} // namespace hvault::logging
