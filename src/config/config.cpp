#include "config/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace hvault {
namespace config {

namespace {

constexpr const char* STORE_SECTION = "output_s3";
constexpr const char* LOGGING_SECTION = "logging";
constexpr std::size_t MAX_WORKER_THREADS = 64;
constexpr const char* DEFAULT_ENDPOINT_REGION = "us-east-1";

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::optional<std::string> get_string(const boost::property_tree::ptree& tree,
                                      const std::string& section, const std::string& key) {
  auto value = tree.get_optional<std::string>(boost::property_tree::ptree::path_type(section + "." + key));
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return *value;
}

unsigned long get_number(const boost::property_tree::ptree& tree, const std::string& section,
                         const std::string& key, unsigned long fallback) {
  auto value = get_string(tree, section, key);
  if (!value) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    unsigned long number = std::stoul(*value, &consumed);
    if (consumed != value->size()) {
      throw std::invalid_argument("trailing characters");
    }
    return number;
  } catch (const std::exception&) {
    throw ConfigError("Config: " + section + "." + key + " is not a number: " + *value);
  }
}

} // namespace

bool parse_bool(const std::string& value) {
  const std::string v = lowercase(value);
  if (v == "1" || v == "yes" || v == "true" || v == "on") {
    return true;
  }
  if (v == "0" || v == "no" || v == "false" || v == "off") {
    return false;
  }
  throw ConfigError("Config: Not a boolean: " + value);
}

Config parse_config(std::istream& input) {
  boost::property_tree::ptree tree;
  try {
    boost::property_tree::ini_parser::read_ini(input, tree);
  } catch (const boost::property_tree::ini_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to parse configuration: " << e.what();
    throw ConfigError(std::string("Config: Invalid INI: ") + e.what());
  }

  Config config;

  // ---- [output_s3] ----
  auto bucket = get_string(tree, STORE_SECTION, "bucket");
  if (!bucket) {
    throw ConfigError("Config: output_s3.bucket is required");
  }
  config.store.bucket = *bucket;
  config.store.endpoint = get_string(tree, STORE_SECTION, "endpoint");

  if (auto region = get_string(tree, STORE_SECTION, "region")) {
    config.store.region = *region;
  } else if (config.store.endpoint) {
    config.store.region = DEFAULT_ENDPOINT_REGION;
  } else {
    throw ConfigError("Config: output_s3.region is required when no endpoint is set");
  }

  if (auto verify = get_string(tree, STORE_SECTION, "verify")) {
    config.store.verify = parse_bool(*verify);
  }

  auto access_key_id = get_string(tree, STORE_SECTION, "access_key_id");
  auto secret_access_key = get_string(tree, STORE_SECTION, "secret_access_key");
  if (access_key_id && secret_access_key) {
    config.store.access_key_id = *access_key_id;
    config.store.secret_access_key = *secret_access_key;
  } else {
    BOOST_LOG_TRIVIAL(info) << "Config: No AWS credentials found in config - using environment settings";
  }

  config.store.timeout_seconds = static_cast<unsigned>(
    get_number(tree, STORE_SECTION, "timeout_seconds", config.store.timeout_seconds));
  if (config.store.timeout_seconds == 0) {
    throw ConfigError("Config: output_s3.timeout_seconds must be positive");
  }

  config.output.key_prefix = get_string(tree, STORE_SECTION, "key_prefix").value_or("");
  config.output.temp_dir = get_string(tree, STORE_SECTION, "temp_dir").value_or("");
  config.output.worker_threads =
    get_number(tree, STORE_SECTION, "worker_threads", config.output.worker_threads);
  if (config.output.worker_threads == 0 || config.output.worker_threads > MAX_WORKER_THREADS) {
    throw ConfigError("Config: output_s3.worker_threads must be between 1 and " +
                      std::to_string(MAX_WORKER_THREADS));
  }

  // ---- [logging] ----
  if (auto level = get_string(tree, LOGGING_SECTION, "level")) {
    try {
      config.logging.level = logging::parse_severity(lowercase(*level));
    } catch (const std::invalid_argument& e) {
      throw ConfigError(std::string("Config: ") + e.what());
    }
  }
  config.logging.file = get_string(tree, LOGGING_SECTION, "file").value_or("");

  BOOST_LOG_TRIVIAL(debug) << "Config: Loaded configuration for bucket " << config.store.bucket
                           << " (region " << config.store.region << ")";
  return config;
}

Config load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading configuration from " << path;

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to open configuration file: " << path;
    throw ConfigError("Config: Cannot open " + path);
  }
  return parse_config(file);
}

} // namespace config
} // namespace hvault
