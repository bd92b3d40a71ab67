#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"

namespace hvault {
namespace config {

// Where and how artifacts are stored
struct StoreConfig {
  std::string bucket;
  std::string region;
  // Custom S3 endpoint ("https://host:port") or "file:///dir" for a local directory store
  std::optional<std::string> endpoint;
  bool verify{true};
  std::string access_key_id;
  std::string secret_access_key;
  unsigned timeout_seconds{30};

  bool has_static_credentials() const {
    return !access_key_id.empty() && !secret_access_key.empty();
  }
};

// Dispatch and upload pipeline settings
struct OutputConfig {
  std::string key_prefix;
  // Empty means the system temporary directory
  std::string temp_dir;
  std::size_t worker_threads{4};
};

struct Config {
  StoreConfig store;
  OutputConfig output;
  logging::LogConfig logging;
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// ---- LOADING ----
// Reads an INI file with [output_s3] and [logging] sections
Config load_config(const std::string& path);
// Parses INI text from a stream
Config parse_config(std::istream& input);

// Accepts 1/yes/true/on and 0/no/false/off, case-insensitive
bool parse_bool(const std::string& value);

} // namespace config
} // namespace hvault
