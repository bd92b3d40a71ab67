#include "store/directory_store.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace hvault {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DirectoryStore::DirectoryStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Directory store: Initializing store with base path: " << base_path;
  check_directory_exists(base_path_);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

ObjectStat DirectoryStore::head_object(const std::string& bucket, const std::string& key) {
  const std::filesystem::path file_path = resolve_key_path(bucket, key);

  std::error_code ec;
  const auto status = std::filesystem::status(file_path, ec);
  // A file where a parent directory would be just means this key is absent
  const bool missing = ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
  if (ec && !missing) {
    throw ObjectStoreError(0, "IOError", "Directory store: Cannot stat " + file_path.string() + ": " + ec.message());
  }
  if (missing || !std::filesystem::exists(status)) {
    BOOST_LOG_TRIVIAL(debug) << "Directory store: Key " << key << " not found at path: " << file_path.string();
    throw ObjectStoreError(404, "NoSuchKey", "Directory store: No such key: " + key);
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw ObjectStoreError(0, "InvalidObjectState", "Directory store: Not a regular file: " + file_path.string());
  }

  ObjectStat stat;
  stat.size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw ObjectStoreError(0, "IOError", "Directory store: Cannot stat " + file_path.string() + ": " + ec.message());
  }
  return stat;
}

void DirectoryStore::put_object(const std::string& bucket, const std::string& key,
                                const std::string& body, const std::string& content_type) {
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Storing " << body.size() << " bytes (" << content_type
                           << ") with key: " << key;

  const std::filesystem::path file_path = resolve_key_path(bucket, key);

  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp-" + std::to_string(::getpid()) + "-" + std::to_string(sequence_++);

  try {
    check_directory_exists(file_path.parent_path());

    // Open output file in binary mode so payloads are stored byte for byte
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw ObjectStoreError(0, "IOError", "Directory store: Failed to create file: " + temp_path.string());
    }
    file.write(body.data(), static_cast<std::streamsize>(body.size()));
    file.close();
    if (!file) {
      throw ObjectStoreError(0, "IOError", "Directory store: Failed to write file: " + temp_path.string());
    }

    std::filesystem::rename(temp_path, file_path);
  } catch (const std::filesystem::filesystem_error& e) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to store key " << key << ": " << e.what();
    throw ObjectStoreError(0, "IOError", std::string("Directory store: ") + e.what());
  } catch (const ObjectStoreError&) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Directory store: Successfully stored " << body.size() << " bytes with key: " << key;
}

void DirectoryStore::get_object(const std::string& bucket, const std::string& key,
                                std::ostream& output) const {
  const std::filesystem::path file_path = resolve_key_path(bucket, key);
  if (!std::filesystem::exists(file_path)) {
    throw ObjectStoreError(404, "NoSuchKey", "Directory store: No such key: " + key);
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw ObjectStoreError(0, "IOError", "Directory store: Failed to open file: " + file_path.string());
  }

  char buffer[4096];
  // Read file in chunks to handle large files efficiently
  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
  }
  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
  }
}

void DirectoryStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Directory store: Clearing entire store at: " << base_path_;
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}


//==============================================
// UTILITY METHODS
//==============================================

void DirectoryStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path DirectoryStore::resolve_key_path(const std::string& bucket,
                                                       const std::string& key) const {
  if (bucket.empty() || bucket.find('/') != std::string::npos || bucket == "." || bucket == "..") {
    throw ObjectStoreError(400, "InvalidBucketName", "Directory store: Invalid bucket name: " + bucket);
  }

  std::filesystem::path path = base_path_ / bucket;

  std::stringstream segments(key);
  std::string segment;
  bool any = false;
  while (std::getline(segments, segment, '/')) {
    if (segment.empty() || segment == "." || segment == "..") {
      throw ObjectStoreError(400, "InvalidKey", "Directory store: Invalid key: " + key);
    }
    path /= segment;
    any = true;
  }
  if (!any || key.back() == '/') {
    throw ObjectStoreError(400, "InvalidKey", "Directory store: Invalid key: " + key);
  }
  return path;
}

} // namespace store
} // namespace hvault
