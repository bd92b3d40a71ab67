#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include "store/object_store.hpp"

namespace hvault {
namespace store {

// Object store backed by a local directory tree: {base_path}/{bucket}/{key}.
// Selected with a "file:///dir" endpoint, for offline capture and tests.
class DirectoryStore : public ObjectStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DirectoryStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  ObjectStat head_object(const std::string& bucket, const std::string& key) override;
  // Writes through a temporary file and renames it into place
  void put_object(const std::string& bucket, const std::string& key,
                  const std::string& body, const std::string& content_type) override;
  // Streams a stored object into output
  void get_object(const std::string& bucket, const std::string& key, std::ostream& output) const;
  // Removes all stored data and reset store
  void clear();


  // ---- GETTERS ----
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all buckets
  std::filesystem::path base_path_;
  // Distinguishes concurrent temporary files
  std::atomic<std::uint64_t> sequence_{0};


  // ---- QUERY OPERATIONS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Maps bucket/key to a path under base_path_, rejecting traversal and empty segments
  std::filesystem::path resolve_key_path(const std::string& bucket, const std::string& key) const;
};

} // namespace store
} // namespace hvault
