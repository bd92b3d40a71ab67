#ifndef HVAULT_UPLOAD_UPLOADER_HPP
#define HVAULT_UPLOAD_UPLOADER_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include "store/object_store.hpp"
#include "upload/dedup_cache.hpp"
#include "upload/existence_checker.hpp"
#include "utils/blocking_runner.hpp"

namespace hvault {
namespace upload {

// Per-attempt state. Done and Failed are terminal.
enum class UploadState {
  NotChecked,
  Checking,
  Exists,
  NotExists,
  Uploading,
  Done,
  Failed
};

// How a Done attempt got there, or Failed
enum class UploadOutcome {
  SkippedSeen,
  AlreadyRemote,
  Uploaded,
  Failed
};

const char* to_string(UploadState state);
const char* to_string(UploadOutcome outcome);

struct UploadResult {
  std::string key;
  std::string file_path;
  UploadState state{UploadState::NotChecked};
  UploadOutcome outcome{UploadOutcome::Failed};
  std::size_t bytes{0};
  std::exception_ptr error;

  bool succeeded() const { return state == UploadState::Done; }
  // what() of the stored error, or an empty string
  std::string error_message() const;
};

using UploadHandler = std::function<void(const UploadResult&)>;

// The staged file could not be read for upload
class StagedFileError : public std::runtime_error {
public:
  explicit StagedFileError(const std::string& message) : std::runtime_error(message) {}
};

// Check-then-put state machine for content-addressed keys:
//   NotChecked -> Checking -> {Exists, NotExists} -> Uploading -> Done
// with Failed reachable from Checking and Uploading. Remote calls run on the
// blocking runner; all state changes happen on the event loop thread.
class Uploader {
public:
  static constexpr const char* CONTENT_TYPE = "application/octet-stream";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Uploader(store::ObjectStore& store, std::string bucket,
           utils::BlockingRunner& runner, DedupCache& cache);

  // Uploads file_path under key unless the key is known or found remotely.
  // Must be called on the event loop thread. on_done is invoked exactly once;
  // for a key already in the cache that happens before upload returns.
  // The staged file is deleted only after a successful put.
  void upload(const std::string& key, const std::string& file_path, UploadHandler on_done);

  const std::string& bucket() const { return bucket_; }

private:
  class Task;

  // ---- PARAMETERS ----
  store::ObjectStore& store_;
  std::string bucket_;
  utils::BlockingRunner& runner_;
  DedupCache& cache_;
  ExistenceChecker checker_;
};

} // namespace upload
} // namespace hvault

#endif // HVAULT_UPLOAD_UPLOADER_HPP
