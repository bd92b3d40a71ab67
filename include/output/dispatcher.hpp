#ifndef HVAULT_OUTPUT_DISPATCHER_HPP
#define HVAULT_OUTPUT_DISPATCHER_HPP

#include <string>
#include "output/event_serializer.hpp"
#include "upload/uploader.hpp"

namespace hvault {
namespace output {

// Whether dispatch handed the record to the uploader
enum class Disposition {
  Queued,
  Dropped
};

struct DispatchOptions {
  // Prepended to every content key
  std::string key_prefix;
  // Directory for staged event files, system default when empty
  std::string temp_dir;
};

// Content keys: {prefix}downloads/{hash}, {prefix}uploads/{hash},
// {prefix}events/{session}-{hash}
std::string download_key(const std::string& prefix, const std::string& shasum);
std::string upload_key(const std::string& prefix, const std::string& shasum);
std::string event_key(const std::string& prefix, const std::string& session, const std::string& hash);

// Turns records into (content key, staged file) pairs for the uploader.
// Malformed and unattributable records are logged and dropped, never thrown.
class Dispatcher {
public:
  static constexpr const char* TEMP_FILE_PREFIX = "hvault-event-";

  Dispatcher(upload::Uploader& uploader, DispatchOptions options);

  // on_done is invoked once with the upload result when the record is Queued
  Disposition dispatch(const Record& entry, upload::UploadHandler on_done);

private:
  upload::Uploader& uploader_;
  DispatchOptions options_;

  Disposition dispatch_file(const Record& entry, RecordKind kind, upload::UploadHandler on_done);
  Disposition dispatch_event(const Record& entry, upload::UploadHandler on_done);
};

} // namespace output
} // namespace hvault

#endif // HVAULT_OUTPUT_DISPATCHER_HPP
