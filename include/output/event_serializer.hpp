#ifndef HVAULT_OUTPUT_EVENT_SERIALIZER_HPP
#define HVAULT_OUTPUT_EVENT_SERIALIZER_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace hvault {
namespace output {

// One event as emitted by the honeypot
using Record = nlohmann::json;

constexpr const char* FILE_DOWNLOAD_EVENT = "cowrie.session.file_download";
constexpr const char* FILE_UPLOAD_EVENT = "cowrie.session.file_upload";

enum class RecordKind {
  FileDownload,
  FileUpload,
  GenericEvent
};

// Classifies a record by its "eventid" field
RecordKind classify(const Record& entry);

// Logging framework leftovers: "log_*", "time" and "system"
bool is_transport_field(const std::string& name);

// Copy of an object record without transport fields
Record strip_transport_fields(const Record& entry);

// Compact JSON with sorted keys. Throws nlohmann::json::type_error when a
// value cannot be serialized (invalid UTF-8).
std::string canonical_json(const Record& entry);

// SHA-256 hex digest of canonical_json(entry)
std::string content_hash(const Record& entry);

// Best-effort rendering for log messages; never throws on bad strings
std::string describe(const Record& entry);

} // namespace output
} // namespace hvault

#endif // HVAULT_OUTPUT_EVENT_SERIALIZER_HPP
