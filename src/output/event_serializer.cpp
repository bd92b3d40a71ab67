#include "output/event_serializer.hpp"
#include "crypto/digest.hpp"

namespace hvault {
namespace output {

RecordKind classify(const Record& entry) {
  if (!entry.is_object()) {
    return RecordKind::GenericEvent;
  }
  auto eventid = entry.find("eventid");
  if (eventid == entry.end() || !eventid->is_string()) {
    return RecordKind::GenericEvent;
  }

  const auto& id = eventid->get_ref<const std::string&>();
  if (id == FILE_DOWNLOAD_EVENT) {
    return RecordKind::FileDownload;
  }
  if (id == FILE_UPLOAD_EVENT) {
    return RecordKind::FileUpload;
  }
  return RecordKind::GenericEvent;
}

bool is_transport_field(const std::string& name) {
  return name.rfind("log_", 0) == 0 || name == "time" || name == "system";
}

Record strip_transport_fields(const Record& entry) {
  Record stripped = Record::object();
  for (const auto& item : entry.items()) {
    if (!is_transport_field(item.key())) {
      stripped[item.key()] = item.value();
    }
  }
  return stripped;
}

std::string canonical_json(const Record& entry) {
  // object_t is an ordered map, so keys come out sorted
  return entry.dump();
}

std::string content_hash(const Record& entry) {
  return crypto::sha256_hex(canonical_json(entry));
}

std::string describe(const Record& entry) {
  return entry.dump(-1, ' ', false, Record::error_handler_t::replace);
}

} // namespace output
} // namespace hvault
