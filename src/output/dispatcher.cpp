#include "output/dispatcher.hpp"
#include "utils/temp_file.hpp"
#include <filesystem>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace hvault {
namespace output {

namespace {

// Non-empty string field or nullptr
const std::string* string_field(const Record& entry, const char* name) {
  auto field = entry.find(name);
  if (field == entry.end() || !field->is_string()) {
    return nullptr;
  }
  const auto& value = field->get_ref<const std::string&>();
  return value.empty() ? nullptr : &value;
}

} // namespace

std::string download_key(const std::string& prefix, const std::string& shasum) {
  return prefix + "downloads/" + shasum;
}

std::string upload_key(const std::string& prefix, const std::string& shasum) {
  return prefix + "uploads/" + shasum;
}

std::string event_key(const std::string& prefix, const std::string& session, const std::string& hash) {
  return prefix + "events/" + session + "-" + hash;
}


//==============================================
// CONSTRUCTOR
//==============================================

Dispatcher::Dispatcher(upload::Uploader& uploader, DispatchOptions options)
  : uploader_(uploader)
  , options_(std::move(options)) {}


//==============================================
// RECORD DISPATCH
//==============================================

Disposition Dispatcher::dispatch(const Record& entry, upload::UploadHandler on_done) {
  if (!entry.is_object()) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Dropping non-object record: " << describe(entry);
    return Disposition::Dropped;
  }

  const RecordKind kind = classify(entry);
  if (kind == RecordKind::GenericEvent) {
    return dispatch_event(entry, std::move(on_done));
  }
  return dispatch_file(entry, kind, std::move(on_done));
}

Disposition Dispatcher::dispatch_file(const Record& entry, RecordKind kind,
                                      upload::UploadHandler on_done) {
  const std::string* shasum = string_field(entry, "shasum");
  const std::string* outfile = string_field(entry, "outfile");
  if (!shasum || !outfile) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Dropping file record without shasum/outfile: " << describe(entry);
    return Disposition::Dropped;
  }

  const std::string key = kind == RecordKind::FileDownload
    ? download_key(options_.key_prefix, *shasum)
    : upload_key(options_.key_prefix, *shasum);

  uploader_.upload(key, *outfile, std::move(on_done));
  return Disposition::Queued;
}

Disposition Dispatcher::dispatch_event(const Record& entry, upload::UploadHandler on_done) {
  std::string line;
  std::string hash;
  try {
    line = canonical_json(strip_transport_fields(entry)) + "\n";
    // Hash covers the record as received, transport fields included
    hash = content_hash(entry);
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Can't serialize: '" << describe(entry) << "'";
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: error=" << e.what();
    return Disposition::Dropped;
  }

  const std::string* session = string_field(entry, "session");
  if (!session) {
    BOOST_LOG_TRIVIAL(debug) << "Dispatcher: Discarding event without session: " << describe(entry);
    return Disposition::Dropped;
  }

  std::filesystem::path staged;
  try {
    staged = utils::write_temp_file(options_.temp_dir, TEMP_FILE_PREFIX, line);
  } catch (const std::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Failed to stage event for session " << *session << ": " << e.what();
    return Disposition::Dropped;
  }

  uploader_.upload(event_key(options_.key_prefix, *session, hash), staged.string(), std::move(on_done));
  return Disposition::Queued;
}

} // namespace output
} // namespace hvault
