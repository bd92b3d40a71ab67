#include "upload/uploader.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace hvault {
namespace upload {

namespace {

// Reads the whole staged file into memory
std::string read_staged_file(const std::string& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StagedFileError("Uploader: Failed to open staged file: " + file_path);
  }

  std::string content;
  char buffer[4096];
  while (file.read(buffer, sizeof(buffer))) {
    content.append(buffer, static_cast<std::size_t>(file.gcount()));
  }
  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    content.append(buffer, static_cast<std::size_t>(file.gcount()));
  }
  if (file.bad()) {
    throw StagedFileError("Uploader: Failed to read staged file: " + file_path);
  }
  return content;
}

} // namespace

const char* to_string(UploadState state) {
  switch (state) {
    case UploadState::NotChecked: return "NotChecked";
    case UploadState::Checking:   return "Checking";
    case UploadState::Exists:     return "Exists";
    case UploadState::NotExists:  return "NotExists";
    case UploadState::Uploading:  return "Uploading";
    case UploadState::Done:       return "Done";
    case UploadState::Failed:     return "Failed";
    default:                      return "Unknown";
  }
}

const char* to_string(UploadOutcome outcome) {
  switch (outcome) {
    case UploadOutcome::SkippedSeen:   return "SkippedSeen";
    case UploadOutcome::AlreadyRemote: return "AlreadyRemote";
    case UploadOutcome::Uploaded:      return "Uploaded";
    case UploadOutcome::Failed:        return "Failed";
    default:                           return "Unknown";
  }
}

std::string UploadResult::error_message() const {
  if (!error) {
    return "";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}


//==============================================
// UPLOAD TASK
//==============================================

// One upload attempt. Kept alive by the completion handlers it hands to the
// runner until it reaches Done or Failed.
class Uploader::Task : public std::enable_shared_from_this<Uploader::Task> {
public:
  Task(Uploader& uploader, const std::string& key, const std::string& file_path, UploadHandler on_done)
    : uploader_(uploader)
    , on_done_(std::move(on_done)) {
    result_.key = key;
    result_.file_path = file_path;
  }

  void start() {
    if (uploader_.cache_.seen(result_.key)) {
      BOOST_LOG_TRIVIAL(info) << "Uploader: Already uploaded " << result_.key
                              << ", skipping (staged file kept: " << result_.file_path << ")";
      finish(UploadOutcome::SkippedSeen);
      return;
    }

    transition(UploadState::Checking);
    auto self = shared_from_this();
    uploader_.checker_.exists(result_.key, [self](std::exception_ptr error, bool exists) {
      self->on_checked(error, exists);
    });
  }

private:
  Uploader& uploader_;
  UploadHandler on_done_;
  UploadResult result_;

  void transition(UploadState next) {
    BOOST_LOG_TRIVIAL(debug) << "Uploader: " << result_.key << " "
                             << to_string(result_.state) << " -> " << to_string(next);
    result_.state = next;
  }

  void on_checked(std::exception_ptr error, bool exists) {
    if (error) {
      fail(error);
      return;
    }

    if (exists) {
      transition(UploadState::Exists);
      BOOST_LOG_TRIVIAL(info) << "Uploader: Somebody else already uploaded " << result_.key
                              << " (staged file kept: " << result_.file_path << ")";
      uploader_.cache_.mark_seen(result_.key);
      finish(UploadOutcome::AlreadyRemote);
      return;
    }

    transition(UploadState::NotExists);
    begin_upload();
  }

  void begin_upload() {
    transition(UploadState::Uploading);
    BOOST_LOG_TRIVIAL(info) << "Uploader: Uploading " << result_.key << " (" << result_.file_path << ")";

    store::ObjectStore& store = uploader_.store_;
    const std::string bucket = uploader_.bucket_;
    const std::string key = result_.key;
    const std::string file_path = result_.file_path;
    auto self = shared_from_this();

    utils::run_blocking<std::size_t>(uploader_.runner_,
      [&store, bucket, key, file_path]() {
        const std::string body = read_staged_file(file_path);
        store.put_object(bucket, key, body, CONTENT_TYPE);
        return body.size();
      },
      [self](std::exception_ptr error, std::size_t bytes) {
        self->on_uploaded(error, bytes);
      });
  }

  void on_uploaded(std::exception_ptr error, std::size_t bytes) {
    if (error) {
      fail(error);
      return;
    }

    result_.bytes = bytes;

    std::error_code ec;
    if (!std::filesystem::remove(result_.file_path, ec)) {
      BOOST_LOG_TRIVIAL(warning) << "Uploader: Uploaded " << result_.key << " but could not remove "
                                 << result_.file_path << (ec ? ": " + ec.message() : std::string(": file is gone"));
    }

    uploader_.cache_.mark_seen(result_.key);
    BOOST_LOG_TRIVIAL(info) << "Uploader: Uploaded " << result_.key << " (" << bytes << " bytes)";
    finish(UploadOutcome::Uploaded);
  }

  void fail(std::exception_ptr error) {
    result_.error = error;
    BOOST_LOG_TRIVIAL(debug) << "Uploader: " << result_.key << " failed in state "
                             << to_string(result_.state) << ": " << result_.error_message();
    transition(UploadState::Failed);
    result_.outcome = UploadOutcome::Failed;
    deliver();
  }

  void finish(UploadOutcome outcome) {
    transition(UploadState::Done);
    result_.outcome = outcome;
    deliver();
  }

  void deliver() {
    if (on_done_) {
      on_done_(result_);
    }
  }
};


//==============================================
// UPLOADER
//==============================================

Uploader::Uploader(store::ObjectStore& store, std::string bucket,
                   utils::BlockingRunner& runner, DedupCache& cache)
  : store_(store)
  , bucket_(std::move(bucket))
  , runner_(runner)
  , cache_(cache)
  , checker_(store, bucket_, runner) {
  BOOST_LOG_TRIVIAL(debug) << "Uploader: Initialized for bucket " << bucket_;
}

void Uploader::upload(const std::string& key, const std::string& file_path, UploadHandler on_done) {
  auto task = std::make_shared<Task>(*this, key, file_path, std::move(on_done));
  task->start();
}

} // namespace upload
} // namespace hvault
