#include "output/object_store_output.hpp"
#include <boost/log/trivial.hpp>

namespace hvault {
namespace output {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ObjectStoreOutput::ObjectStoreOutput(store::ObjectStore& store, utils::BlockingRunner& runner,
                                     const config::StoreConfig& store_config,
                                     const config::OutputConfig& output_config)
  : uploader_(store, store_config.bucket, runner, cache_)
  , dispatcher_(uploader_, DispatchOptions{output_config.key_prefix, output_config.temp_dir}) {
  BOOST_LOG_TRIVIAL(info) << "Output: Archiving to bucket " << store_config.bucket
                          << (output_config.key_prefix.empty() ? std::string()
                                                               : " with key prefix " + output_config.key_prefix);
}


//==============================================
// LIFECYCLE
//==============================================

bool ObjectStoreOutput::start() {
  if (running_) {
    BOOST_LOG_TRIVIAL(warning) << "Output: Already started";
    return true;
  }
  if (in_flight_ > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Output: Cannot start, " << in_flight_
                               << " uploads from the previous run are still in flight";
    return false;
  }
  cache_ = upload::DedupCache{};
  stats_ = OutputStats{};
  running_ = true;
  BOOST_LOG_TRIVIAL(info) << "Output: Started";
  return true;
}

void ObjectStoreOutput::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  BOOST_LOG_TRIVIAL(info) << "Output: Stopped. queued=" << stats_.queued
                          << " dropped=" << stats_.dropped
                          << " uploaded=" << stats_.uploaded
                          << " skipped=" << stats_.skipped
                          << " already_remote=" << stats_.already_remote
                          << " failed=" << stats_.failed
                          << " in_flight=" << in_flight_
                          << " known_keys=" << cache_.size();
}

void ObjectStoreOutput::write(const Record& entry) {
  if (!running_) {
    BOOST_LOG_TRIVIAL(warning) << "Output: Dropping record received while stopped";
    ++stats_.dropped;
    return;
  }

  // Counted before dispatch: a cached key completes before dispatch returns
  ++in_flight_;
  const Disposition disposition = dispatcher_.dispatch(entry,
    [this](const upload::UploadResult& result) { on_upload_done(result); });

  if (disposition == Disposition::Queued) {
    ++stats_.queued;
  } else {
    --in_flight_;
    ++stats_.dropped;
  }
}


//==============================================
// UPLOAD REPORTING
//==============================================

void ObjectStoreOutput::on_upload_done(const upload::UploadResult& result) {
  --in_flight_;
  switch (result.outcome) {
    case upload::UploadOutcome::Uploaded:
      ++stats_.uploaded;
      break;
    case upload::UploadOutcome::SkippedSeen:
      ++stats_.skipped;
      break;
    case upload::UploadOutcome::AlreadyRemote:
      ++stats_.already_remote;
      break;
    case upload::UploadOutcome::Failed:
      ++stats_.failed;
      BOOST_LOG_TRIVIAL(error) << "Output: Failed to archive " << result.key << " from "
                               << result.file_path << ": " << result.error_message();
      break;
  }
}

} // namespace output
} // namespace hvault
