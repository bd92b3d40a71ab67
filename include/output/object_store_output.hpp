#ifndef HVAULT_OUTPUT_OBJECT_STORE_OUTPUT_HPP
#define HVAULT_OUTPUT_OBJECT_STORE_OUTPUT_HPP

#include <cstddef>
#include <string>
#include "config/config.hpp"
#include "output/dispatcher.hpp"
#include "output/event_serializer.hpp"
#include "store/object_store.hpp"
#include "upload/dedup_cache.hpp"
#include "upload/uploader.hpp"
#include "utils/blocking_runner.hpp"

namespace hvault {
namespace output {

struct OutputStats {
  std::size_t queued{0};
  std::size_t dropped{0};
  std::size_t uploaded{0};
  std::size_t skipped{0};
  std::size_t already_remote{0};
  std::size_t failed{0};
};

// Event sink that archives captured files and session events in an object
// store. Owns the dedup cache for its lifetime. write() and the upload
// completions run on the event loop thread; store failures are logged and
// counted, never thrown back into the event pipeline.
class ObjectStoreOutput {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ObjectStoreOutput(store::ObjectStore& store, utils::BlockingRunner& runner,
                    const config::StoreConfig& store_config, const config::OutputConfig& output_config);


  // ---- LIFECYCLE ----
  // Begins a run with an empty cache and zeroed stats. Refused (false) while
  // uploads from a previous run are still in flight, so their completions can
  // never leak into the new run.
  bool start();
  // Logs the session summary; uploads still in flight complete normally
  void stop();
  void write(const Record& entry);


  // ---- GETTERS ----
  const OutputStats& stats() const { return stats_; }
  const upload::DedupCache& cache() const { return cache_; }
  bool is_running() const { return running_; }
  std::size_t in_flight() const { return in_flight_; }

private:
  // ---- PARAMETERS ----
  upload::DedupCache cache_;
  upload::Uploader uploader_;
  Dispatcher dispatcher_;
  OutputStats stats_;
  bool running_{false};
  std::size_t in_flight_{0};


  // Surrounding-framework reporting for finished uploads
  void on_upload_done(const upload::UploadResult& result);
};

} // namespace output
} // namespace hvault

#endif // HVAULT_OUTPUT_OBJECT_STORE_OUTPUT_HPP
