#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include "config/config.hpp"
#include "output/event_serializer.hpp"
#include "output/object_store_output.hpp"
#include "store/object_store.hpp"
#include "utils/blocking_runner.hpp"

namespace hvault {
namespace app {

// Wires the event loop, the blocking worker pool, the object store and the
// output sink together. Records are handed over from any thread with submit();
// everything else happens on the single event loop thread.
class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Builds the object store from configuration
  explicit Bootstrap(const config::Config& config);
  // Uses the given store instead
  Bootstrap(const config::Config& config, std::unique_ptr<store::ObjectStore> store);
  ~Bootstrap();

  Bootstrap(const Bootstrap&) = delete;
  Bootstrap& operator=(const Bootstrap&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the output and the event loop thread
  bool start();
  // Finishes queued records and in-flight uploads, then stops all components
  bool shutdown();

  // Thread-safe hand-over of one record to the output. Records submitted
  // before start() wait for the event loop; after shutdown() they are
  // rejected with a warning.
  void submit(output::Record entry);


  // ---- GETTERS ----
  // Only meaningful after shutdown() or from the event loop thread
  output::ObjectStoreOutput& get_output() { return *output_; }
  store::ObjectStore& get_store() { return *store_; }
  // Records refused because the sink was already shut down
  std::size_t rejected() const { return rejected_; }

private:
  // ---- PARAMETERS ----
  config::Config config_;

  // Event loop
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;

  // System components
  std::unique_ptr<store::ObjectStore> store_;
  std::unique_ptr<utils::ThreadPoolRunner> runner_;
  std::unique_ptr<output::ObjectStoreOutput> output_;

  bool running_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<std::size_t> rejected_{0};

  void run_event_loop();
};

} // namespace app
} // namespace hvault
