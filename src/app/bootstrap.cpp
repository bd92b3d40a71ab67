#include "app/bootstrap.hpp"
#include <stdexcept>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include "store/store_factory.hpp"

namespace hvault {
namespace app {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Bootstrap::Bootstrap(const config::Config& config)
  : Bootstrap(config, store::make_object_store(config.store)) {
}

Bootstrap::Bootstrap(const config::Config& config, std::unique_ptr<store::ObjectStore> store)
  : config_(config)
  , store_(std::move(store)) {

  BOOST_LOG_TRIVIAL(info) << "Bootstrap: Initializing with " << config_.output.worker_threads << " worker threads";

  try {
    if (!store_) {
      throw std::invalid_argument("No object store provided");
    }

    runner_ = std::make_unique<utils::ThreadPoolRunner>(io_context_, config_.output.worker_threads);
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Worker pool created successfully";

    output_ = std::make_unique<output::ObjectStoreOutput>(*store_, *runner_, config_.store, config_.output);
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Output created successfully";

    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to initialize components: " << e.what();
    throw;
  }
}

Bootstrap::~Bootstrap() {
  try {
    if (!this->shutdown()) {
      BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to shutdown cleanly in destructor";
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Error during destructor shutdown: " << e.what();
  }
}


//==============================================
// INITIALIZATION AND DESTRUCTION METHODS
//==============================================

bool Bootstrap::start() {
  if (running_) {
    BOOST_LOG_TRIVIAL(warning) << "Bootstrap: Already started";
    return true;
  }

  if (stopped_) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Cannot restart after shutdown";
    return false;
  }

  try {
    if (!output_->start()) {
      BOOST_LOG_TRIVIAL(error) << "Bootstrap: Output refused to start";
      return false;
    }

    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    io_context_.restart();
    io_thread_ = std::thread([this]() { run_event_loop(); });
    running_ = true;

    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Successfully started";
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to start: " << e.what();
    work_guard_.reset();
    return false;
  }
}

bool Bootstrap::shutdown() {
  if (!running_) {
    return true;
  }

  try {
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Initiating shutdown sequence";
    stopped_ = true;

    // Let the loop drain: it returns once no records or uploads are pending
    work_guard_.reset();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Event loop finished";

    output_->stop();
    runner_->shutdown();
    running_ = false;

    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Shutdown complete"
                            << (rejected_ ? " (" + std::to_string(rejected_.load()) + " late records rejected)" : std::string());
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Error during shutdown: " << e.what();
    return false;
  }
}

void Bootstrap::submit(output::Record entry) {
  if (stopped_) {
    ++rejected_;
    BOOST_LOG_TRIVIAL(warning) << "Bootstrap: Dropping record submitted after shutdown: "
                               << output::describe(entry);
    return;
  }
  boost::asio::post(io_context_, [this, entry = std::move(entry)]() {
    output_->write(entry);
  });
}


//==============================================
// EVENT LOOP
//==============================================

void Bootstrap::run_event_loop() {
  BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Event loop thread started";
  for (;;) {
    try {
      io_context_.run();
      break;
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Bootstrap: Unhandled error in event loop: " << e.what();
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Event loop thread exiting";
}

} // namespace app
} // namespace hvault
