#include "utils/blocking_runner.hpp"
#include <stdexcept>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace hvault {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ThreadPoolRunner::ThreadPoolRunner(boost::asio::io_context& loop, std::size_t threads)
  : loop_(loop)
  , pool_(threads) {
  BOOST_LOG_TRIVIAL(debug) << "Blocking runner: Started worker pool with " << threads << " threads";
}

ThreadPoolRunner::~ThreadPoolRunner() {
  shutdown();
}


//==============================================
// JOB EXECUTION
//==============================================

void ThreadPoolRunner::run_blocking(BlockingJob job, BlockingCompletion on_done) {
  if (stopped_) {
    BOOST_LOG_TRIVIAL(warning) << "Blocking runner: Rejecting job, worker pool is shut down";
    auto error = std::make_exception_ptr(std::runtime_error("Blocking runner: worker pool is shut down"));
    boost::asio::post(loop_, [on_done = std::move(on_done), error]() { on_done(error); });
    return;
  }

  auto work = boost::asio::make_work_guard(loop_);
  boost::asio::post(pool_,
    [job = std::move(job), on_done = std::move(on_done), work]() mutable {
      std::exception_ptr error;
      try {
        job();
      } catch (...) {
        // Handed to on_done on the event loop
        error = std::current_exception();
      }
      boost::asio::post(work.get_executor(), [on_done = std::move(on_done), error]() { on_done(error); });
      work.reset();
    });
}

void ThreadPoolRunner::shutdown() {
  if (stopped_.exchange(true)) {
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "Blocking runner: Waiting for worker pool to drain";
  pool_.join();
  BOOST_LOG_TRIVIAL(debug) << "Blocking runner: Worker pool stopped";
}

} // namespace utils
} // namespace hvault
