#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

namespace hvault {
namespace utils {

// Type aliases for clarity
using BlockingJob = std::function<void()>;
using BlockingCompletion = std::function<void(std::exception_ptr)>;

// Runs blocking calls away from the event loop and resumes the caller on it.
// Implementations must invoke on_done exactly once, on the event loop thread,
// with the exception thrown by job (or nullptr).
class BlockingRunner {
public:
  virtual ~BlockingRunner() = default;

  virtual void run_blocking(BlockingJob job, BlockingCompletion on_done) = 0;
};

// Value-returning form. handler(error, value) runs on the event loop; value is
// default-constructed when job threw.
template <typename Result, typename Fn, typename Handler>
void run_blocking(BlockingRunner& runner, Fn fn, Handler handler) {
  auto result = std::make_shared<Result>();
  runner.run_blocking(
    [result, fn]() mutable { *result = fn(); },
    [result, handler](std::exception_ptr error) mutable { handler(error, std::move(*result)); });
}

// BlockingRunner backed by a boost::asio::thread_pool. Completions are posted
// to the given io_context, which is kept alive by a work guard while a job is
// outstanding.
class ThreadPoolRunner : public BlockingRunner {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ThreadPoolRunner(boost::asio::io_context& loop, std::size_t threads);
  ~ThreadPoolRunner() override;

  ThreadPoolRunner(const ThreadPoolRunner&) = delete;
  ThreadPoolRunner& operator=(const ThreadPoolRunner&) = delete;


  void run_blocking(BlockingJob job, BlockingCompletion on_done) override;

  // Waits for queued jobs to finish and stops the worker threads.
  // Later jobs complete immediately with an error.
  void shutdown();

private:
  // ---- PARAMETERS ----
  boost::asio::io_context& loop_;
  boost::asio::thread_pool pool_;
  std::atomic<bool> stopped_{false};
};

} // namespace utils
} // namespace hvault
