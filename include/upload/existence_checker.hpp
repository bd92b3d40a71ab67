#ifndef HVAULT_UPLOAD_EXISTENCE_CHECKER_HPP
#define HVAULT_UPLOAD_EXISTENCE_CHECKER_HPP

#include <exception>
#include <functional>
#include <string>
#include "store/object_store.hpp"
#include "utils/blocking_runner.hpp"

namespace hvault {
namespace upload {

// handler(error, exists); exists is meaningful only when error is null
using ExistsHandler = std::function<void(std::exception_ptr, bool)>;

// Probes the object store for a key on the blocking runner. A not-found
// response is the normal "false" answer; every other failure is passed on.
class ExistenceChecker {
public:
  ExistenceChecker(store::ObjectStore& store, std::string bucket, utils::BlockingRunner& runner);

  void exists(const std::string& key, ExistsHandler handler);

  // Synchronous probe, run on a worker thread
  bool probe(const std::string& key);

private:
  store::ObjectStore& store_;
  std::string bucket_;
  utils::BlockingRunner& runner_;
};

} // namespace upload
} // namespace hvault

#endif // HVAULT_UPLOAD_EXISTENCE_CHECKER_HPP
