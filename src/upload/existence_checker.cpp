#include "upload/existence_checker.hpp"
#include <boost/log/trivial.hpp>

namespace hvault {
namespace upload {

ExistenceChecker::ExistenceChecker(store::ObjectStore& store, std::string bucket,
                                   utils::BlockingRunner& runner)
  : store_(store)
  , bucket_(std::move(bucket))
  , runner_(runner) {}

void ExistenceChecker::exists(const std::string& key, ExistsHandler handler) {
  utils::run_blocking<bool>(runner_,
    [this, key]() { return probe(key); },
    std::move(handler));
}

bool ExistenceChecker::probe(const std::string& key) {
  try {
    store_.head_object(bucket_, key);
  } catch (const store::ObjectStoreError& e) {
    if (e.not_found()) {
      BOOST_LOG_TRIVIAL(debug) << "Existence checker: " << key << " not found remotely";
      return false;
    }
    BOOST_LOG_TRIVIAL(warning) << "Existence checker: Probe for " << key << " failed: " << e.what();
    throw;
  }
  BOOST_LOG_TRIVIAL(debug) << "Existence checker: " << key << " exists remotely";
  return true;
}

} // namespace upload
} // namespace hvault
