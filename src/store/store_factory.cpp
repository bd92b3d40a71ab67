#include "store/store_factory.hpp"
#include "store/directory_store.hpp"
#include "store/s3_client.hpp"
#include <boost/log/trivial.hpp>

namespace hvault {
namespace store {

namespace {
constexpr const char* FILE_SCHEME = "file://";
}

std::unique_ptr<ObjectStore> make_object_store(const config::StoreConfig& config) {
  if (config.endpoint && config.endpoint->rfind(FILE_SCHEME, 0) == 0) {
    const std::string path = config.endpoint->substr(std::char_traits<char>::length(FILE_SCHEME));
    if (path.empty()) {
      throw config::ConfigError("Store: file:// endpoint needs a directory");
    }
    BOOST_LOG_TRIVIAL(info) << "Store: Using directory store at " << path;
    return std::make_unique<DirectoryStore>(path);
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Using S3 store for bucket " << config.bucket;
  return std::make_unique<S3Client>(config);
}

} // namespace store
} // namespace hvault
