#ifndef HVAULT_STORE_OBJECT_STORE_HPP
#define HVAULT_STORE_OBJECT_STORE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hvault {
namespace store {

// Metadata returned by a successful existence probe
struct ObjectStat {
  std::uintmax_t size{0};
  std::string etag;
};

// Failure reported by an object store. status is the HTTP status of the
// response, or 0 when no response was received (network or local I/O failure).
class ObjectStoreError : public std::runtime_error {
public:
  ObjectStoreError(unsigned status, const std::string& code, const std::string& message)
    : std::runtime_error(message)
    , status_(status)
    , code_(code) {}

  unsigned status() const { return status_; }
  const std::string& code() const { return code_; }

  bool not_found() const {
    return status_ == 404 || code_ == "NoSuchKey" || code_ == "NotFound";
  }

private:
  unsigned status_;
  std::string code_;
};

// Remote object store capability used by the upload pipeline. Calls block and
// are expected to run on worker threads; implementations must be safe to call
// concurrently.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // Returns object metadata, throws ObjectStoreError (not_found() or otherwise)
  virtual ObjectStat head_object(const std::string& bucket, const std::string& key) = 0;

  // Stores body under key, overwriting any existing object
  virtual void put_object(const std::string& bucket, const std::string& key,
                          const std::string& body, const std::string& content_type) = 0;
};

} // namespace store
} // namespace hvault

#endif // HVAULT_STORE_OBJECT_STORE_HPP
