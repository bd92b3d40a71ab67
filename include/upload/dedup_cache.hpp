#ifndef HVAULT_UPLOAD_DEDUP_CACHE_HPP
#define HVAULT_UPLOAD_DEDUP_CACHE_HPP

#include <cstddef>
#include <string>
#include <unordered_set>

namespace hvault {
namespace upload {

// Content keys this sink has confirmed present in the object store. Grows for
// the lifetime of the sink and is never persisted, so other processes (or a
// restarted one) may still upload the same content again.
// Only touched from the event loop thread.
class DedupCache {
public:
  bool seen(const std::string& key) const { return keys_.count(key) != 0; }
  void mark_seen(const std::string& key) { keys_.insert(key); }
  std::size_t size() const { return keys_.size(); }

private:
  std::unordered_set<std::string> keys_;
};

} // namespace upload
} // namespace hvault

#endif // HVAULT_UPLOAD_DEDUP_CACHE_HPP
