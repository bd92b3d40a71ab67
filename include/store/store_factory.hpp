#pragma once

#include <memory>
#include "config/config.hpp"
#include "store/object_store.hpp"

namespace hvault {
namespace store {

// DirectoryStore for "file://" endpoints, S3Client otherwise
std::unique_ptr<ObjectStore> make_object_store(const config::StoreConfig& config);

} // namespace store
} // namespace hvault
