#ifndef DEEPZOOM_BLOB_STORE_HPP
#define DEEPZOOM_BLOB_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace deepzoom {
namespace store {

// Object storage for decrypted tiles. Implementations must be safe to call
// from several worker threads and throw pipeline::StorageError on failure.
class BlobStore {
public:
  virtual ~BlobStore() = default;

  // Checks if an object exists under key
  virtual bool exists(const std::string& key) = 0;
  // Stores data under key unless it already exists; returns its public URL
  virtual std::string put(const std::string& key, const std::vector<uint8_t>& data,
                          const std::string& content_type) = 0;
  // Public URL an object under key is served from
  virtual std::string public_url(const std::string& key) const = 0;
};

} // namespace store
} // namespace deepzoom

#endif // DEEPZOOM_BLOB_STORE_HPP
