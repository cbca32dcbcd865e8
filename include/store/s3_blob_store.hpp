#ifndef DEEPZOOM_S3_BLOB_STORE_HPP
#define DEEPZOOM_S3_BLOB_STORE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "http/http_client.hpp"
#include "store/blob_store.hpp"

namespace deepzoom {
namespace store {

struct S3Options {
  std::string endpoint;          // e.g. https://s3.gra.io.cloud.ovh.net
  std::string region;
  std::string bucket;
  std::string access_key_id;
  std::string secret_access_key;
  std::string public_base_url;   // objects are served from {public_base_url}/{key}
};

// S3-compatible store with path-style addressing ({endpoint}/{bucket}/{key}),
// AWS Signature Version 4 and public-read objects.
class S3BlobStore : public BlobStore {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  // ---- CONSTRUCTOR ----
  S3BlobStore(S3Options options, http::HttpClient& client,
              Clock clock = [] { return std::chrono::system_clock::now(); });


  // ---- BLOB STORE OPERATIONS ----
  bool exists(const std::string& key) override;
  std::string put(const std::string& key, const std::vector<uint8_t>& data,
                  const std::string& content_type) override;
  std::string public_url(const std::string& key) const override;


  // ---- SIGNATURE V4 ----
  // HMAC chain AWS4{secret} -> date -> region -> service -> "aws4_request"
  static std::vector<uint8_t> signing_key(const std::string& secret_access_key, const std::string& date,
                                          const std::string& region, const std::string& service);
  // Adds x-amz-date, x-amz-content-sha256 and authorization headers
  void sign(http::HttpRequest& request, const std::string& payload_hash) const;


  // ---- GETTERS ----
  std::string object_url(const std::string& key) const;

private:
  // ---- PARAMETERS ----
  S3Options options_;
  http::HttpClient& client_;
  Clock clock_;
};

} // namespace store
} // namespace deepzoom

#endif // DEEPZOOM_S3_BLOB_STORE_HPP
