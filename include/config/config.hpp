#ifndef DEEPZOOM_CONFIG_HPP
#define DEEPZOOM_CONFIG_HPP

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "config/service_keys.hpp"
#include "http/http_client.hpp"
#include "logger/logger.hpp"
#include "pipeline/batch_uploader.hpp"
#include "pipeline/retry_policy.hpp"
#include "store/rest_metadata_store.hpp"
#include "store/s3_blob_store.hpp"

namespace deepzoom {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

// Settings of one deployment, read from the environment:
//   STRAPI_UPLOAD_ENDPOINT, STRAPI_UPLOAD_REGION, STRAPI_UPLOAD_ACCESS_KEY_ID,
//   STRAPI_UPLOAD_SECRET_ACCESS_KEY, STRAPI_UPLOAD_BUCKET, STRAPI_UPLOAD_BASE_URL,
//   TILE_UPLOAD_BATCH_SIZE, DEEPZOOM_RETRY_ATTEMPTS, DEEPZOOM_RETRY_DELAY_MS,
//   DEEPZOOM_CMS_URL, DEEPZOOM_CMS_TOKEN, DEEPZOOM_HTTP_TIMEOUT_MS,
//   DEEPZOOM_HTTP_MAX_BODY_BYTES, DEEPZOOM_TLS_VERIFY,
//   DEEPZOOM_HMAC_KEY, DEEPZOOM_AES_KEY, DEEPZOOM_AES_IV (hex),
//   DEEPZOOM_LOG_LEVEL, DEEPZOOM_LOG_FILE
struct Config {
  http::HttpOptions http;
  store::S3Options s3;
  store::CmsOptions cms;
  pipeline::UploadOptions upload;
  ServiceKeys keys{ServiceKeys::defaults()};
  logging::LogConfig log;

  // Returns the value of a variable, nullopt when unset
  using Lookup = std::function<std::optional<std::string>(const std::string&)>;

  // Throws ConfigError on malformed numbers, booleans, hex keys or severities
  static Config from_environment();
  static Config from_lookup(const Lookup& lookup);

  // NoRetry for a single attempt, FixedDelayRetry otherwise
  std::shared_ptr<pipeline::RetryPolicy> make_retry_policy() const;
};

} // namespace config
} // namespace deepzoom

#endif // DEEPZOOM_CONFIG_HPP
