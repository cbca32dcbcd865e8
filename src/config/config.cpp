#include "config/config.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace config {

namespace {

long long parse_integer(const std::string& name, const std::string& value) {
  std::size_t consumed = 0;
  long long result = 0;
  try {
    result = std::stoll(value, &consumed);
  } catch (const std::invalid_argument&) {
    throw ConfigError(name + " is not a number: '" + value + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError(name + " is out of range: '" + value + "'");
  }
  if (consumed != value.size()) {
    throw ConfigError(name + " is not a number: '" + value + "'");
  }
  return result;
}

bool parse_bool(const std::string& name, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  throw ConfigError(name + " is not a boolean: '" + value + "'");
}

std::vector<uint8_t> parse_key(const std::string& name, const std::string& value, std::size_t size) {
  std::vector<uint8_t> key;
  try {
    key = crypto::from_hex(value);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(name + ": " + e.what());
  }
  if (size != 0 && key.size() != size) {
    throw ConfigError(name + " must be " + std::to_string(size) + " bytes, got " + std::to_string(key.size()));
  }
  return key;
}

} // namespace

Config Config::from_environment() {
  return from_lookup([](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  });
}

Config Config::from_lookup(const Lookup& lookup) {
  Config config;

  // Unset and empty variables keep their defaults
  auto get = [&lookup](const std::string& name) -> std::optional<std::string> {
    auto value = lookup(name);
    if (value && value->empty()) {
      return std::nullopt;
    }
    return value;
  };

  // ---- BLOB STORE ----
  if (auto value = get("STRAPI_UPLOAD_ENDPOINT")) config.s3.endpoint = *value;
  if (auto value = get("STRAPI_UPLOAD_REGION")) config.s3.region = *value;
  if (auto value = get("STRAPI_UPLOAD_ACCESS_KEY_ID")) config.s3.access_key_id = *value;
  if (auto value = get("STRAPI_UPLOAD_SECRET_ACCESS_KEY")) config.s3.secret_access_key = *value;
  if (auto value = get("STRAPI_UPLOAD_BUCKET")) config.s3.bucket = *value;
  if (auto value = get("STRAPI_UPLOAD_BASE_URL")) config.s3.public_base_url = *value;

  // ---- METADATA STORE ----
  if (auto value = get("DEEPZOOM_CMS_URL")) config.cms.base_url = *value;
  if (auto value = get("DEEPZOOM_CMS_TOKEN")) config.cms.api_token = *value;

  // ---- UPLOAD ----
  if (auto value = get("TILE_UPLOAD_BATCH_SIZE")) {
    const long long batch_size = parse_integer("TILE_UPLOAD_BATCH_SIZE", *value);
    if (batch_size > 0) {
      config.upload.batch_size = static_cast<std::size_t>(batch_size);
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Config: Ignoring non-positive TILE_UPLOAD_BATCH_SIZE " << batch_size;
    }
  }
  if (auto value = get("DEEPZOOM_RETRY_ATTEMPTS")) {
    const long long attempts = parse_integer("DEEPZOOM_RETRY_ATTEMPTS", *value);
    if (attempts < 1 || attempts > 100) {
      throw ConfigError("DEEPZOOM_RETRY_ATTEMPTS must be between 1 and 100");
    }
    config.upload.retry_attempts = static_cast<int>(attempts);
  }
  if (auto value = get("DEEPZOOM_RETRY_DELAY_MS")) {
    const long long delay = parse_integer("DEEPZOOM_RETRY_DELAY_MS", *value);
    if (delay < 0) {
      throw ConfigError("DEEPZOOM_RETRY_DELAY_MS must not be negative");
    }
    config.upload.retry_delay = std::chrono::milliseconds(delay);
  }

  // ---- HTTP ----
  if (auto value = get("DEEPZOOM_HTTP_TIMEOUT_MS")) {
    const long long timeout = parse_integer("DEEPZOOM_HTTP_TIMEOUT_MS", *value);
    if (timeout <= 0) {
      throw ConfigError("DEEPZOOM_HTTP_TIMEOUT_MS must be positive");
    }
    config.http.timeout = std::chrono::milliseconds(timeout);
  }
  if (auto value = get("DEEPZOOM_HTTP_MAX_BODY_BYTES")) {
    const long long max_body = parse_integer("DEEPZOOM_HTTP_MAX_BODY_BYTES", *value);
    if (max_body <= 0) {
      throw ConfigError("DEEPZOOM_HTTP_MAX_BODY_BYTES must be positive");
    }
    config.http.max_body_size = static_cast<std::size_t>(max_body);
  }
  if (auto value = get("DEEPZOOM_TLS_VERIFY")) {
    config.http.verify_tls = parse_bool("DEEPZOOM_TLS_VERIFY", *value);
  }

  // ---- SERVICE KEYS ----
  if (auto value = get("DEEPZOOM_HMAC_KEY")) config.keys.hmac_key = parse_key("DEEPZOOM_HMAC_KEY", *value, 0);
  if (auto value = get("DEEPZOOM_AES_KEY")) config.keys.aes_key = parse_key("DEEPZOOM_AES_KEY", *value, 16);
  if (auto value = get("DEEPZOOM_AES_IV")) config.keys.aes_iv = parse_key("DEEPZOOM_AES_IV", *value, 16);

  // ---- LOGGING ----
  if (auto value = get("DEEPZOOM_LOG_LEVEL")) {
    try {
      config.log.min_severity = logging::parse_severity(*value);
    } catch (const std::invalid_argument& e) {
      throw ConfigError(e.what());
    }
  }
  if (auto value = get("DEEPZOOM_LOG_FILE")) config.log.file_name = *value;

  return config;
}

std::shared_ptr<pipeline::RetryPolicy> Config::make_retry_policy() const {
  if (upload.retry_attempts <= 1) {
    return pipeline::make_no_retry();
  }
  return pipeline::make_fixed_delay_retry(upload.retry_attempts, upload.retry_delay);
}

} // namespace config
} // namespace deepzoom
