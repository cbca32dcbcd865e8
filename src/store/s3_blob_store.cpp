#include "store/s3_blob_store.hpp"
#include "crypto/digest.hpp"
#include "http/url.hpp"
#include "pipeline/tile_error.hpp"
#include <ctime>
#include <sstream>
#include <utility>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace store {

namespace {

const char* const ALGORITHM = "AWS4-HMAC-SHA256";
const char* const SERVICE = "s3";
// SHA-256 of the empty string
const char* const EMPTY_PAYLOAD_HASH = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string trim_trailing_slash(std::string text) {
  while (!text.empty() && text.back() == '/') {
    text.pop_back();
  }
  return text;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

S3BlobStore::S3BlobStore(S3Options options, http::HttpClient& client, Clock clock)
  : options_(std::move(options))
  , client_(client)
  , clock_(std::move(clock)) {
  options_.endpoint = trim_trailing_slash(options_.endpoint);
  options_.public_base_url = trim_trailing_slash(options_.public_base_url);

  if (options_.endpoint.empty() || options_.bucket.empty()) {
    throw pipeline::StorageError("S3 endpoint and bucket are required");
  }
  BOOST_LOG_TRIVIAL(info) << "S3 blob store: Using bucket " << options_.bucket << " at " << options_.endpoint
                          << " (region " << options_.region << ")";
}

//==============================================
// BLOB STORE OPERATIONS
//==============================================

bool S3BlobStore::exists(const std::string& key) {
  http::HttpRequest request;
  request.method = "HEAD";
  request.url = object_url(key);
  sign(request, EMPTY_PAYLOAD_HASH);

  http::HttpResponse response;
  try {
    response = client_.perform(request);
  } catch (const pipeline::NetworkError& e) {
    throw pipeline::StorageError("HEAD " + key + " failed: " + e.what());
  }

  if (response.ok()) {
    BOOST_LOG_TRIVIAL(debug) << "S3 blob store: Object " << key << " exists";
    return true;
  }
  if (response.status == 404) {
    return false;
  }
  throw pipeline::StorageError("HEAD " + key + " returned status " + std::to_string(response.status));
}

std::string S3BlobStore::put(const std::string& key, const std::vector<uint8_t>& data,
                             const std::string& content_type) {
  if (exists(key)) {
    BOOST_LOG_TRIVIAL(debug) << "S3 blob store: Object " << key << " already uploaded, skipping";
    return public_url(key);
  }

  http::HttpRequest request;
  request.method = "PUT";
  request.url = object_url(key);
  request.headers["content-type"] = content_type;
  request.headers["x-amz-acl"] = "public-read";
  request.body.assign(data.begin(), data.end());
  sign(request, crypto::to_hex(crypto::sha256(data)));

  http::HttpResponse response;
  try {
    response = client_.perform(request);
  } catch (const pipeline::NetworkError& e) {
    throw pipeline::StorageError("PUT " + key + " failed: " + e.what());
  }

  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(error) << "S3 blob store: PUT " << key << " returned status " << response.status
                             << ": " << response.text().substr(0, 512);
    throw pipeline::StorageError("PUT " + key + " returned status " + std::to_string(response.status));
  }

  BOOST_LOG_TRIVIAL(info) << "S3 blob store: Uploaded " << data.size() << " bytes to " << key;
  return public_url(key);
}

std::string S3BlobStore::public_url(const std::string& key) const {
  return options_.public_base_url + "/" + key;
}

std::string S3BlobStore::object_url(const std::string& key) const {
  return options_.endpoint + "/" + http::url_encode(options_.bucket) + "/" + http::url_encode(key, false);
}

//==============================================
// SIGNATURE V4
//==============================================

std::vector<uint8_t> S3BlobStore::signing_key(const std::string& secret_access_key, const std::string& date,
                                              const std::string& region, const std::string& service) {
  const std::string secret = "AWS4" + secret_access_key;
  auto key = crypto::hmac_sha256(std::vector<uint8_t>(secret.begin(), secret.end()), date);
  key = crypto::hmac_sha256(key, region);
  key = crypto::hmac_sha256(key, service);
  return crypto::hmac_sha256(key, "aws4_request");
}

void S3BlobStore::sign(http::HttpRequest& request, const std::string& payload_hash) const {
  const std::time_t now = std::chrono::system_clock::to_time_t(clock_());
  std::tm utc{};
  gmtime_r(&now, &utc);

  char amz_date[17];
  char date[9];
  std::strftime(amz_date, sizeof(amz_date), "%Y%m%dT%H%M%SZ", &utc);
  std::strftime(date, sizeof(date), "%Y%m%d", &utc);

  request.headers["x-amz-date"] = amz_date;
  request.headers["x-amz-content-sha256"] = payload_hash;

  const http::Url url = http::parse_url(request.url);
  http::Headers canonical = request.headers;
  canonical["host"] = url.authority();

  std::ostringstream canonical_headers;
  std::ostringstream signed_headers;
  for (auto it = canonical.begin(); it != canonical.end(); ++it) {
    canonical_headers << it->first << ":" << it->second << "\n";
    signed_headers << (it == canonical.begin() ? "" : ";") << it->first;
  }

  const auto query_start = url.target.find('?');
  const std::string query = query_start == std::string::npos ? "" : url.target.substr(query_start + 1);

  std::ostringstream canonical_request;
  canonical_request << request.method << "\n"
                    << url.path() << "\n"
                    << query << "\n"
                    << canonical_headers.str() << "\n"
                    << signed_headers.str() << "\n"
                    << payload_hash;

  const std::string scope = std::string(date) + "/" + options_.region + "/" + SERVICE + "/aws4_request";

  std::ostringstream string_to_sign;
  string_to_sign << ALGORITHM << "\n"
                 << amz_date << "\n"
                 << scope << "\n"
                 << crypto::to_hex(crypto::sha256(canonical_request.str()));

  const std::string signature = crypto::to_hex(crypto::hmac_sha256(
      signing_key(options_.secret_access_key, date, options_.region, SERVICE), string_to_sign.str()));

  request.headers["authorization"] = std::string(ALGORITHM) +
      " Credential=" + options_.access_key_id + "/" + scope +
      ", SignedHeaders=" + signed_headers.str() +
      ", Signature=" + signature;
}

} // namespace store
} // namespace deepzoom
