#ifndef DEEPZOOM_IMAGE_UPLOADER_HPP
#define DEEPZOOM_IMAGE_UPLOADER_HPP

#include <memory>
#include <optional>
#include <string>
#include "http/http_client.hpp"
#include "pipeline/retry_policy.hpp"
#include "store/blob_store.hpp"

namespace deepzoom {
namespace pipeline {

// Uploads a single whole image (e.g. a thumbnail) with retries
class ImageUploader {
public:
  // Retries three times, two seconds apart, unless another policy is given
  ImageUploader(http::HttpClient& client, store::BlobStore& blob_store,
                std::shared_ptr<RetryPolicy> retry_policy = make_fixed_delay_retry());

  // Returns the public URL, or nullopt once all attempts failed or the object is a duplicate
  std::optional<std::string> upload(const std::string& image_url, const std::string& image_id);

  // Extension of the URL path ignoring any query string, ".jpg" when there is none
  static std::string extension_of(const std::string& image_url);
  // Content type for a file extension, image/jpeg by default
  static std::string content_type_of(const std::string& extension);

private:
  http::HttpClient& client_;
  store::BlobStore& blob_store_;
  std::shared_ptr<RetryPolicy> retry_policy_;
};

} // namespace pipeline
} // namespace deepzoom

#endif // DEEPZOOM_IMAGE_UPLOADER_HPP
