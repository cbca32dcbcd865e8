#include "pipeline/image_uploader.hpp"
#include "pipeline/tile_error.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace pipeline {

ImageUploader::ImageUploader(http::HttpClient& client, store::BlobStore& blob_store,
                             std::shared_ptr<RetryPolicy> retry_policy)
  : client_(client)
  , blob_store_(blob_store)
  , retry_policy_(retry_policy ? std::move(retry_policy) : make_fixed_delay_retry()) {}

std::optional<std::string> ImageUploader::upload(const std::string& image_url, const std::string& image_id) {
  const std::string extension = extension_of(image_url);
  const std::string file_name = image_id + extension;

  try {
    std::string url = retry_policy_->run([&]() {
      const http::HttpResponse response = client_.get(image_url);
      return blob_store_.put(file_name, response.body, content_type_of(extension));
    });
    BOOST_LOG_TRIVIAL(info) << "Image uploader: Uploaded " << file_name << " to " << url;
    return url;
  } catch (const DuplicateError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Image uploader: " << file_name << " already exists: " << e.what();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Image uploader: Giving up on " << image_url << ": " << e.what();
  }
  return std::nullopt;
}

std::string ImageUploader::extension_of(const std::string& image_url) {
  std::string path = image_url.substr(0, image_url.find_first_of("?#"));

  const auto scheme = path.find("://");
  if (scheme != std::string::npos) {
    const auto path_start = path.find('/', scheme + 3);
    path = path_start == std::string::npos ? "" : path.substr(path_start);
  }

  const auto slash = path.find_last_of('/');
  const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  const auto dot = name.find_last_of('.');
  // A leading dot names a hidden file, not an extension
  if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
    return ".jpg";
  }
  return name.substr(dot);
}

std::string ImageUploader::content_type_of(const std::string& extension) {
  std::string lower = extension;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == ".png") return "image/png";
  if (lower == ".gif") return "image/gif";
  if (lower == ".webp") return "image/webp";
  return "image/jpeg";
}

} // namespace pipeline
} // namespace deepzoom
