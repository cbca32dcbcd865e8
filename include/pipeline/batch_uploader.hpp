#ifndef DEEPZOOM_BATCH_UPLOADER_HPP
#define DEEPZOOM_BATCH_UPLOADER_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "crypto/tile_decryptor.hpp"
#include "http/http_client.hpp"
#include "pipeline/job_context.hpp"
#include "pipeline/retry_policy.hpp"
#include "store/blob_store.hpp"
#include "store/metadata_store.hpp"

namespace deepzoom {
namespace pipeline {

constexpr std::size_t DEFAULT_BATCH_SIZE = 10;
constexpr const char* TILE_EXTENSION = ".jpg";
constexpr const char* TILE_CONTENT_TYPE = "image/jpeg";

struct UploadOptions {
  std::size_t batch_size{DEFAULT_BATCH_SIZE};
  // 1 means no retry
  int retry_attempts{1};
  std::chrono::milliseconds retry_delay{0};
};

// Tile key ({token}/{x}/{y}/{level}) to absolute signed tile URL
using TileUrlMap = std::map<std::string, std::string>;

// Downloads, decrypts, stores and records tiles in sequential batches.
// Tiles of one batch run concurrently and are joined before the next batch.
class BatchUploader {
public:
  // ---- CONSTRUCTOR ----
  BatchUploader(http::HttpClient& client, const crypto::TileDecryptor& decryptor,
                store::BlobStore& blob_store, store::MetadataStore& metadata_store,
                std::shared_ptr<RetryPolicy> retry_policy = make_no_retry());


  // ---- UPLOAD ----
  // Progress is persisted under image_id
  JobSummary run(const TileUrlMap& tile_urls, const std::string& image_id,
                 std::size_t batch_size = DEFAULT_BATCH_SIZE);
  // Progress is persisted under context.job_id(); throws std::invalid_argument for a zero batch size
  JobSummary run(const TileUrlMap& tile_urls, const std::string& image_id, JobContext& context,
                 std::size_t batch_size = DEFAULT_BATCH_SIZE);

  // Runs one tile through the pipeline. Never throws; the error is folded into the outcome.
  TileOutcome process_tile(const std::string& key, const std::string& url,
                           const std::string& image_id, JobContext& context);


  // ---- NAMING ----
  // image_id followed by the key with every '/' replaced by '_'
  static std::string make_tile_id(const std::string& image_id, const std::string& key);
  static std::string make_blob_key(const std::string& tile_id);

private:
  // ---- PARAMETERS ----
  http::HttpClient& client_;
  const crypto::TileDecryptor& decryptor_;
  store::BlobStore& blob_store_;
  store::MetadataStore& metadata_store_;
  std::shared_ptr<RetryPolicy> retry_policy_;


  // ---- UPLOAD ----
  TileStatus upload_tile(const std::string& tile_id, const std::string& url, JobContext& context);
  void run_batch(const std::vector<TileUrlMap::const_iterator>& batch, const std::string& image_id,
                 JobContext& context);
  void persist_progress(JobContext& context);
};

} // namespace pipeline
} // namespace deepzoom

#endif // DEEPZOOM_BATCH_UPLOADER_HPP
