#include "pipeline/batch_uploader.hpp"
#include "crypto/crypto_error.hpp"
#include "pipeline/tile_error.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace deepzoom {
namespace pipeline {

//==============================================
// CONSTRUCTOR
//==============================================

BatchUploader::BatchUploader(http::HttpClient& client, const crypto::TileDecryptor& decryptor,
                             store::BlobStore& blob_store, store::MetadataStore& metadata_store,
                             std::shared_ptr<RetryPolicy> retry_policy)
  : client_(client)
  , decryptor_(decryptor)
  , blob_store_(blob_store)
  , metadata_store_(metadata_store)
  , retry_policy_(retry_policy ? std::move(retry_policy) : make_no_retry()) {}

//==============================================
// UPLOAD
//==============================================

JobSummary BatchUploader::run(const TileUrlMap& tile_urls, const std::string& image_id,
                              std::size_t batch_size) {
  JobContext context(image_id);
  return run(tile_urls, image_id, context, batch_size);
}

JobSummary BatchUploader::run(const TileUrlMap& tile_urls, const std::string& image_id,
                              JobContext& context, std::size_t batch_size) {
  if (batch_size == 0) {
    throw std::invalid_argument("Batch size must be positive");
  }

  context.set_total(tile_urls.size());
  const std::size_t total_batches = (tile_urls.size() + batch_size - 1) / batch_size;

  DEEPZOOM_JOB_LOG(context, info) << "Batch uploader: Processing " << tile_urls.size()
                                  << " tiles in batches of " << batch_size;

  auto it = tile_urls.begin();
  for (std::size_t batch_number = 1; it != tile_urls.end(); ++batch_number) {
    if (context.is_cancelled()) {
      DEEPZOOM_JOB_LOG(context, warning) << "Batch uploader: Cancelled before batch " << batch_number
                                         << "/" << total_batches;
      break;
    }

    std::vector<TileUrlMap::const_iterator> batch;
    for (; it != tile_urls.end() && batch.size() < batch_size; ++it) {
      batch.push_back(it);
    }

    run_batch(batch, image_id, context);
    persist_progress(context);

    DEEPZOOM_JOB_LOG(context, info) << "Batch uploader: Batch " << batch_number << "/" << total_batches
                                    << " complete (" << context.processed() << " processed, "
                                    << context.skipped() << " skipped, " << context.failed() << " failed)";
  }

  const JobSummary summary = context.summary();
  DEEPZOOM_JOB_LOG(context, info) << "Batch uploader: Completed: " << summary.processed << " successful, "
                                  << summary.skipped << " skipped, " << summary.failed << " failed";
  return summary;
}

void BatchUploader::run_batch(const std::vector<TileUrlMap::const_iterator>& batch,
                              const std::string& image_id, JobContext& context) {
  std::vector<TileOutcome> outcomes(batch.size());

  {
    boost::asio::thread_pool pool(batch.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
      boost::asio::post(pool, [this, &batch, &outcomes, &image_id, &context, i]() {
        outcomes[i] = process_tile(batch[i]->first, batch[i]->second, image_id, context);
      });
    }
    pool.join();
  }

  for (const auto& outcome : outcomes) {
    context.record(outcome);
    if (outcome.status == TileStatus::FAILED) {
      DEEPZOOM_JOB_LOG(context, error) << "Batch uploader: " << tile_status_to_string(outcome.status) << " "
                                       << outcome.key << " [" << error_kind_to_string(outcome.error_kind)
                                       << "]: " << outcome.message;
    } else if (outcome.status == TileStatus::SKIPPED) {
      DEEPZOOM_JOB_LOG(context, info) << "Batch uploader: " << tile_status_to_string(outcome.status)
                                      << " " << outcome.tile_id << ", tile already exists";
    } else {
      DEEPZOOM_JOB_LOG(context, debug) << "Batch uploader: " << tile_status_to_string(outcome.status)
                                       << " " << outcome.tile_id;
    }
  }
}

TileOutcome BatchUploader::process_tile(const std::string& key, const std::string& url,
                                        const std::string& image_id, JobContext& context) {
  TileOutcome outcome;
  outcome.key = key;
  outcome.tile_id = make_tile_id(image_id, key);

  try {
    outcome.status = retry_policy_->run([&]() { return upload_tile(outcome.tile_id, url, context); });
  } catch (const DuplicateError& e) {
    outcome.status = TileStatus::SKIPPED;
    outcome.error_kind = ErrorKind::DUPLICATE;
    outcome.message = e.what();
  } catch (const TileError& e) {
    outcome.status = TileStatus::FAILED;
    outcome.error_kind = e.kind();
    outcome.message = e.what();
  } catch (const crypto::CryptoError& e) {
    outcome.status = TileStatus::FAILED;
    outcome.error_kind = ErrorKind::CRYPTO;
    outcome.message = e.what();
  } catch (const std::exception& e) {
    outcome.status = TileStatus::FAILED;
    outcome.error_kind = ErrorKind::UNKNOWN;
    outcome.message = e.what();
  }
  return outcome;
}

TileStatus BatchUploader::upload_tile(const std::string& tile_id, const std::string& url,
                                      JobContext& context) {
  if (metadata_store_.find_tile_by_id(tile_id)) {
    return TileStatus::SKIPPED;
  }

  const http::HttpResponse response = client_.get(url);
  DEEPZOOM_JOB_LOG(context, debug) << "Batch uploader: Downloaded " << response.body.size()
                                   << " bytes for " << tile_id;

  const std::vector<uint8_t> image = decryptor_.decrypt(response.body);
  const std::string public_url = blob_store_.put(make_blob_key(tile_id), image, TILE_CONTENT_TYPE);
  metadata_store_.create_tile_record(tile_id, public_url);

  DEEPZOOM_JOB_LOG(context, debug) << "Batch uploader: Stored " << tile_id << " at " << public_url;
  return TileStatus::RECORDED;
}

void BatchUploader::persist_progress(JobContext& context) {
  try {
    metadata_store_.update_progress_counter(context.job_id(), context.processed());
  } catch (const std::exception& e) {
    DEEPZOOM_JOB_LOG(context, warning) << "Batch uploader: Failed to persist progress: " << e.what();
  }
}

//==============================================
// NAMING
//==============================================

std::string BatchUploader::make_tile_id(const std::string& image_id, const std::string& key) {
  std::string safe_key = key;
  std::replace(safe_key.begin(), safe_key.end(), '/', '_');
  return image_id + safe_key;
}

std::string BatchUploader::make_blob_key(const std::string& tile_id) {
  return tile_id + TILE_EXTENSION;
}

} // namespace pipeline
} // namespace deepzoom
