#ifndef DEEPZOOM_TILE_IMPORT_JOB_HPP
#define DEEPZOOM_TILE_IMPORT_JOB_HPP

#include <atomic>
#include <memory>
#include <string>
#include "pipeline/batch_uploader.hpp"
#include "pipeline/job_context.hpp"
#include "pyramid/tile_info_resolver.hpp"
#include "signing/url_signer.hpp"
#include "store/metadata_store.hpp"

namespace deepzoom {
namespace pipeline {

// Imports every tile of one deep-zoom image:
// resolve -> register tile info -> sign tiles and register levels -> batch upload
class TileImportJob {
public:
  // ---- CONSTRUCTOR ----
  TileImportJob(pyramid::TileInfoResolver& resolver, const signing::UrlSigner& signer,
                store::MetadataStore& metadata_store, BatchUploader& uploader,
                UploadOptions options = UploadOptions());


  // ---- EXECUTION ----
  // Resolver and registration failures propagate; per-tile failures are counted
  JobSummary run(const std::string& base_asset_url, const std::string& image_id);
  // Stops the running job at its next batch boundary. A cancelled job stays cancelled.
  void cancel() { cancel_flag_->store(true); }


  // ---- TILE URLS ----
  // Signs one tile of the resolved image and inserts it into tile_urls
  void add_tile_url(TileUrlMap& tile_urls, const pyramid::ResolvedImage& image,
                    const pyramid::TileCoordinate& tile) const;

private:
  // ---- PARAMETERS ----
  pyramid::TileInfoResolver& resolver_;
  const signing::UrlSigner& signer_;
  store::MetadataStore& metadata_store_;
  BatchUploader& uploader_;
  UploadOptions options_;
  JobContext::CancelFlag cancel_flag_;
};

} // namespace pipeline
} // namespace deepzoom

#endif // DEEPZOOM_TILE_IMPORT_JOB_HPP
