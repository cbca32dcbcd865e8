#include "pipeline/tile_import_job.hpp"
#include "crypto/crypto_error.hpp"
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace pipeline {

//==============================================
// CONSTRUCTOR
//==============================================

TileImportJob::TileImportJob(pyramid::TileInfoResolver& resolver, const signing::UrlSigner& signer,
                             store::MetadataStore& metadata_store, BatchUploader& uploader,
                             UploadOptions options)
  : resolver_(resolver)
  , signer_(signer)
  , metadata_store_(metadata_store)
  , uploader_(uploader)
  , options_(std::move(options))
  , cancel_flag_(std::make_shared<std::atomic<bool>>(false)) {}

//==============================================
// EXECUTION
//==============================================

JobSummary TileImportJob::run(const std::string& base_asset_url, const std::string& image_id) {
  BOOST_LOG_TRIVIAL(info) << "Tile import: Resolving " << base_asset_url << " for image " << image_id;
  const pyramid::ResolvedImage image = resolver_.resolve(base_asset_url);
  const pyramid::TileInfo& info = image.tile_info;

  store::TileInfoRecord record;
  record.tile_info = info;
  record.origin_url = base_asset_url;
  record.path = image.reference.path;
  record.token = image.reference.token;
  const std::string job_id = metadata_store_.create_tile_info_record(record);

  JobContext context(job_id, cancel_flag_);
  DEEPZOOM_JOB_LOG(context, info) << "Tile import: " << info.width << "x" << info.height << " image with "
                                  << info.pyramid_levels.size() << " levels and " << info.num_tiles << " tiles";

  const std::vector<pyramid::TileCoordinate> tiles = pyramid::enumerate_tiles(info);
  auto next = tiles.begin();

  TileUrlMap tile_urls;
  for (std::size_t z = 0; z < info.pyramid_levels.size(); ++z) {
    for (; next != tiles.end() && next->z == z; ++next) {
      try {
        add_tile_url(tile_urls, image, *next);
      } catch (const crypto::CryptoError& e) {
        DEEPZOOM_JOB_LOG(context, error) << "Tile import: Failed to sign tile level " << next->z
                                         << ", x " << next->x << ", y " << next->y << ": " << e.what();
      }
    }
    metadata_store_.create_pyramid_level_record(job_id, info.pyramid_levels[z]);
  }

  DEEPZOOM_JOB_LOG(context, info) << "Tile import: Generated " << tile_urls.size() << " tile URLs for image "
                                  << image_id;
  return uploader_.run(tile_urls, image_id, context, options_.batch_size);
}

//==============================================
// TILE URLS
//==============================================

void TileImportJob::add_tile_url(TileUrlMap& tile_urls, const pyramid::ResolvedImage& image,
                                 const pyramid::TileCoordinate& tile) const {
  const pyramid::DescriptorReference& reference = image.reference;
  const std::string signed_path =
      signer_.compute_signed_path(reference.path, reference.token, tile.x, tile.y, tile.z);
  tile_urls[signing::UrlSigner::tile_key(reference.token, tile.x, tile.y, tile.z)] =
      signing::UrlSigner::tile_url(image.tile_info.origin, signed_path);
}

} // namespace pipeline
} // namespace deepzoom
