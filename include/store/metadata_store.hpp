#ifndef DEEPZOOM_METADATA_STORE_HPP
#define DEEPZOOM_METADATA_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "pyramid/tile_info.hpp"

namespace deepzoom {
namespace store {

struct TileRecord {
  std::string tile_id;
  std::string tile_url;
};

// Tile-info document registered before a job starts uploading
struct TileInfoRecord {
  pyramid::TileInfo tile_info;
  std::string origin_url;   // asset page the image was resolved from
  std::string path;
  std::string token;
};

// Persistent tile bookkeeping. Implementations must be safe to call from
// several worker threads and throw pipeline::StorageError on failure.
class MetadataStore {
public:
  virtual ~MetadataStore() = default;

  virtual std::optional<TileRecord> find_tile_by_id(const std::string& tile_id) = 0;
  // Throws pipeline::DuplicateError when tile_id is already recorded
  virtual void create_tile_record(const std::string& tile_id, const std::string& tile_url) = 0;
  // Persists the processed tile count of a job
  virtual void update_progress_counter(const std::string& job_id, uint64_t processed) = 0;
  // Returns the id of the new record, used as the job id
  virtual std::string create_tile_info_record(const TileInfoRecord& record) = 0;
  virtual void create_pyramid_level_record(const std::string& job_id,
                                           const pyramid::PyramidLevel& level) = 0;
};

} // namespace store
} // namespace deepzoom

#endif // DEEPZOOM_METADATA_STORE_HPP
