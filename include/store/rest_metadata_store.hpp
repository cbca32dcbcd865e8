#ifndef DEEPZOOM_REST_METADATA_STORE_HPP
#define DEEPZOOM_REST_METADATA_STORE_HPP

#include <string>
#include <json/json.h>
#include "http/http_client.hpp"
#include "store/metadata_store.hpp"

namespace deepzoom {
namespace store {

struct CmsOptions {
  std::string base_url;
  std::string api_token;   // sent as a bearer token when not empty
};

// MetadataStore over the CMS document REST API:
//   GET  /api/tiles?filters[tileID][$eq]={id}
//   POST /api/tiles, /api/tile-infos, /api/pyramid-levels
//   PUT  /api/tile-infos/{id}
class RestMetadataStore : public MetadataStore {
public:
  // ---- CONSTRUCTOR ----
  RestMetadataStore(CmsOptions options, http::HttpClient& client);


  // ---- METADATA STORE OPERATIONS ----
  std::optional<TileRecord> find_tile_by_id(const std::string& tile_id) override;
  void create_tile_record(const std::string& tile_id, const std::string& tile_url) override;
  void update_progress_counter(const std::string& job_id, uint64_t processed) override;
  std::string create_tile_info_record(const TileInfoRecord& record) override;
  void create_pyramid_level_record(const std::string& job_id,
                                   const pyramid::PyramidLevel& level) override;


  // ---- JSON ----
  static std::string to_json(const Json::Value& value);
  // Throws pipeline::StorageError on malformed JSON
  static Json::Value parse_json(const std::string& text);

private:
  // ---- PARAMETERS ----
  CmsOptions options_;
  http::HttpClient& client_;


  // ---- REQUESTS ----
  // Sends {"data": data} (or no body when data is null) and returns the parsed response.
  // 400 responses mentioning "unique" throw DuplicateError, other failures StorageError.
  Json::Value send(const std::string& method, const std::string& target, const Json::Value& data);
};

} // namespace store
} // namespace deepzoom

#endif // DEEPZOOM_REST_METADATA_STORE_HPP
