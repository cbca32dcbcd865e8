#include "store/rest_metadata_store.hpp"
#include "http/url.hpp"
#include "pipeline/tile_error.hpp"
#include <chrono>
#include <ctime>
#include <memory>
#include <sstream>
#include <utility>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace store {

namespace {

std::string trim_trailing_slash(std::string text) {
  while (!text.empty() && text.back() == '/') {
    text.pop_back();
  }
  return text;
}

// ISO-8601 UTC, the format the CMS expects for publishedAt
std::string iso_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S.000Z", &utc);
  return buffer;
}

bool mentions_unique(const std::string& body) {
  return body.find("unique") != std::string::npos;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

RestMetadataStore::RestMetadataStore(CmsOptions options, http::HttpClient& client)
  : options_(std::move(options))
  , client_(client) {
  options_.base_url = trim_trailing_slash(options_.base_url);
  if (options_.base_url.empty()) {
    throw pipeline::StorageError("CMS base URL is required");
  }
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Using CMS at " << options_.base_url;
}

//==============================================
// METADATA STORE OPERATIONS
//==============================================

std::optional<TileRecord> RestMetadataStore::find_tile_by_id(const std::string& tile_id) {
  const std::string target = "/api/tiles?" + http::url_encode("filters[tileID][$eq]") + "=" +
                             http::url_encode(tile_id) + "&" + http::url_encode("pagination[limit]") + "=1";
  const Json::Value response = send("GET", target, Json::Value());

  const Json::Value& data = response["data"];
  if (!data.isArray() || data.empty()) {
    return std::nullopt;
  }

  const Json::Value& entry = data[0];
  TileRecord record;
  record.tile_id = entry.get("tileID", tile_id).asString();
  record.tile_url = entry.get("tile_url", "").asString();
  return record;
}

void RestMetadataStore::create_tile_record(const std::string& tile_id, const std::string& tile_url) {
  Json::Value data;
  data["tileID"] = tile_id;
  data["tile_url"] = tile_url;
  data["publishedAt"] = iso_timestamp();
  send("POST", "/api/tiles", data);
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Recorded tile " << tile_id;
}

void RestMetadataStore::update_progress_counter(const std::string& job_id, uint64_t processed) {
  Json::Value data;
  data["scrapedTiles"] = Json::UInt64(processed);
  send("PUT", "/api/tile-infos/" + http::url_encode(job_id), data);
}

std::string RestMetadataStore::create_tile_info_record(const TileInfoRecord& record) {
  const pyramid::TileInfo& info = record.tile_info;

  Json::Value data;
  data["totalTiles"] = Json::UInt64(info.num_tiles);
  data["scrapedTiles"] = 0;
  data["width"] = Json::Int64(info.width);
  data["height"] = Json::Int64(info.height);
  data["tileSize"] = Json::Int64(info.tile_size);
  data["maxZoomLevel"] = Json::Int64(info.max_zoom_level);
  data["originUrl"] = record.origin_url;
  data["gapDataToken"] = record.token;
  data["gapDataPath"] = record.path;
  data["fullPyramidDepth"] = Json::Int64(info.full_pyramid_depth);
  data["publishedAt"] = iso_timestamp();

  const Json::Value response = send("POST", "/api/tile-infos", data);
  const Json::Value& created = response["data"];

  std::string job_id;
  if (created.isMember("documentId")) {
    job_id = created["documentId"].asString();
  } else if (created.isMember("id")) {
    job_id = created["id"].isString() ? created["id"].asString()
                                      : std::to_string(created["id"].asLargestUInt());
  }
  if (job_id.empty()) {
    throw pipeline::StorageError("Tile info record created without an id");
  }

  BOOST_LOG_TRIVIAL(info) << "Metadata store: Created tile info record " << job_id
                          << " for " << info.num_tiles << " tiles";
  return job_id;
}

void RestMetadataStore::create_pyramid_level_record(const std::string& job_id,
                                                    const pyramid::PyramidLevel& level) {
  Json::Value data;
  data["numTilesX"] = Json::Int64(level.num_tiles_x);
  data["numTilesY"] = Json::Int64(level.num_tiles_y);
  data["inverseScale"] = Json::Int64(level.inverse_scale);
  data["emptyPelsX"] = Json::Int64(level.empty_pels_x);
  data["emptyPelsY"] = Json::Int64(level.empty_pels_y);
  data["width"] = Json::Int64(level.width);
  data["height"] = Json::Int64(level.height);
  data["tile_info"] = job_id;
  data["publishedAt"] = iso_timestamp();
  send("POST", "/api/pyramid-levels", data);
}

//==============================================
// JSON
//==============================================

std::string RestMetadataStore::to_json(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

Json::Value RestMetadataStore::parse_json(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    throw pipeline::StorageError("Unable to parse CMS response: " + errors);
  }
  return root;
}

//==============================================
// REQUESTS
//==============================================

Json::Value RestMetadataStore::send(const std::string& method, const std::string& target,
                                    const Json::Value& data) {
  http::HttpRequest request;
  request.method = method;
  request.url = options_.base_url + target;
  request.headers["accept"] = "application/json";
  if (!options_.api_token.empty()) {
    request.headers["authorization"] = "Bearer " + options_.api_token;
  }
  if (!data.isNull()) {
    Json::Value body;
    body["data"] = data;
    request.headers["content-type"] = "application/json";
    request.body = to_json(body);
  }

  http::HttpResponse response;
  try {
    response = client_.perform(request);
  } catch (const pipeline::NetworkError& e) {
    throw pipeline::StorageError(method + " " + target + " failed: " + e.what());
  }

  const std::string text = response.text();
  if (!response.ok()) {
    if (response.status == 400 && mentions_unique(text)) {
      throw pipeline::DuplicateError(method + " " + target + ": " + text.substr(0, 256));
    }
    BOOST_LOG_TRIVIAL(error) << "Metadata store: " << method << " " << target
                             << " returned status " << response.status << ": " << text.substr(0, 512);
    throw pipeline::StorageError(method + " " + target + " returned status " +
                                 std::to_string(response.status));
  }

  if (text.empty()) {
    return Json::Value();
  }
  return parse_json(text);
}

} // namespace store
} // namespace deepzoom
