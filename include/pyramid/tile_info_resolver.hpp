#ifndef DEEPZOOM_TILE_INFO_RESOLVER_HPP
#define DEEPZOOM_TILE_INFO_RESOLVER_HPP

#include <string>
#include "http/http_client.hpp"
#include "pyramid/tile_info.hpp"

namespace deepzoom {
namespace pyramid {

// Tile service location embedded in an asset page
struct DescriptorReference {
  std::string url;     // absolute https URL of the image
  std::string path;    // URL path without the leading '/'
  std::string token;   // may be empty

  std::string descriptor_url() const { return url + "=g"; }
};

struct ResolvedImage {
  DescriptorReference reference;
  TileInfo tile_info;
};

class TileInfoResolver {
public:
  // ---- CONSTRUCTOR ----
  explicit TileInfoResolver(http::HttpClient& client);


  // ---- RESOLUTION ----
  // find_descriptor followed by fetch_tile_info
  ResolvedImage resolve(const std::string& base_asset_url);
  // Fetches the asset page; throws pipeline::DiscoveryError if no reference is embedded
  DescriptorReference find_descriptor(const std::string& base_asset_url);
  // Fetches {url}=g and parses it
  TileInfo fetch_tile_info(const DescriptorReference& reference);


  // ---- PARSING ----
  // Scans for `]` [newline] `,"//host/path",` followed by `"token"` or `null`
  static DescriptorReference extract_descriptor_reference(const std::string& page);
  // Throws pipeline::FormatError on malformed XML, a missing TileInfo
  // element, non-numeric attributes or an empty pyramid
  static TileInfo parse_descriptor(const std::string& xml, const std::string& origin);

private:
  // ---- PARAMETERS ----
  http::HttpClient& client_;
};

} // namespace pyramid
} // namespace deepzoom

#endif // DEEPZOOM_TILE_INFO_RESOLVER_HPP
