#include "pyramid/tile_info_resolver.hpp"
#include "http/url.hpp"
#include "pipeline/tile_error.hpp"
#include <cctype>
#include <limits>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

namespace deepzoom {
namespace pyramid {

namespace pt = boost::property_tree;

namespace {

const char* const ROOT_ELEMENT = "TileInfo";
const char* const ATTRIBUTES = "<xmlattr>";
const char* const COMMENT = "<xmlcomment>";

bool is_url_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '/' || c == '_' || c == '-';
}

// Depth-first search for the first element called name
const pt::ptree* find_element(const pt::ptree& node, const std::string& name) {
  for (const auto& child : node) {
    if (child.first == ATTRIBUTES || child.first == COMMENT) {
      continue;
    }
    if (child.first == name) {
      return &child.second;
    }
    if (const pt::ptree* found = find_element(child.second, name)) {
      return found;
    }
  }
  return nullptr;
}

// Leading integer of value, like parseInt: whitespace, sign, digits, rest ignored
int64_t parse_integer(const std::string& attribute, const std::string& value) {
  size_t pos = 0;
  while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
    ++pos;
  }

  bool negative = false;
  if (pos < value.size() && (value[pos] == '-' || value[pos] == '+')) {
    negative = value[pos] == '-';
    ++pos;
  }

  const size_t digits_start = pos;
  int64_t result = 0;
  while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
    const int digit = value[pos] - '0';
    if (result > (std::numeric_limits<int64_t>::max() - digit) / 10) {
      throw pipeline::FormatError("Attribute " + attribute + " is out of range: " + value);
    }
    result = result * 10 + digit;
    ++pos;
  }

  if (pos == digits_start) {
    throw pipeline::FormatError("Attribute " + attribute + " is not numeric: '" + value + "'");
  }
  return negative ? -result : result;
}

int64_t integer_attribute(const pt::ptree& element, const std::string& name) {
  boost::optional<std::string> value = element.get_optional<std::string>(std::string(ATTRIBUTES) + "." + name);
  // Absent and empty both read as zero
  if (!value || value->empty()) {
    return 0;
  }
  return parse_integer(name, *value);
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

TileInfoResolver::TileInfoResolver(http::HttpClient& client)
  : client_(client) {}

//==============================================
// RESOLUTION
//==============================================

ResolvedImage TileInfoResolver::resolve(const std::string& base_asset_url) {
  BOOST_LOG_TRIVIAL(info) << "Tile info resolver: Resolving " << base_asset_url;

  ResolvedImage resolved;
  resolved.reference = find_descriptor(base_asset_url);
  resolved.tile_info = fetch_tile_info(resolved.reference);

  BOOST_LOG_TRIVIAL(info) << "Tile info resolver: " << base_asset_url << " is "
                          << resolved.tile_info.width << "x" << resolved.tile_info.height
                          << " with " << resolved.tile_info.pyramid_levels.size() << " levels and "
                          << resolved.tile_info.num_tiles << " tiles";
  return resolved;
}

DescriptorReference TileInfoResolver::find_descriptor(const std::string& base_asset_url) {
  BOOST_LOG_TRIVIAL(debug) << "Tile info resolver: Fetching asset page " << base_asset_url;

  http::HttpResponse response = client_.get(base_asset_url);
  DescriptorReference reference = extract_descriptor_reference(response.text());

  BOOST_LOG_TRIVIAL(debug) << "Tile info resolver: Found image URL " << reference.url
                           << " (path " << reference.path << ", token '" << reference.token << "')";
  return reference;
}

TileInfo TileInfoResolver::fetch_tile_info(const DescriptorReference& reference) {
  const std::string descriptor_url = reference.descriptor_url();
  BOOST_LOG_TRIVIAL(debug) << "Tile info resolver: Fetching descriptor " << descriptor_url;

  http::HttpResponse response = client_.get(descriptor_url);
  return parse_descriptor(response.text(), descriptor_url);
}

//==============================================
// PARSING
//==============================================

DescriptorReference TileInfoResolver::extract_descriptor_reference(const std::string& page) {
  static const std::string opener = ",\"//";

  for (size_t pos = page.find(opener); pos != std::string::npos; pos = page.find(opener, pos + 1)) {
    // The literal follows the closing bracket of the preceding array
    const bool after_bracket = (pos >= 1 && page[pos - 1] == ']') ||
                               (pos >= 2 && page[pos - 1] == '\n' && page[pos - 2] == ']');
    if (!after_bracket) {
      continue;
    }

    const size_t url_start = pos + 2;
    size_t url_end = url_start + 2;
    while (url_end < page.size() && is_url_char(page[url_end])) {
      ++url_end;
    }
    if (url_end == url_start + 2 || page.compare(url_end, 2, "\",") != 0) {
      continue;
    }

    std::string token;
    const size_t token_start = url_end + 2;
    if (page.compare(token_start, 4, "null") == 0) {
      token.clear();
    } else if (token_start < page.size() && page[token_start] == '"') {
      const size_t token_end = page.find('"', token_start + 1);
      if (token_end == std::string::npos || token_end == token_start + 1) {
        continue;
      }
      token = page.substr(token_start + 1, token_end - token_start - 1);
    } else {
      continue;
    }

    DescriptorReference reference;
    reference.url = "https:" + page.substr(url_start, url_end - url_start);
    reference.path = http::parse_url(reference.url).path().substr(1);
    reference.token = token;
    return reference;
  }

  BOOST_LOG_TRIVIAL(error) << "Tile info resolver: No image metadata URL in page of " << page.size() << " bytes";
  throw pipeline::DiscoveryError("Unable to find image metadata URL in asset page");
}

TileInfo TileInfoResolver::parse_descriptor(const std::string& xml, const std::string& origin) {
  pt::ptree document;
  std::istringstream input(xml);
  try {
    pt::read_xml(input, document);
  } catch (const pt::xml_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Tile info resolver: Malformed descriptor from " << origin << ": " << e.what();
    throw pipeline::FormatError(std::string("Malformed descriptor XML: ") + e.what());
  }

  const pt::ptree* root = find_element(document, ROOT_ELEMENT);
  if (!root) {
    throw pipeline::FormatError("Descriptor has no TileInfo element");
  }

  const int64_t tile_width = integer_attribute(*root, "tile_width");
  const int64_t tile_height = integer_attribute(*root, "tile_height");

  TileInfo info;
  info.origin = origin;
  info.tile_size = tile_width;
  info.full_pyramid_depth = integer_attribute(*root, "full_pyramid_depth");
  info.timestamp = integer_attribute(*root, "timestamp");
  info.tiler_version_number = root->get<std::string>(std::string(ATTRIBUTES) + ".tiler_version_number", "");

  for (const auto& child : *root) {
    if (child.first == ATTRIBUTES || child.first == COMMENT) {
      continue;
    }
    const pt::ptree& element = child.second;
    const int64_t num_tiles_x = integer_attribute(element, "num_tiles_x");
    const int64_t num_tiles_y = integer_attribute(element, "num_tiles_y");
    if (num_tiles_x < 0 || num_tiles_y < 0) {
      throw pipeline::FormatError("Negative tile count in pyramid level " +
                                  std::to_string(info.pyramid_levels.size()));
    }

    info.pyramid_levels.push_back(PyramidLevel::from_grid(
        num_tiles_x, num_tiles_y,
        integer_attribute(element, "inverse_scale"),
        integer_attribute(element, "empty_pels_x"),
        integer_attribute(element, "empty_pels_y"),
        tile_width, tile_height));
    info.num_tiles += info.pyramid_levels.back().tile_count();
  }

  if (info.pyramid_levels.empty()) {
    throw pipeline::FormatError("Descriptor has no pyramid levels");
  }

  const PyramidLevel& full_resolution = info.pyramid_levels.back();
  info.width = full_resolution.width;
  info.height = full_resolution.height;
  info.max_zoom_level = static_cast<int64_t>(info.pyramid_levels.size()) - 1;
  return info;
}

} // namespace pyramid
} // namespace deepzoom
