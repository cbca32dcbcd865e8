#include "http/url.hpp"
#include "pipeline/tile_error.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace deepzoom {
namespace http {

namespace {

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// First "word:" run in text, e.g. "https:"
std::string find_protocol(const std::string& text) {
  for (size_t i = 0; i < text.size(); ++i) {
    if (!is_word_char(text[i])) {
      continue;
    }
    size_t end = i;
    while (end < text.size() && is_word_char(text[end])) {
      ++end;
    }
    if (end < text.size() && text[end] == ':') {
      return text.substr(i, end - i + 1);
    }
    i = end;
  }
  return "http:";
}

// base with its last "/segment" removed
std::string strip_last_segment(const std::string& base) {
  const auto slash = base.rfind('/');
  if (slash == std::string::npos) {
    return base;
  }
  return base.substr(0, slash);
}

// "scheme://authority/" prefix of base
std::string root_of(const std::string& base) {
  const auto scheme_end = base.find("://");
  const size_t authority_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
  const auto slash = base.find('/', authority_start);
  if (slash == std::string::npos) {
    return scheme_end == std::string::npos ? base : base + "/";
  }
  return base.substr(0, slash + 1);
}

} // namespace

//==============================================
// URL
//==============================================

std::string Url::authority() const {
  if ((scheme == "https" && port == "443") || (scheme == "http" && port == "80")) {
    return host;
  }
  return host + ":" + port;
}

std::string Url::path() const {
  const auto end = target.find_first_of("?#");
  return end == std::string::npos ? target : target.substr(0, end);
}

std::string Url::to_string() const {
  return scheme + "://" + authority() + target;
}

Url parse_url(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw pipeline::NetworkError("Not an absolute URL: " + url);
  }

  Url parsed;
  parsed.scheme = url.substr(0, scheme_end);
  std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw pipeline::NetworkError("Unsupported URL scheme: " + parsed.scheme);
  }

  const size_t authority_start = scheme_end + 3;
  const auto authority_end = url.find_first_of("/?#", authority_start);
  const std::string authority = url.substr(authority_start,
      authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);
  if (authority.empty()) {
    throw pipeline::NetworkError("URL has no host: " + url);
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
    if (parsed.port.empty() ||
        !std::all_of(parsed.port.begin(), parsed.port.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      throw pipeline::NetworkError("Invalid port in URL: " + url);
    }
  } else {
    parsed.host = authority;
    parsed.port = parsed.is_tls() ? "443" : "80";
  }

  if (authority_end == std::string::npos) {
    parsed.target = "/";
  } else {
    parsed.target = url.substr(authority_end);
    if (parsed.target[0] != '/') {
      parsed.target = "/" + parsed.target;
    }
    const auto fragment = parsed.target.find('#');
    if (fragment != std::string::npos) {
      parsed.target.erase(fragment);
    }
  }
  return parsed;
}

//==============================================
// REFERENCE RESOLUTION
//==============================================

std::string resolve_relative(const std::string& path, const std::string& base) {
  // Absolute URL
  if (path.find("://") != std::string::npos) {
    return path;
  }
  // Protocol-relative URL
  if (path.rfind("//", 0) == 0) {
    return find_protocol(base) + path;
  }
  // Upper directory
  if (path.rfind("../", 0) == 0) {
    return resolve_relative(path.substr(3), strip_last_segment(base));
  }
  // Relative to the root
  if (!path.empty() && path[0] == '/') {
    return root_of(base) + path.substr(1);
  }
  // Relative to the current directory
  return strip_last_segment(base) + "/" + path;
}

//==============================================
// ENCODING
//==============================================

std::string url_encode(const std::string& text, bool encode_slash) {
  std::ostringstream ss;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        (c == '/' && !encode_slash)) {
      ss << c;
    } else {
      ss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
         << static_cast<int>(c) << std::nouppercase << std::dec;
    }
  }
  return ss.str();
}

} // namespace http
} // namespace deepzoom
