#include "signing/url_signer.hpp"
#include "config/service_keys.hpp"
#include "crypto/digest.hpp"
#include "http/url.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace deepzoom {
namespace signing {

//==============================================
// CONSTRUCTORS
//==============================================

UrlSigner::UrlSigner()
  : UrlSigner(config::ServiceKeys::defaults().hmac_key) {}

UrlSigner::UrlSigner(const std::vector<uint8_t>& hmac_key)
  : hmac_key_(hmac_key) {}

//==============================================
// SIGNING
//==============================================

std::string UrlSigner::compute_signed_path(const std::string& path, const std::string& token,
                                           uint32_t x, uint32_t y, uint32_t z) const {
  const std::string unsigned_path = make_path(path, token, x, y, z);
  const std::string signature = encode_signature(crypto::hmac_sha1(hmac_key_, unsigned_path));

  BOOST_LOG_TRIVIAL(trace) << "Url signer: Signed " << unsigned_path << " -> " << signature;
  return make_path(path, signature, x, y, z);
}

//==============================================
// PATH HELPERS
//==============================================

std::string UrlSigner::make_path(const std::string& path, const std::string& token,
                                 uint32_t x, uint32_t y, uint32_t z) {
  std::ostringstream ss;
  ss << path << "=x" << x << "-y" << y << "-z" << z << "-t" << token;
  return ss.str();
}

std::string UrlSigner::encode_signature(const std::vector<uint8_t>& digest) {
  std::string encoded = crypto::base64_encode(digest);
  for (char& c : encoded) {
    if (c == '+' || c == '/') {
      c = '_';
    }
  }
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  return encoded;
}

std::string UrlSigner::tile_key(const std::string& token, uint32_t x, uint32_t y, uint32_t z) {
  std::ostringstream ss;
  ss << token << "/" << x << "/" << y << "/" << z;
  return ss.str();
}

std::string UrlSigner::tile_url(const std::string& origin, const std::string& signed_path) {
  return http::resolve_relative("/" + signed_path, origin);
}

} // namespace signing
} // namespace deepzoom
