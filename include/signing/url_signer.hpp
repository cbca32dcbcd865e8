#ifndef DEEPZOOM_URL_SIGNER_HPP
#define DEEPZOOM_URL_SIGNER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace deepzoom {
namespace signing {

// Signs tile request paths the way the tile service's web client does:
//   {path}=x{x}-y{y}-z{z}-t{signature}
// where signature is the HMAC-SHA1 of the same template carrying the
// page token, base64 encoded with '+' and '/' mapped to '_' and no '='.
class UrlSigner {
public:
  // ---- CONSTRUCTORS ----
  // Uses config::ServiceKeys::defaults().hmac_key
  UrlSigner();
  explicit UrlSigner(const std::vector<uint8_t>& hmac_key);


  // ---- SIGNING ----
  std::string compute_signed_path(const std::string& path, const std::string& token,
                                  uint32_t x, uint32_t y, uint32_t z) const;


  // ---- PATH HELPERS ----
  static std::string make_path(const std::string& path, const std::string& token,
                               uint32_t x, uint32_t y, uint32_t z);
  // Base64 with '+' and '/' replaced by '_' and trailing '=' removed
  static std::string encode_signature(const std::vector<uint8_t>& digest);
  // Key identifying a tile in the upload map: {token}/{x}/{y}/{z}
  static std::string tile_key(const std::string& token, uint32_t x, uint32_t y, uint32_t z);
  // Absolute tile URL for a signed path, resolved against the descriptor origin
  static std::string tile_url(const std::string& origin, const std::string& signed_path);

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> hmac_key_;
};

} // namespace signing
} // namespace deepzoom

#endif // DEEPZOOM_URL_SIGNER_HPP
