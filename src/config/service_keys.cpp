#include "config/service_keys.hpp"
#include "crypto/digest.hpp"

namespace deepzoom {
namespace config {

ServiceKeys ServiceKeys::defaults() {
  ServiceKeys keys;
  keys.hmac_key = crypto::from_hex(DEFAULT_HMAC_KEY_HEX);
  keys.aes_key = crypto::from_hex(DEFAULT_AES_KEY_HEX);
  keys.aes_iv = crypto::from_hex(DEFAULT_AES_IV_HEX);
  return keys;
}

} // namespace config
} // namespace deepzoom
