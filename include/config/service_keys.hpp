#ifndef DEEPZOOM_SERVICE_KEYS_HPP
#define DEEPZOOM_SERVICE_KEYS_HPP

#include <cstdint>
#include <vector>

namespace deepzoom {
namespace config {

// Keys taken from the tile service's web client. They can rotate without
// notice, so callers may override them (see Config::from_environment).
constexpr const char* DEFAULT_HMAC_KEY_HEX = "7b2b4e23de2cc5c5";
constexpr const char* DEFAULT_AES_KEY_HEX = "5b63db113b7af3e0b1435556c8f9530c";
constexpr const char* DEFAULT_AES_IV_HEX = "71e70405353a778bfa6fbc30321b9592";

struct ServiceKeys {
  std::vector<uint8_t> hmac_key;
  std::vector<uint8_t> aes_key;
  std::vector<uint8_t> aes_iv;

  // Keys decoded from the DEFAULT_*_HEX constants
  static ServiceKeys defaults();
};

} // namespace config
} // namespace deepzoom

#endif // DEEPZOOM_SERVICE_KEYS_HPP
