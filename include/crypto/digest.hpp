#ifndef DEEPZOOM_DIGEST_HPP
#define DEEPZOOM_DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace deepzoom::crypto {

using Bytes = std::vector<uint8_t>;

// ---- MESSAGE AUTHENTICATION ----
Bytes hmac_sha1(const Bytes& key, const std::string& message);
Bytes hmac_sha256(const Bytes& key, const std::string& message);

// ---- HASHING ----
Bytes sha256(const std::string& data);
Bytes sha256(const Bytes& data);

// ---- ENCODING ----
// Lowercase hex, two characters per byte
std::string to_hex(const Bytes& bytes);
// Throws std::invalid_argument on odd length or non-hex characters
Bytes from_hex(const std::string& hex);
// Standard base64 alphabet with '=' padding
std::string base64_encode(const Bytes& bytes);

} // namespace deepzoom::crypto

#endif // DEEPZOOM_DIGEST_HPP
