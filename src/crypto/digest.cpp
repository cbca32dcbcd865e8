#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace deepzoom::crypto {

namespace {

Bytes compute_hmac(const EVP_MD* md, const Bytes& key, const std::string& message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (!HMAC(md, key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(message.data()), message.size(),
            digest, &digest_len)) {
    throw DigestError("Failed to compute HMAC");
  }

  return Bytes(digest, digest + digest_len);
}

Bytes compute_digest(const EVP_MD* md, const void* data, size_t length) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw DigestError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, md, nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, data, length)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);
  return Bytes(hash, hash + hash_len);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// MESSAGE AUTHENTICATION
//==============================================

Bytes hmac_sha1(const Bytes& key, const std::string& message) {
  return compute_hmac(EVP_sha1(), key, message);
}

Bytes hmac_sha256(const Bytes& key, const std::string& message) {
  return compute_hmac(EVP_sha256(), key, message);
}

//==============================================
// HASHING
//==============================================

Bytes sha256(const std::string& data) {
  return compute_digest(EVP_sha256(), data.data(), data.size());
}

Bytes sha256(const Bytes& data) {
  return compute_digest(EVP_sha256(), data.data(), data.size());
}

//==============================================
// ENCODING
//==============================================

std::string to_hex(const Bytes& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(byte);
  }
  return ss.str();
}

Bytes from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Hex string has odd length");
  }

  Bytes bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Invalid hex character in: " + hex);
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return bytes;
}

std::string base64_encode(const Bytes& bytes) {
  if (bytes.empty()) {
    return std::string();
  }

  std::string encoded(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                bytes.data(), static_cast<int>(bytes.size()));
  if (written < 0) {
    throw DigestError("Failed to base64 encode");
  }
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

} // namespace deepzoom::crypto
