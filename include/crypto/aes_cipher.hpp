#ifndef DEEPZOOM_AES_CIPHER_HPP
#define DEEPZOOM_AES_CIPHER_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include "crypto_error.hpp"

namespace deepzoom::crypto {

// AES-128-CBC over whole buffers with OpenSSL padding disabled.
// Every call runs on its own cipher context, so one instance can be
// shared between worker threads.
class AesCipher {
public:

  static constexpr size_t KEY_SIZE = 16;     // 128 bits for AES-128
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR ----
  AesCipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);

  
  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Input length must be a multiple of BLOCK_SIZE
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& input) const;
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& input) const;

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;
  std::vector<uint8_t> iv_;


  // ---- BUFFER PROCESSING ----
  // Runs input through a freshly initialized cipher context
  std::vector<uint8_t> process(const std::vector<uint8_t>& input, bool encrypting) const;
};
  
} // namespace deepzoom::crypto

#endif // DEEPZOOM_AES_CIPHER_HPP
