#ifndef DEEPZOOM_TILE_DECRYPTOR_HPP
#define DEEPZOOM_TILE_DECRYPTOR_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include "aes_cipher.hpp"

namespace deepzoom::crypto {

// Decodes the tile container:
//   marker(u32 BE) | prefix(index) | count(u32 LE) | encrypted(count) | suffix | index(u32 LE)
// Buffers without the marker are plain images and pass through untouched.
class TileDecryptor {
public:

  static constexpr uint32_t CONTAINER_MARKER = 0x0A0A0A0A;
  static constexpr size_t MARKER_SIZE = 4;
  static constexpr size_t INDEX_SIZE = 4;
  static constexpr size_t PAD_SIZE = 32;
  static constexpr uint8_t PAD_FILL = 16;

  // ---- CONSTRUCTORS ----
  // Uses config::ServiceKeys::defaults()
  TileDecryptor();
  TileDecryptor(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);


  // ---- DECRYPTION ----
  // Throws pipeline::FormatError when container offsets leave the buffer
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& buffer) const;
  static bool is_container(const std::vector<uint8_t>& buffer);


  // ---- GETTERS ----
  const std::vector<uint8_t>& pad() const { return pad_; }
  const AesCipher& cipher() const { return cipher_; }

private:
  // ---- PARAMETERS ----
  AesCipher cipher_;
  // Encryption of PAD_SIZE bytes of PAD_FILL, appended so the tail decrypts
  std::vector<uint8_t> pad_;


  // ---- DECRYPTION ----
  std::vector<uint8_t> decrypt_segment(const uint8_t* data, size_t length) const;
};

} // namespace deepzoom::crypto

#endif // DEEPZOOM_TILE_DECRYPTOR_HPP
