#include "crypto/tile_decryptor.hpp"
#include "crypto/byte_order.hpp"
#include "config/service_keys.hpp"
#include "pipeline/tile_error.hpp"
#include <boost/log/trivial.hpp>
#include <cstddef>
#include <string>

namespace deepzoom::crypto {

//==============================================
// CONSTRUCTORS
//==============================================

TileDecryptor::TileDecryptor()
  : TileDecryptor(config::ServiceKeys::defaults().aes_key,
                  config::ServiceKeys::defaults().aes_iv) {}

TileDecryptor::TileDecryptor(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv)
  : cipher_(key, iv) {
  pad_ = cipher_.encrypt(std::vector<uint8_t>(PAD_SIZE, PAD_FILL));
  BOOST_LOG_TRIVIAL(debug) << "Tile decryptor: Computed " << pad_.size() << " byte pad block";
}

//==============================================
// DECRYPTION
//==============================================

bool TileDecryptor::is_container(const std::vector<uint8_t>& buffer) {
  if (buffer.size() < MARKER_SIZE) {
    return false;
  }
  return ByteOrder::readBigU32(buffer.data()) == CONTAINER_MARKER;
}

std::vector<uint8_t> TileDecryptor::decrypt(const std::vector<uint8_t>& buffer) const {
  if (!is_container(buffer)) {
    BOOST_LOG_TRIVIAL(debug) << "Tile decryptor: No container marker, passing " << buffer.size() << " bytes through";
    return buffer;
  }

  const uint64_t length = buffer.size();
  if (length < MARKER_SIZE + INDEX_SIZE) {
    throw pipeline::FormatError("Container too short: " + std::to_string(length) + " bytes");
  }
  const uint64_t trailer_start = length - INDEX_SIZE;

  // Offsets are widened to 64 bits so hostile values cannot wrap
  const uint64_t index = ByteOrder::readLittleU32(buffer.data() + trailer_start);
  const uint64_t prefix_end = MARKER_SIZE + index;
  if (prefix_end + sizeof(uint32_t) > trailer_start) {
    throw pipeline::FormatError("Clear prefix length " + std::to_string(index) +
                                " exceeds container of " + std::to_string(length) + " bytes");
  }

  const uint64_t replace_count = ByteOrder::readLittleU32(buffer.data() + prefix_end);
  const uint64_t encrypted_start = prefix_end + sizeof(uint32_t);
  const uint64_t suffix_start = encrypted_start + replace_count;
  if (suffix_start > trailer_start) {
    throw pipeline::FormatError("Encrypted length " + std::to_string(replace_count) +
                                " exceeds container of " + std::to_string(length) + " bytes");
  }
  if (replace_count % AesCipher::BLOCK_SIZE != 0) {
    throw pipeline::FormatError("Encrypted length " + std::to_string(replace_count) +
                                " is not a multiple of the cipher block size");
  }

  BOOST_LOG_TRIVIAL(debug) << "Tile decryptor: Container with prefix " << index
                           << " bytes, encrypted " << replace_count
                           << " bytes, suffix " << (trailer_start - suffix_start) << " bytes";

  std::vector<uint8_t> decrypted = decrypt_segment(buffer.data() + encrypted_start,
                                                   static_cast<size_t>(replace_count));

  std::vector<uint8_t> output;
  output.reserve(static_cast<size_t>(index + decrypted.size() + (trailer_start - suffix_start)));
  const auto begin = buffer.begin();
  output.insert(output.end(), begin + MARKER_SIZE, begin + static_cast<std::ptrdiff_t>(prefix_end));
  output.insert(output.end(), decrypted.begin(), decrypted.end());
  output.insert(output.end(), begin + static_cast<std::ptrdiff_t>(suffix_start),
                begin + static_cast<std::ptrdiff_t>(trailer_start));
  return output;
}

std::vector<uint8_t> TileDecryptor::decrypt_segment(const uint8_t* data, size_t length) const {
  std::vector<uint8_t> padded(data, data + length);
  padded.insert(padded.end(), pad_.begin(), pad_.end());

  std::vector<uint8_t> decrypted = cipher_.decrypt(padded);
  // The pad tail carries no payload
  decrypted.resize(decrypted.size() - PAD_SIZE);
  return decrypted;
}

} // namespace deepzoom::crypto
