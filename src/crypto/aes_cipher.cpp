#include "crypto/aes_cipher.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace deepzoom::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("AES cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

AesCipher::AesCipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv)
  : key_(key)
  , iv_(iv) {
  if (key_.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "AES cipher: Invalid key size: " << key_.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }
  if (iv_.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "AES cipher: Invalid IV size: " << iv_.size() << " bytes (expected " << IV_SIZE << " bytes)";
    throw InitializationError("Invalid IV size");
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::vector<uint8_t> AesCipher::encrypt(const std::vector<uint8_t>& input) const {
  return process(input, true);
}

std::vector<uint8_t> AesCipher::decrypt(const std::vector<uint8_t>& input) const {
  return process(input, false);
}

//==============================================
// BUFFER PROCESSING
//==============================================

std::vector<uint8_t> AesCipher::process(const std::vector<uint8_t>& input, bool encrypting) const {
  BOOST_LOG_TRIVIAL(trace) << "AES cipher: " << (encrypting ? "Encrypting " : "Decrypting ") << input.size() << " bytes";

  if (input.size() % BLOCK_SIZE != 0) {
    if (encrypting) {
      throw EncryptionError("AES cipher: Input is not block aligned");
    }
    throw DecryptionError("AES cipher: Input is not block aligned");
  }

  CipherContext context;
  const EVP_CIPHER* cipher = EVP_aes_128_cbc();

  if (!EVP_CipherInit_ex(context.get(), cipher, nullptr, key_.data(), iv_.data(), encrypting ? 1 : 0)) {
    if (encrypting) {
      throw EncryptionError("AES cipher: Failed to initialize encryption context");
    }
    throw DecryptionError("AES cipher: Failed to initialize decryption context");
  }

  // Block alignment is enforced above, no padding is added or stripped
  EVP_CIPHER_CTX_set_padding(context.get(), 0);

  std::vector<uint8_t> output(input.size() + BLOCK_SIZE);
  int outlen = 0;
  if (!EVP_CipherUpdate(context.get(), output.data(), &outlen,
                        input.data(), static_cast<int>(input.size()))) {
    if (encrypting) {
      throw EncryptionError("AES cipher: Failed to encrypt data");
    }
    throw DecryptionError("AES cipher: Failed to decrypt data");
  }

  int final_outlen = 0;
  if (!EVP_CipherFinal_ex(context.get(), output.data() + outlen, &final_outlen)) {
    if (encrypting) {
      throw EncryptionError("AES cipher: Failed to finalize encryption");
    }
    throw DecryptionError("AES cipher: Failed to finalize decryption");
  }

  output.resize(static_cast<size_t>(outlen + final_outlen));
  return output;
}

} // namespace deepzoom::crypto
