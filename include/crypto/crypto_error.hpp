#ifndef DEEPZOOM_CRYPTO_ERROR_HPP
#define DEEPZOOM_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace deepzoom::crypto {

// OpenSSL step that failed
enum class CryptoOperation {
    CIPHER_SETUP,
    ENCRYPT,
    DECRYPT,
    DIGEST
};

inline const char* crypto_operation_to_string(CryptoOperation operation) {
    switch (operation) {
        case CryptoOperation::CIPHER_SETUP: return "Initialization";
        case CryptoOperation::ENCRYPT:      return "Encryption";
        case CryptoOperation::DECRYPT:      return "Decryption";
        case CryptoOperation::DIGEST:       return "Digest";
        default:                            return "Crypto";
    }
}

// Base for every OpenSSL failure. Tile processing counts these under ErrorKind::CRYPTO.
class CryptoError : public std::runtime_error {
public:
    CryptoError(CryptoOperation operation, const std::string& message)
        : std::runtime_error(std::string(crypto_operation_to_string(operation)) + " error: " + message)
        , operation_(operation) {}

    CryptoOperation operation() const { return operation_; }

private:
    CryptoOperation operation_;
};

// Bad key or IV size, or a cipher context that could not be allocated
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError(CryptoOperation::CIPHER_SETUP, message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError(CryptoOperation::ENCRYPT, message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError(CryptoOperation::DECRYPT, message) {}
};

// HMAC, SHA-256 or base64 failure
class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError(CryptoOperation::DIGEST, message) {}
};

} // namespace deepzoom::crypto

#endif // DEEPZOOM_CRYPTO_ERROR_HPP
