#ifndef DEEPZOOM_TILE_ERROR_HPP
#define DEEPZOOM_TILE_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace deepzoom {
namespace pipeline {

enum class ErrorKind {
    NONE = 0,
    DISCOVERY,
    FORMAT,
    NETWORK,
    DUPLICATE,
    STORAGE,
    CRYPTO,
    UNKNOWN
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::DISCOVERY: return "DiscoveryError";
        case ErrorKind::FORMAT: return "FormatError";
        case ErrorKind::NETWORK: return "NetworkError";
        case ErrorKind::DUPLICATE: return "DuplicateError";
        case ErrorKind::STORAGE: return "StorageError";
        case ErrorKind::CRYPTO: return "CryptoError";
        case ErrorKind::UNKNOWN: return "UnknownError";
        default: return "Undefined error";
    }
}

class TileError : public std::runtime_error {
public:
    TileError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Expected metadata literal not found on the asset page
class DiscoveryError : public TileError {
public:
    explicit DiscoveryError(const std::string& message)
        : TileError(ErrorKind::DISCOVERY, "Discovery error: " + message) {}
};

// Malformed descriptor XML or container offsets outside the buffer
class FormatError : public TileError {
public:
    explicit FormatError(const std::string& message)
        : TileError(ErrorKind::FORMAT, "Format error: " + message) {}
};

class NetworkError : public TileError {
public:
    explicit NetworkError(const std::string& message,
                          std::optional<unsigned> status = std::nullopt)
        : TileError(ErrorKind::NETWORK, "Network error: " + message), status_(status) {}

    // HTTP status when the failure was a non-2xx response
    std::optional<unsigned> status() const { return status_; }

private:
    std::optional<unsigned> status_;
};

// Uniqueness violation reported by the metadata store
class DuplicateError : public TileError {
public:
    explicit DuplicateError(const std::string& message)
        : TileError(ErrorKind::DUPLICATE, "Duplicate error: " + message) {}
};

class StorageError : public TileError {
public:
    explicit StorageError(const std::string& message)
        : TileError(ErrorKind::STORAGE, "Storage error: " + message) {}
};

} // namespace pipeline
} // namespace deepzoom

#endif // DEEPZOOM_TILE_ERROR_HPP
