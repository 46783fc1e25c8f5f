#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace chunkswarm::crypto {

constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;

constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t AEAD_TAG_SIZE = POLY1305_TAG_SIZE;

constexpr size_t DIGEST_SIZE = 32;
constexpr size_t HASH_KEY_SIZE = 32;

using FileKey = std::array<std::uint8_t, CHACHA20_KEY_SIZE>;
using ChaCha20Nonce = std::array<std::uint8_t, CHACHA20_NONCE_SIZE>;
using AeadTag = std::array<std::uint8_t, AEAD_TAG_SIZE>;

// BLAKE2b-256 digest (libsodium generichash).
using Digest = std::array<std::uint8_t, DIGEST_SIZE>;
using HashKey = std::array<std::uint8_t, HASH_KEY_SIZE>;

// Keeps a copy of a file key for one scope and wipes it on exit.
class ScopedFileKey {
public:
    explicit ScopedFileKey(const FileKey& key) : key_(key) {}
    ~ScopedFileKey();

    ScopedFileKey(const ScopedFileKey&) = delete;
    ScopedFileKey& operator=(const ScopedFileKey&) = delete;

    const FileKey& get() const { return key_; }

private:
    FileKey key_;
};

enum class CryptoError {
    SUCCESS = 0,
    NOT_INITIALIZED,
    INVALID_KEY,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    BUFFER_TOO_SMALL,
    VERIFICATION_FAILED,
    FILE_ERROR,
    KEY_UNAVAILABLE
};

struct CryptoResult {
    CryptoError error;
    std::string message;

    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

// Wipes a fixed-size key in place.
void wipe(std::span<std::uint8_t> bytes);

}
