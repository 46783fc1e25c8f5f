#pragma once

#include "chunkswarm/crypto/crypto_types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkswarm::crypto {

// One encrypted chunk. Persisted and sent on the wire as
// nonce(12) || tag(16) || ciphertext.
struct EncryptedChunk {
    ChaCha20Nonce nonce{};
    AeadTag tag{};
    std::vector<std::uint8_t> ciphertext;

    static constexpr size_t HEADER_SIZE = CHACHA20_NONCE_SIZE + AEAD_TAG_SIZE;

    size_t total_size() const { return HEADER_SIZE + ciphertext.size(); }

    std::vector<std::uint8_t> serialize() const;
    static std::optional<EncryptedChunk> parse(std::span<const std::uint8_t> record);
};

// ChaCha20-Poly1305-IETF over single chunks. The associated data binds each
// ciphertext to its (fileId, chunkIndex) so chunks cannot be reordered or
// moved between files.
class ChunkCipher {
public:
    ChunkCipher();

    CryptoResult encrypt_chunk(const FileKey& key,
                               const std::string& file_id,
                               std::uint32_t chunk_index,
                               std::span<const std::uint8_t> plaintext,
                               EncryptedChunk& out) const;

    CryptoResult decrypt_chunk(const FileKey& key,
                               const std::string& file_id,
                               std::uint32_t chunk_index,
                               const EncryptedChunk& chunk,
                               std::vector<std::uint8_t>& out_plaintext) const;

    // Authenticates without keeping the plaintext.
    bool verify_chunk(const FileKey& key,
                      const std::string& file_id,
                      std::uint32_t chunk_index,
                      const EncryptedChunk& chunk) const;

    static std::vector<std::uint8_t> associated_data(const std::string& file_id, std::uint32_t chunk_index);
};

}
