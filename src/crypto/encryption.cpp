#include "chunkswarm/crypto/encryption.hpp"
#include "chunkswarm/crypto/random.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace chunkswarm::crypto {

namespace {
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_array(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data) {
        buffer.insert(buffer.end(), data.begin(), data.end());
    }
}

std::vector<std::uint8_t> EncryptedChunk::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(total_size());

    write_array(buffer, std::span(nonce));
    write_array(buffer, std::span(tag));
    write_array(buffer, ciphertext);

    return buffer;
}

std::optional<EncryptedChunk> EncryptedChunk::parse(std::span<const std::uint8_t> record) {
    if (record.size() <= HEADER_SIZE) {
        return std::nullopt;
    }

    EncryptedChunk chunk;
    std::copy_n(record.begin(), CHACHA20_NONCE_SIZE, chunk.nonce.begin());
    std::copy_n(record.begin() + CHACHA20_NONCE_SIZE, AEAD_TAG_SIZE, chunk.tag.begin());
    chunk.ciphertext.assign(record.begin() + HEADER_SIZE, record.end());
    return chunk;
}

ChunkCipher::ChunkCipher() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium for chunk encryption");
    }
}

std::vector<std::uint8_t> ChunkCipher::associated_data(const std::string& file_id, std::uint32_t chunk_index) {
    std::vector<std::uint8_t> aad;
    aad.reserve(file_id.size() + 4);
    aad.insert(aad.end(), file_id.begin(), file_id.end());
    write_uint32(aad, chunk_index);
    return aad;
}

CryptoResult ChunkCipher::encrypt_chunk(const FileKey& key,
                                        const std::string& file_id,
                                        std::uint32_t chunk_index,
                                        std::span<const std::uint8_t> plaintext,
                                        EncryptedChunk& out) const {
    if (plaintext.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Chunk plaintext cannot be empty");
    }

    auto aad = associated_data(file_id, chunk_index);
    out.nonce = SecureRandom::generate_nonce();
    out.ciphertext.resize(plaintext.size());

    unsigned long long tag_len = 0;
    int result = crypto_aead_chacha20poly1305_ietf_encrypt_detached(
        out.ciphertext.data(),
        out.tag.data(),
        &tag_len,
        plaintext.data(),
        plaintext.size(),
        aad.data(),
        aad.size(),
        nullptr,
        out.nonce.data(),
        key.data());

    if (result != 0 || tag_len != AEAD_TAG_SIZE) {
        return CryptoResult(CryptoError::ENCRYPTION_FAILED, "ChaCha20-Poly1305 encryption failed");
    }
    return CryptoResult();
}

CryptoResult ChunkCipher::decrypt_chunk(const FileKey& key,
                                        const std::string& file_id,
                                        std::uint32_t chunk_index,
                                        const EncryptedChunk& chunk,
                                        std::vector<std::uint8_t>& out_plaintext) const {
    if (chunk.ciphertext.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Ciphertext cannot be empty");
    }

    auto aad = associated_data(file_id, chunk_index);
    out_plaintext.resize(chunk.ciphertext.size());

    int result = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
        out_plaintext.data(),
        nullptr,
        chunk.ciphertext.data(),
        chunk.ciphertext.size(),
        chunk.tag.data(),
        aad.data(),
        aad.size(),
        chunk.nonce.data(),
        key.data());

    if (result != 0) {
        sodium_memzero(out_plaintext.data(), out_plaintext.size());
        out_plaintext.clear();
        return CryptoResult(CryptoError::DECRYPTION_FAILED,
                            "Authentication failed for chunk " + std::to_string(chunk_index));
    }
    return CryptoResult();
}

bool ChunkCipher::verify_chunk(const FileKey& key,
                               const std::string& file_id,
                               std::uint32_t chunk_index,
                               const EncryptedChunk& chunk) const {
    std::vector<std::uint8_t> scratch;
    bool ok = decrypt_chunk(key, file_id, chunk_index, chunk, scratch).success();
    if (!scratch.empty()) {
        sodium_memzero(scratch.data(), scratch.size());
    }
    return ok;
}

}
