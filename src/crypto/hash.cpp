#include "chunkswarm/crypto/hash.hpp"
#include <sodium.h>
#include <fstream>
#include <vector>

namespace chunkswarm::crypto {

struct Hasher::Impl {
    crypto_generichash_state state;
};

Hasher::Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Hasher::~Hasher() = default;

CryptoResult Hasher::initialize(const HashKey* key) {
    const std::uint8_t* key_data = key ? key->data() : nullptr;
    size_t key_size = key ? key->size() : 0;

    if (crypto_generichash_init(&impl_->state, key_data, key_size, DIGEST_SIZE) != 0) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Failed to initialize hasher");
    }

    initialized_ = true;
    return CryptoResult();
}

CryptoResult Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Hasher not initialized");
    }

    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to update hash");
    }
    return CryptoResult();
}

CryptoResult Hasher::finalize(Digest& output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Hasher not initialized");
    }

    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to finalize hash");
    }

    initialized_ = false;
    return CryptoResult();
}

Digest Hasher::hash(std::span<const std::uint8_t> data) {
    Digest result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

Digest Hasher::hash_keyed(const HashKey& key, std::span<const std::uint8_t> data) {
    Digest result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), key.data(), key.size());
    return result;
}

CryptoResult Hasher::hash_file(const std::filesystem::path& file_path, Digest& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::FILE_ERROR, "Cannot open file for hashing: " + file_path.string());
    }

    Hasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return CryptoResult(CryptoError::FILE_ERROR, "Read error while hashing: " + file_path.string());
    }

    return hasher.finalize(output);
}

namespace hash_utils {

Digest hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return Hasher::hash(data);
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(bytes.size() * 2);
    return hex;
}

std::string digest_to_hex(const Digest& digest) {
    return to_hex(std::span(digest));
}

std::optional<Digest> digest_from_hex(const std::string& hex_string) {
    if (hex_string.length() != DIGEST_SIZE * 2) {
        return std::nullopt;
    }

    Digest digest;
    size_t bin_len = 0;
    if (sodium_hex2bin(digest.data(), digest.size(), hex_string.data(), hex_string.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != DIGEST_SIZE) {
        return std::nullopt;
    }
    return digest;
}

bool constant_time_equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

}

}
