#pragma once

#include "chunkswarm/crypto/crypto_types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chunkswarm::crypto {

// Streaming BLAKE2b-256. Used for whole-file checksums and fileIds.
class Hasher {
public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    CryptoResult initialize(const HashKey* key = nullptr);
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(Digest& output);

    static Digest hash(std::span<const std::uint8_t> data);
    static Digest hash_keyed(const HashKey& key, std::span<const std::uint8_t> data);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Digest& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

Digest hash_string(const std::string& str);
std::string to_hex(std::span<const std::uint8_t> bytes);
std::string digest_to_hex(const Digest& digest);
std::optional<Digest> digest_from_hex(const std::string& hex_string);
bool constant_time_equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b);

}

}
