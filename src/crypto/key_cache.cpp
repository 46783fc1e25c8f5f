#include "chunkswarm/crypto/key_cache.hpp"
#include "chunkswarm/crypto/hash.hpp"
#include <algorithm>
#include <string_view>

namespace chunkswarm::crypto {

namespace {
constexpr std::string_view KEY_CHECK_PROBE = "chunkswarm.file-key.check";
}

FileKeyCache::FileKeyCache(FileKeyProvider& provider)
    : provider_(provider)
    , cache_(
          [this](const std::string& handle) { return provider_.fetch_key(handle); },
          [](const FileKey& key) { return key_check_value(key); },
          [this](const std::string& handle, const FileKey& key) { provider_.redistribute_key(handle, key); },
          [](FileKey& key) { wipe(std::span(key)); }) {
}

std::optional<FileKey> FileKeyCache::key_for(const std::string& key_handle) {
    return cache_.get(key_handle);
}

void FileKeyCache::register_key(const std::string& key_handle, const FileKey& key) {
    cache_.put(key_handle, key);
}

void FileKeyCache::expect_check_value(const std::string& key_handle, const Digest& check_value) {
    cache_.pin(key_handle, check_value);
}

void FileKeyCache::forget(const std::string& key_handle) {
    cache_.invalidate(key_handle);
}

Digest FileKeyCache::key_check_value(const FileKey& key) {
    HashKey hash_key;
    std::copy(key.begin(), key.end(), hash_key.begin());
    std::span<const std::uint8_t> probe(reinterpret_cast<const std::uint8_t*>(KEY_CHECK_PROBE.data()),
                                        KEY_CHECK_PROBE.size());
    auto digest = Hasher::hash_keyed(hash_key, probe);
    wipe(std::span(hash_key));
    return digest;
}

}
