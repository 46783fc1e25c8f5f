#pragma once

#include "chunkswarm/crypto/crypto_types.hpp"
#include "chunkswarm/core/logger.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace chunkswarm::crypto {

// Out-of-band key delivery. The key exchange lives outside this library;
// implementations hand back the symmetric key for an opaque handle.
class FileKeyProvider {
public:
    virtual ~FileKeyProvider() = default;

    virtual std::optional<FileKey> fetch_key(const std::string& key_handle) = 0;

    // Pushes a rebuilt key back to whoever distributes it. Optional.
    virtual void redistribute_key(const std::string& /*key_handle*/, const FileKey& /*key*/) {}
};

// Cache for derived or fetched crypto material with a verify-or-rebuild
// contract: every lookup recomputes the artifact's fingerprint and compares
// it against the one recorded when it was built. A mismatch discards the
// entry, rebuilds it from source and redistributes it. A rebuilt artifact
// that does not match a pinned fingerprint is reported as unusable.
template<typename Artifact>
class VerifiedArtifactCache {
public:
    using Builder = std::function<std::optional<Artifact>(const std::string& id)>;
    using Fingerprint = std::function<Digest(const Artifact& artifact)>;
    using Redistribute = std::function<void(const std::string& id, const Artifact& artifact)>;
    using Scrub = std::function<void(Artifact& artifact)>;

    struct Stats {
        std::uint64_t hits = 0;
        std::uint64_t builds = 0;
        std::uint64_t rebuilds = 0;
        std::uint64_t failures = 0;
    };

    VerifiedArtifactCache(Builder builder, Fingerprint fingerprint,
                          Redistribute redistribute = nullptr, Scrub scrub = nullptr)
        : builder_(std::move(builder))
        , fingerprint_(std::move(fingerprint))
        , redistribute_(std::move(redistribute))
        , scrub_(std::move(scrub)) {}

    ~VerifiedArtifactCache() { clear(); }

    std::optional<Artifact> get(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);

        bool rebuilding = false;
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            if (fingerprint_(it->second.artifact) == it->second.fingerprint) {
                ++stats_.hits;
                return it->second.artifact;
            }
            LOG_WARN("Cached artifact {} failed self-test, rebuilding", id);
            erase_locked(it);
            rebuilding = true;
        }

        auto built = builder_(id);
        if (!built) {
            ++stats_.failures;
            LOG_ERROR("Unable to build artifact {}", id);
            return std::nullopt;
        }

        Digest fingerprint = fingerprint_(*built);
        auto pinned = pinned_.find(id);
        if (pinned != pinned_.end() && pinned->second != fingerprint) {
            ++stats_.failures;
            LOG_ERROR("Artifact {} does not match its pinned fingerprint after {}",
                      id, rebuilding ? "rebuild" : "build");
            if (scrub_) scrub_(*built);
            return std::nullopt;
        }

        entries_[id] = Entry{*built, fingerprint};
        if (rebuilding) {
            ++stats_.rebuilds;
            if (redistribute_) {
                redistribute_(id, *built);
            }
        } else {
            ++stats_.builds;
        }
        return built;
    }

    // Inserts an artifact produced locally and pins its fingerprint.
    void put(const std::string& id, const Artifact& artifact) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            erase_locked(it);
        }
        Digest fingerprint = fingerprint_(artifact);
        entries_[id] = Entry{artifact, fingerprint};
        pinned_[id] = fingerprint;
    }

    // Later builds of id must reproduce this fingerprint.
    void pin(const std::string& id, const Digest& fingerprint) {
        std::lock_guard<std::mutex> lock(mutex_);
        pinned_[id] = fingerprint;
    }

    void invalidate(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            erase_locked(it);
        }
        pinned_.erase(id);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!entries_.empty()) {
            erase_locked(entries_.begin());
        }
        pinned_.clear();
    }

    bool contains(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(id) > 0;
    }

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Entry {
        Artifact artifact;
        Digest fingerprint;
    };

    void erase_locked(typename std::map<std::string, Entry>::iterator it) {
        if (scrub_) {
            scrub_(it->second.artifact);
        }
        entries_.erase(it);
    }

    Builder builder_;
    Fingerprint fingerprint_;
    Redistribute redistribute_;
    Scrub scrub_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, Digest> pinned_;
    Stats stats_;
};

// File keys by handle, fetched through a FileKeyProvider. The fingerprint
// is a key-check value: a keyed hash of a fixed probe string.
class FileKeyCache {
public:
    explicit FileKeyCache(FileKeyProvider& provider);

    std::optional<FileKey> key_for(const std::string& key_handle);

    void register_key(const std::string& key_handle, const FileKey& key);
    void expect_check_value(const std::string& key_handle, const Digest& check_value);
    void forget(const std::string& key_handle);

    VerifiedArtifactCache<FileKey>::Stats stats() const { return cache_.stats(); }

    static Digest key_check_value(const FileKey& key);

private:
    FileKeyProvider& provider_;
    VerifiedArtifactCache<FileKey> cache_;
};

}
