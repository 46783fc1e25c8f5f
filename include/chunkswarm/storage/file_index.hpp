#pragma once

#include "chunkswarm/core/clock.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkswarm::storage {

class Database;

enum class FileRole {
    UPLOADER,
    DOWNLOADER
};

// A file this device holds chunks of, with the local mirror of its
// SeederEntry state.
struct LocalFileRecord {
    std::string file_id;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_count = 0;
    std::string checksum;
    std::string uploader_id;
    std::vector<std::string> share_scope;
    FileRole role = FileRole::DOWNLOADER;
    bool download_complete = false;
    core::TimePoint last_activity_at{};
    core::TimePoint seeder_since{};
    core::TimePoint created_at{};
    std::string key_handle;
    std::string local_path;
};

class FileIndex {
public:
    explicit FileIndex(Database& db);

    bool initialize();

    bool upsert(const LocalFileRecord& record);
    std::optional<LocalFileRecord> get(const std::string& file_id) const;
    std::vector<LocalFileRecord> list() const;
    bool contains(const std::string& file_id) const;
    bool remove(const std::string& file_id);

    bool touch_activity(const std::string& file_id, core::TimePoint when);
    bool mark_complete(const std::string& file_id, core::TimePoint when);

    // Incomplete files whose last activity is older than cutoff.
    std::vector<LocalFileRecord> find_stale_incomplete(core::TimePoint cutoff) const;

    size_t count() const;

private:
    Database& db_;
};

} // namespace chunkswarm::storage
