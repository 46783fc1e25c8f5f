#pragma once

#include "chunkswarm/core/chunk_bitmap.hpp"
#include "chunkswarm/core/clock.hpp"
#include "chunkswarm/core/types.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace chunkswarm::core { class Config; }

namespace chunkswarm::tracker {

constexpr std::uint32_t DEFAULT_UPLOAD_CAPACITY = 5;
// Most users one file may be shared with, the uploader not counted.
constexpr size_t MAX_SHARE_SCOPE = 1000;

// Principals allowed to discover and download a file. The uploader is
// always in scope even when not listed.
struct ShareScope {
    std::set<core::UserId> members;

    ShareScope() = default;
    explicit ShareScope(const std::vector<core::UserId>& users)
        : members(users.begin(), users.end()) {}

    bool contains(const core::UserId& user) const { return members.count(user) > 0; }
    void merge(const ShareScope& other) { members.insert(other.members.begin(), other.members.end()); }
    size_t size() const { return members.size(); }
    std::vector<core::UserId> to_vector() const { return {members.begin(), members.end()}; }
};

struct FileMetadata {
    std::uint64_t total_size = 0;
    std::string checksum;
    std::uint32_t chunk_count = 0;
};

struct SeederEntry {
    core::ChunkBitmap bitmap;
    std::uint32_t upload_capacity = DEFAULT_UPLOAD_CAPACITY;
    core::TimePoint last_activity_at{};
    bool download_complete = false;
    core::TimePoint seeder_since{};
};

struct LeecherEntry {
    core::ChunkBitmap requested;
    core::TimePoint last_seen_at{};
};

struct FileRecord {
    core::FileId file_id;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_count = 0;
    std::string checksum;
    ShareScope share_scope;
    core::TimePoint created_at{};
    core::TimePoint expires_at{};
    bool deleted = false;
    core::TimePoint deleted_at{};
    core::UserId uploader_id;

    std::map<core::DeviceKey, SeederEntry> seeders;
    std::map<core::DeviceKey, LeecherEntry> leechers;

    bool can_access(const core::UserId& user) const {
        return user == uploader_id || share_scope.contains(user);
    }
};

struct FileRecordSummary {
    core::FileId file_id;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_count = 0;
    std::string checksum;
    core::UserId uploader_id;
    std::uint32_t seeder_count = 0;
    std::uint32_t complete_seeder_count = 0;
    std::uint32_t leecher_count = 0;
    core::TimePoint expires_at{};

    static FileRecordSummary from_record(const FileRecord& record);
};

// One entry of a GetAvailableChunks answer.
struct SeederAvailability {
    core::DeviceKey device;
    core::ChunkBitmap bitmap;
    std::uint32_t upload_capacity = DEFAULT_UPLOAD_CAPACITY;
    bool download_complete = false;
    bool reachable = false;
};

struct Announcement {
    core::FileId file_id;
    core::DeviceKey device;
    FileMetadata metadata;
    core::ChunkBitmap bitmap;
    std::vector<core::UserId> share_scope;
    std::uint32_t upload_capacity = DEFAULT_UPLOAD_CAPACITY;
};

struct ExistenceReport {
    std::vector<core::FileId> exists;
    std::vector<core::FileId> missing;
};

struct SweepReport {
    size_t deleted_records_removed = 0;
    size_t expired_records_removed = 0;
    size_t seeders_removed = 0;
    size_t leechers_removed = 0;

    size_t total() const {
        return deleted_records_removed + expired_records_removed + seeders_removed + leechers_removed;
    }
};

struct TrackerStats {
    size_t files = 0;
    size_t deleted_files = 0;
    size_t seeders = 0;
    size_t complete_seeders = 0;
    size_t leechers = 0;
};

// Notifications pushed to devices.
struct UploaderOnline {
    core::FileId file_id;
    core::DeviceKey uploader;
};

struct ShareDeleted {
    core::FileId file_id;
    std::string reason;
};

struct SeederRemoved {
    core::FileId file_id;
    std::string reason;
};

// Sent to seeders so they serve chunks to the new set of users only.
struct ShareScopeChanged {
    core::FileId file_id;
    std::vector<core::UserId> share_scope;
};

using TrackerNotification = std::variant<UploaderOnline, ShareDeleted, SeederRemoved, ShareScopeChanged>;

std::string describe(const TrackerNotification& notification);

class TrackerNotifier {
public:
    virtual ~TrackerNotifier() = default;
    virtual void notify(const core::DeviceKey& target, const TrackerNotification& notification) = 0;
};

// Connection presence, supplied by whoever owns the device sessions.
class PresenceOracle {
public:
    virtual ~PresenceOracle() = default;
    virtual bool is_online(const core::DeviceKey& device) const = 0;
};

struct TrackerSettings {
    std::chrono::seconds file_ttl = std::chrono::hours(24 * 30);
    std::chrono::seconds ttl_refresh_threshold = std::chrono::hours(24 * 3);
    std::chrono::seconds seeder_ttl = std::chrono::hours(24 * 30);
    std::chrono::seconds delete_grace = std::chrono::seconds(300);
    std::chrono::seconds sweep_interval = std::chrono::seconds(3600);
    std::uint16_t port = 7420;

    static TrackerSettings from_config(const core::Config& config);
};

}
