#pragma once

#include "chunkswarm/core/result.hpp"
#include "chunkswarm/tracker/tracker_types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkswarm::tracker {

// Directory of fileId -> seeders/leechers with share-scope access control,
// TTL expiry and uploader-only deletion. Advisory: it never holds file bytes.
//
// Mutations of one FileRecord serialize on that record's mutex. The index
// lock is held only to look up, insert or erase a record, so unrelated files
// never contend. Notifications are delivered after all locks are released.
class Tracker {
public:
    explicit Tracker(TrackerSettings settings = {}, core::Clock& clock = core::SystemClock::shared());

    Tracker(const Tracker&) = delete;
    Tracker& operator=(const Tracker&) = delete;

    void set_notifier(TrackerNotifier* notifier) { notifier_ = notifier; }
    void set_presence(PresenceOracle* presence) { presence_ = presence; }

    core::Result announce(const Announcement& announcement, FileRecordSummary& out);
    // NOT_FOUND when the file is absent or deleted; the caller should purge
    // its local copy.
    core::Result reannounce(const core::FileId& file_id, const core::DeviceKey& device,
                            const core::ChunkBitmap& bitmap, bool download_complete,
                            FileRecordSummary& out);
    ExistenceReport check_exists(const std::vector<core::FileId>& file_ids) const;
    core::Result get_available_chunks(const core::FileId& file_id, const core::DeviceKey& requester,
                                      std::vector<SeederAvailability>& out) const;
    core::Result delete_share(const core::FileId& file_id, const core::DeviceKey& requester);
    // Adds and removes users from the file's scope; out receives the scope
    // afterwards. Any in-scope user may add, only the uploader may remove
    // others, and anyone may remove themselves. Revoked users' devices are
    // dropped and told the share is gone; remaining seeders get the new scope.
    // With both lists empty this only reads the current scope.
    core::Result update_share_scope(const core::FileId& file_id, const core::DeviceKey& requester,
                                    const std::vector<core::UserId>& add,
                                    const std::vector<core::UserId>& remove,
                                    std::vector<core::UserId>& out);
    // Returns the number of records the device was removed from.
    size_t disconnect(const core::DeviceKey& device);

    core::Result unannounce(const core::FileId& file_id, const core::DeviceKey& device);
    core::Result register_leecher(const core::FileId& file_id, const core::DeviceKey& device,
                                  const core::ChunkBitmap& requested);
    core::Result unregister_leecher(const core::FileId& file_id, const core::DeviceKey& device);
    core::Result record_activity(const core::FileId& file_id, const core::DeviceKey& device);
    core::Result get_file_summary(const core::FileId& file_id, const core::DeviceKey& requester,
                                  FileRecordSummary& out) const;

    SweepReport sweep();
    TrackerStats stats() const;

    // Copy of the record, deleted or not.
    std::optional<FileRecord> snapshot(const core::FileId& file_id) const;

    const TrackerSettings& settings() const { return settings_; }

private:
    struct Slot {
        std::mutex mutex;
        FileRecord record;
        bool initialized = false;
        std::atomic<bool> erased{false};
    };

    using Outbox = std::vector<std::pair<core::DeviceKey, TrackerNotification>>;

    std::shared_ptr<Slot> find_slot(const core::FileId& file_id) const;
    std::shared_ptr<Slot> find_or_create_slot(const core::FileId& file_id);
    std::vector<std::shared_ptr<Slot>> all_slots() const;
    void erase_slot(const core::FileId& file_id, const std::shared_ptr<Slot>& slot);

    void refresh_ttl(FileRecord& record, core::TimePoint now) const;
    bool is_reachable(const core::DeviceKey& device) const;
    void deliver(const Outbox& outbox);

    TrackerSettings settings_;
    core::Clock& clock_;
    TrackerNotifier* notifier_;
    PresenceOracle* presence_;

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<core::FileId, std::shared_ptr<Slot>> records_;
};

}
