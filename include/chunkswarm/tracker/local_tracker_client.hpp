#pragma once

#include "chunkswarm/tracker/tracker.hpp"
#include "chunkswarm/tracker/tracker_api.hpp"
#include <atomic>
#include <map>
#include <mutex>

namespace chunkswarm::tracker {

class LocalTrackerClient;

// Presence and notification routing for clients living in the same process
// as the Tracker. Installs itself as the tracker's notifier and presence
// source for its lifetime.
class LocalTrackerHub : public TrackerNotifier, public PresenceOracle {
public:
    explicit LocalTrackerHub(Tracker& tracker);
    ~LocalTrackerHub() override;

    LocalTrackerHub(const LocalTrackerHub&) = delete;
    LocalTrackerHub& operator=(const LocalTrackerHub&) = delete;

    Tracker& tracker() { return tracker_; }

    void notify(const core::DeviceKey& target, const TrackerNotification& notification) override;
    bool is_online(const core::DeviceKey& device) const override;

private:
    friend class LocalTrackerClient;

    void attach(LocalTrackerClient* client);
    void detach(LocalTrackerClient* client);

    Tracker& tracker_;
    mutable std::mutex mutex_;
    std::map<core::DeviceKey, LocalTrackerClient*> clients_;
};

class LocalTrackerClient : public TrackerApi {
public:
    LocalTrackerClient(LocalTrackerHub& hub, core::DeviceKey device);
    ~LocalTrackerClient() override;

    LocalTrackerClient(const LocalTrackerClient&) = delete;
    LocalTrackerClient& operator=(const LocalTrackerClient&) = delete;

    // Going offline drops the session, which the tracker treats as Disconnect.
    void go_online();
    void go_offline();
    bool is_online() const { return online_.load(); }

    const core::DeviceKey& device() const override { return device_; }

    core::Result announce(const Announcement& announcement, FileRecordSummary& out) override;
    core::Result reannounce(const core::FileId& file_id, const core::ChunkBitmap& bitmap,
                            bool download_complete, FileRecordSummary& out) override;
    core::Result check_exists(const std::vector<core::FileId>& file_ids, ExistenceReport& out) override;
    core::Result get_available_chunks(const core::FileId& file_id, std::vector<SeederAvailability>& out) override;
    core::Result delete_share(const core::FileId& file_id) override;
    core::Result unannounce(const core::FileId& file_id) override;
    core::Result register_leecher(const core::FileId& file_id, const core::ChunkBitmap& requested) override;
    core::Result unregister_leecher(const core::FileId& file_id) override;
    core::Result record_activity(const core::FileId& file_id) override;
    core::Result update_share_scope(const core::FileId& file_id, const std::vector<core::UserId>& add,
                                    const std::vector<core::UserId>& remove,
                                    std::vector<core::UserId>& out) override;

private:
    friend class LocalTrackerHub;

    core::Result offline_error() const;

    LocalTrackerHub& hub_;
    core::DeviceKey device_;
    std::atomic<bool> online_;
};

}
