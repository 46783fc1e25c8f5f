#include "chunkswarm/tracker/local_tracker_client.hpp"
#include "chunkswarm/core/logger.hpp"

namespace chunkswarm::tracker {

LocalTrackerHub::LocalTrackerHub(Tracker& tracker)
    : tracker_(tracker) {
    tracker_.set_notifier(this);
    tracker_.set_presence(this);
}

LocalTrackerHub::~LocalTrackerHub() {
    tracker_.set_notifier(nullptr);
    tracker_.set_presence(nullptr);
}

void LocalTrackerHub::notify(const core::DeviceKey& target, const TrackerNotification& notification) {
    LocalTrackerClient* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(target);
        if (it != clients_.end()) {
            client = it->second;
        }
    }
    if (!client) {
        LOG_DEBUG("Dropping {} for offline device {}", describe(notification), target.to_string());
        return;
    }
    client->dispatch_notification(notification);
}

bool LocalTrackerHub::is_online(const core::DeviceKey& device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(device) > 0;
}

void LocalTrackerHub::attach(LocalTrackerClient* client) {
    std::lock_guard<std::mutex> lock(mutex_);
    clients_[client->device()] = client;
}

void LocalTrackerHub::detach(LocalTrackerClient* client) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client->device());
    if (it != clients_.end() && it->second == client) {
        clients_.erase(it);
    }
}

LocalTrackerClient::LocalTrackerClient(LocalTrackerHub& hub, core::DeviceKey device)
    : hub_(hub)
    , device_(std::move(device))
    , online_(false) {
    go_online();
}

LocalTrackerClient::~LocalTrackerClient() {
    go_offline();
}

void LocalTrackerClient::go_online() {
    if (!online_.exchange(true)) {
        hub_.attach(this);
    }
}

void LocalTrackerClient::go_offline() {
    if (online_.exchange(false)) {
        hub_.detach(this);
        hub_.tracker().disconnect(device_);
    }
}

core::Result LocalTrackerClient::offline_error() const {
    return core::Result::fail(core::ErrorCode::TIMEOUT, "tracker unreachable");
}

core::Result LocalTrackerClient::announce(const Announcement& announcement, FileRecordSummary& out) {
    if (!is_online()) return offline_error();
    auto request = announcement;
    request.device = device_;
    return hub_.tracker().announce(request, out);
}

core::Result LocalTrackerClient::reannounce(const core::FileId& file_id, const core::ChunkBitmap& bitmap,
                                            bool download_complete, FileRecordSummary& out) {
    if (!is_online()) return offline_error();
    return hub_.tracker().reannounce(file_id, device_, bitmap, download_complete, out);
}

core::Result LocalTrackerClient::check_exists(const std::vector<core::FileId>& file_ids, ExistenceReport& out) {
    if (!is_online()) return offline_error();
    out = hub_.tracker().check_exists(file_ids);
    return core::Result::ok();
}

core::Result LocalTrackerClient::get_available_chunks(const core::FileId& file_id,
                                                      std::vector<SeederAvailability>& out) {
    if (!is_online()) return offline_error();
    return hub_.tracker().get_available_chunks(file_id, device_, out);
}

core::Result LocalTrackerClient::delete_share(const core::FileId& file_id) {
    if (!is_online()) return offline_error();
    return hub_.tracker().delete_share(file_id, device_);
}

core::Result LocalTrackerClient::unannounce(const core::FileId& file_id) {
    if (!is_online()) return offline_error();
    return hub_.tracker().unannounce(file_id, device_);
}

core::Result LocalTrackerClient::register_leecher(const core::FileId& file_id, const core::ChunkBitmap& requested) {
    if (!is_online()) return offline_error();
    return hub_.tracker().register_leecher(file_id, device_, requested);
}

core::Result LocalTrackerClient::unregister_leecher(const core::FileId& file_id) {
    if (!is_online()) return offline_error();
    return hub_.tracker().unregister_leecher(file_id, device_);
}

core::Result LocalTrackerClient::record_activity(const core::FileId& file_id) {
    if (!is_online()) return offline_error();
    return hub_.tracker().record_activity(file_id, device_);
}

core::Result LocalTrackerClient::update_share_scope(const core::FileId& file_id,
                                                    const std::vector<core::UserId>& add,
                                                    const std::vector<core::UserId>& remove,
                                                    std::vector<core::UserId>& out) {
    if (!is_online()) return offline_error();
    return hub_.tracker().update_share_scope(file_id, device_, add, remove, out);
}

}
