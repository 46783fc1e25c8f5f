#pragma once

#include "chunkswarm/core/result.hpp"
#include "chunkswarm/tracker/tracker_types.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace chunkswarm::tracker {

// The Tracker as seen by one device. Implemented in-process and over TCP.
class TrackerApi {
public:
    using NotificationHandler = std::function<void(const TrackerNotification&)>;

    virtual ~TrackerApi() = default;

    virtual const core::DeviceKey& device() const = 0;

    virtual core::Result announce(const Announcement& announcement, FileRecordSummary& out) = 0;
    virtual core::Result reannounce(const core::FileId& file_id, const core::ChunkBitmap& bitmap,
                                    bool download_complete, FileRecordSummary& out) = 0;
    virtual core::Result check_exists(const std::vector<core::FileId>& file_ids, ExistenceReport& out) = 0;
    virtual core::Result get_available_chunks(const core::FileId& file_id, std::vector<SeederAvailability>& out) = 0;
    virtual core::Result delete_share(const core::FileId& file_id) = 0;
    virtual core::Result unannounce(const core::FileId& file_id) = 0;
    virtual core::Result register_leecher(const core::FileId& file_id, const core::ChunkBitmap& requested) = 0;
    virtual core::Result unregister_leecher(const core::FileId& file_id) = 0;
    virtual core::Result record_activity(const core::FileId& file_id) = 0;
    virtual core::Result update_share_scope(const core::FileId& file_id, const std::vector<core::UserId>& add,
                                            const std::vector<core::UserId>& remove,
                                            std::vector<core::UserId>& out) = 0;

    void set_notification_handler(NotificationHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        notification_handler_ = std::move(handler);
    }

protected:
    void dispatch_notification(const TrackerNotification& notification) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = notification_handler_;
        }
        if (handler) {
            handler(notification);
        }
    }

private:
    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;
};

}
