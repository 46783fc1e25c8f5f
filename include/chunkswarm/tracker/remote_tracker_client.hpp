#pragma once

#include "chunkswarm/network/tcp_client.hpp"
#include "chunkswarm/tracker/tracker_api.hpp"
#include "chunkswarm/tracker/tracker_messages.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace chunkswarm::tracker {

// TrackerApi over TCP. Requests block until the matching response arrives
// or the request timeout elapses (TIMEOUT). Never retries on its own.
class RemoteTrackerClient : public TrackerApi {
public:
    explicit RemoteTrackerClient(core::DeviceKey device,
                                 std::chrono::milliseconds request_timeout = std::chrono::seconds(10));
    ~RemoteTrackerClient() override;

    RemoteTrackerClient(const RemoteTrackerClient&) = delete;
    RemoteTrackerClient& operator=(const RemoteTrackerClient&) = delete;

    // Connects and completes the hello exchange.
    core::Result connect(const std::string& host, std::uint16_t port,
                         std::chrono::milliseconds connect_timeout = std::chrono::seconds(15));
    void disconnect();
    bool is_connected() const { return client_.is_connected(); }

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
    using Pending = std::promise<std::optional<TrackerMessage>>;

    template<typename Reply, typename Request>
    core::Result call(const Request& request, Reply& reply);

    template<typename Request>
    core::Result call_status(const Request& request);

    void on_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload);
    void fail_pending();

    core::DeviceKey device_;
    std::chrono::milliseconds request_timeout_;

    std::mutex pending_mutex_;
    std::map<std::uint64_t, std::shared_ptr<Pending>> pending_;

    // Last so its io thread stops before the state its handlers touch.
    network::TcpClient client_;
};

}
