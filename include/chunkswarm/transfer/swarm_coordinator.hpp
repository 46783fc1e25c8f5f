#pragma once

#include "chunkswarm/core/result.hpp"
#include "chunkswarm/tracker/tracker_types.hpp"
#include "chunkswarm/transfer/download_task.hpp"
#include "chunkswarm/transfer/peer_transport.hpp"
#include "chunkswarm/transfer/swarm_context.hpp"
#include "chunkswarm/transfer/upload_service.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

namespace chunkswarm::transfer {

struct ReconnectReport {
    size_t checked = 0;
    size_t reannounced = 0;
    size_t purged = 0;
    size_t resumed = 0;
};

// Per-device owner of the download tasks and the upload service. Routes
// peer traffic and tracker notifications to them and hands out reference
// counted peer connections.
class SwarmCoordinator : public PeerPool {
public:
    // Cascading local removal of a file (chunks, index entry, resume state).
    using PurgeHandler = std::function<core::Result(const core::FileId& file_id)>;

    SwarmCoordinator(SwarmContext& context, PeerTransport& transport);
    ~SwarmCoordinator() override;

    SwarmCoordinator(const SwarmCoordinator&) = delete;
    SwarmCoordinator& operator=(const SwarmCoordinator&) = delete;

    void start();
    void stop();

    void set_purge_handler(PurgeHandler handler);

    // Chunks and encrypts source under the key behind key_handle, records
    // it as uploaded by this device and announces it.
    core::Result share_file(const std::filesystem::path& source,
                            const std::vector<core::UserId>& share_scope,
                            const std::string& key_handle,
                            FileDescriptor& out);
    // Uploader-only; local copies are purged when the tracker confirms.
    core::Result delete_share(const core::FileId& file_id);
    // Changes who the file is shared with and keeps the local record in step.
    core::Result update_share_scope(const core::FileId& file_id, const std::vector<core::UserId>& add,
                                    const std::vector<core::UserId>& remove,
                                    std::vector<core::UserId>& out);

    core::Result start_download(const FileDescriptor& descriptor, const std::filesystem::path& output_path);
    core::Result pause(const core::FileId& file_id);
    core::Result resume(const core::FileId& file_id);
    core::Result cancel(const core::FileId& file_id);

    std::optional<DownloadProgress> progress(const core::FileId& file_id) const;
    std::vector<DownloadProgress> tasks() const;
    bool is_downloading(const core::FileId& file_id) const;
    // Blocks until the task stops; reports the last known outcome otherwise.
    std::optional<TaskOutcome> wait(const core::FileId& file_id, std::chrono::milliseconds timeout) const;

    ReconnectReport on_tracker_reconnected();
    void handle_notification(const tracker::TrackerNotification& notification);

    // Watchdog pass over peers stuck connecting. Returns how many were cut.
    size_t check_connections(core::TimePoint now);
    // Joins stopped tasks and applies any purge they left behind.
    size_t reap_finished();

    UploadService& uploads() { return uploads_; }
    // Outcomes of stopped downloads still kept for progress() and wait().
    size_t finished_count() const;

    // Oldest finished outcomes are forgotten beyond this many.
    static constexpr size_t MAX_FINISHED_RETAINED = 64;

    void acquire(const core::DeviceKey& peer) override;
    void release(const core::DeviceKey& peer) override;
    bool is_established(const core::DeviceKey& peer) const override;
    bool send(const core::DeviceKey& peer, const PeerMessage& message) override;

private:
    struct ActiveTask {
        std::shared_ptr<DownloadTask> task;
        std::thread worker;
        bool purge_on_exit = false;
    };

    void on_peer_message(const core::DeviceKey& peer, const PeerMessage& message);
    void on_peer_state(const core::DeviceKey& peer, PeerConnectionState state);

    std::shared_ptr<DownloadTask> find_task(const core::FileId& file_id) const;
    void broadcast(const DownloadEvent& event);
    // Cancels any task for the file and purges local state, now or when the task exits.
    void discard_file(const core::FileId& file_id, const std::string& why);
    core::Result purge(const core::FileId& file_id);
    size_t resume_all();
    void apply_share_scope(const core::FileId& file_id, const std::vector<core::UserId>& scope);
    void remember_finished(const core::FileId& file_id, DownloadProgress progress);
    void forget_finished(const core::FileId& file_id);
    void maintenance_loop();

    SwarmContext& context_;
    PeerTransport& transport_;
    UploadService uploads_;
    PurgeHandler purge_handler_;

    mutable std::mutex tasks_mutex_;
    std::map<core::FileId, ActiveTask> tasks_;
    std::map<core::FileId, DownloadProgress> finished_;
    std::deque<core::FileId> finished_order_;

    mutable std::mutex peers_mutex_;
    std::map<core::DeviceKey, size_t> references_;
    std::set<core::DeviceKey> initiated_;
    std::map<core::DeviceKey, core::TimePoint> connecting_since_;

    std::atomic<bool> running_{false};
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    std::thread maintenance_thread_;
};

} // namespace chunkswarm::transfer
