#pragma once

#include "chunkswarm/core/clock.hpp"
#include "chunkswarm/core/types.hpp"
#include "chunkswarm/transfer/peer_messages.hpp"
#include "chunkswarm/transfer/swarm_context.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace chunkswarm::transfer {

struct UploadStats {
    std::uint64_t chunks_served = 0;
    std::uint64_t bytes_served = 0;
    std::uint64_t unavailable = 0;
    std::uint64_t dropped = 0;
    std::uint64_t cancelled = 0;
    size_t queued = 0;
    size_t active = 0;
};

// Seed side of the swarm. Requests queue per peer in arrival order and are
// served by a fixed pool of workers, so at most max_concurrent_uploads
// chunks are being sent at once and a peer is served by one worker at a time.
class UploadService {
public:
    using SendFunction = std::function<bool(const core::DeviceKey& peer, const PeerMessage& message)>;

    UploadService(SwarmContext& context, SendFunction send);
    ~UploadService();

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // False when the peer's queue is full and the request was dropped.
    bool enqueue(const core::DeviceKey& peer, const ChunkRequestMessage& request);

    // Drops the peer's still-queued sends for the file.
    size_t handle_download_complete(const core::DeviceKey& peer, const core::FileId& file_id);
    void peer_closed(const core::DeviceKey& peer);

    // Blocks until nothing is queued or being sent.
    bool wait_idle(std::chrono::milliseconds timeout) const;

    UploadStats stats() const;

    // Files whose last tracker activity report is still within the interval.
    size_t tracked_activity_entries() const;

private:
    void worker_loop();
    void serve(const core::DeviceKey& peer, const ChunkRequestMessage& request);
    bool peer_may_fetch(const core::DeviceKey& peer, const core::FileId& file_id) const;
    void report_activity(const core::FileId& file_id);
    void prune_reported(core::TimePoint now);

    SwarmContext& context_;
    SendFunction send_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    mutable std::condition_variable idle_cv_;
    std::map<core::DeviceKey, std::deque<ChunkRequestMessage>> queues_;
    // Peers with queued work and no worker, in service order.
    std::deque<core::DeviceKey> ready_;
    std::set<core::DeviceKey> busy_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    mutable std::mutex activity_mutex_;
    std::map<core::FileId, core::TimePoint> last_reported_;

    UploadStats stats_;
};

} // namespace chunkswarm::transfer
