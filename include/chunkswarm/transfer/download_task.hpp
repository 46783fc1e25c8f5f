#pragma once

#include "chunkswarm/core/chunk_bitmap.hpp"
#include "chunkswarm/core/result.hpp"
#include "chunkswarm/crypto/encryption.hpp"
#include "chunkswarm/storage/chunk_manager.hpp"
#include "chunkswarm/transfer/chunk_scheduler.hpp"
#include "chunkswarm/transfer/download_events.hpp"
#include "chunkswarm/transfer/peer_transport.hpp"
#include "chunkswarm/transfer/swarm_context.hpp"
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>

namespace chunkswarm::transfer {

// One file download: Downloading -> Draining -> Assembling -> Verifying ->
// Complete, with Failed reachable from any phase. The state machine is
// owned by whichever thread calls step()/run(); other threads only post()
// events and read the progress snapshot.
class DownloadTask {
public:
    DownloadTask(SwarmContext& context, PeerPool& pool, FileDescriptor descriptor,
                 std::filesystem::path output_path);
    ~DownloadTask();

    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    // Fetches the key, restores persisted progress (reconciled against the
    // chunk store) and registers with the tracker. Nothing is persisted
    // when this fails.
    core::Result start();

    // Handles due timers and at most one event, waiting up to max_wait for
    // it. Returns false once the task has stopped.
    bool step(std::chrono::milliseconds max_wait);
    void run();

    void post(DownloadEvent event);

    // Blocks until the task stops or the timeout elapses.
    TaskOutcome wait(std::chrono::milliseconds timeout) const;

    const core::FileId& file_id() const { return descriptor_.file_id; }
    const FileDescriptor& descriptor() const { return descriptor_; }
    const std::filesystem::path& output_path() const { return output_path_; }
    core::TaskPhase phase() const { return phase_.load(); }
    TaskOutcome outcome() const { return outcome_.load(); }
    DownloadProgress progress() const;
    core::Result result() const;

    // Set when the tracker no longer knows the file; local state should be purged.
    bool tracker_forgot_file() const { return tracker_forgot_.load(); }
    std::uint64_t duplicate_chunks() const { return duplicates_.load(); }

private:
    void run_timers(core::TimePoint now);
    void handle_event(const DownloadEvent& event, core::TimePoint now);

    void on_chunk(const ChunkReceived& event, core::TimePoint now);
    void on_refused(const ChunkRefused& event);
    void on_peer_lost(const core::DeviceKey& peer, const char* why);

    void rediscover(core::TimePoint now);
    void schedule(core::TimePoint now);
    void commit_chunk(std::uint32_t chunk_index, core::TimePoint now);
    void note_response(const core::DeviceKey& peer, std::uint32_t chunk_index);
    size_t outstanding_count() const;

    void enter_draining(core::TimePoint now);
    void assemble();
    void complete();
    void fail(core::Result error, std::vector<std::uint32_t> missing);
    void fail_corrupt(const storage::AssemblyReport& report, const core::Result& error);
    void pause();
    void cancel();

    void set_phase(core::TaskPhase phase);
    void finish(TaskOutcome outcome);
    void persist();
    void release_peers();
    void update_progress();

    SwarmContext& context_;
    PeerPool& pool_;
    FileDescriptor descriptor_;
    std::filesystem::path output_path_;

    crypto::ChunkCipher cipher_;
    crypto::FileKey key_{};

    core::ChunkBitmap completed_;
    std::optional<ChunkScheduler> scheduler_;
    EventQueue<DownloadEvent> events_;

    std::atomic<core::TaskPhase> phase_;
    std::atomic<TaskOutcome> outcome_;
    std::atomic<bool> tracker_forgot_;
    std::atomic<std::uint64_t> duplicates_;

    // Requests sent and not yet answered, including ones the scheduler has
    // already given up on. Draining waits for these.
    std::map<core::DeviceKey, std::multiset<std::uint32_t>> outstanding_;
    std::set<core::DeviceKey> acquired_;

    std::uint64_t bytes_completed_ = 0;
    core::TimePoint next_rediscovery_{};
    core::TimePoint last_usable_peer_at_{};
    core::TimePoint drain_deadline_{};

    mutable std::mutex state_mutex_;
    mutable std::condition_variable stopped_cv_;
    DownloadProgress progress_;
    core::Result result_;
};

} // namespace chunkswarm::transfer
