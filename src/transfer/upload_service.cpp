#include "chunkswarm/transfer/upload_service.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/storage/file_index.hpp"
#include "chunkswarm/tracker/tracker_api.hpp"
#include <algorithm>

namespace chunkswarm::transfer {

UploadService::UploadService(SwarmContext& context, SendFunction send)
    : context_(context), send_(std::move(send)) {}

UploadService::~UploadService() {
    stop();
}

void UploadService::start() {
    if (running_.exchange(true)) {
        return;
    }
    auto worker_count = std::max<std::uint32_t>(1, context_.settings.max_concurrent_uploads);
    for (std::uint32_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&UploadService::worker_loop, this);
    }
    LOG_INFO("Upload service started with {} workers", worker_count);
}

void UploadService::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    size_t abandoned = 0;
    for (const auto& [peer, queue] : queues_) {
        abandoned += queue.size();
    }
    queues_.clear();
    ready_.clear();
    busy_.clear();
    idle_cv_.notify_all();
    LOG_INFO("Upload service stopped ({} queued sends abandoned)", abandoned);
}

bool UploadService::enqueue(const core::DeviceKey& peer, const ChunkRequestMessage& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& queue = queues_[peer];
        if (queue.size() >= context_.settings.max_queued_per_peer) {
            ++stats_.dropped;
            LOG_WARN("Upload queue for {} full; dropping request for chunk {} of {}",
                     peer.to_string(), request.chunk_index, request.file_id);
            return false;
        }
        bool was_idle = queue.empty() && busy_.count(peer) == 0;
        queue.push_back(request);
        if (was_idle) {
            ready_.push_back(peer);
        }
    }
    work_cv_.notify_one();
    return true;
}

size_t UploadService::handle_download_complete(const core::DeviceKey& peer, const core::FileId& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(peer);
    if (it == queues_.end()) {
        return 0;
    }
    auto& queue = it->second;
    auto before = queue.size();
    queue.erase(std::remove_if(queue.begin(), queue.end(),
                               [&](const ChunkRequestMessage& r) { return r.file_id == file_id; }),
                queue.end());
    size_t cancelled = before - queue.size();
    stats_.cancelled += cancelled;
    if (queue.empty()) {
        ready_.erase(std::remove(ready_.begin(), ready_.end(), peer), ready_.end());
        if (busy_.count(peer) == 0) {
            queues_.erase(it);
        }
    }
    if (cancelled > 0) {
        LOG_DEBUG("{} finished {}; cancelled {} queued sends", peer.to_string(), file_id, cancelled);
    }
    idle_cv_.notify_all();
    return cancelled;
}

void UploadService::peer_closed(const core::DeviceKey& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(peer);
    if (it == queues_.end()) {
        return;
    }
    if (!it->second.empty()) {
        LOG_DEBUG("Dropping {} queued sends for closed peer {}", it->second.size(), peer.to_string());
        stats_.cancelled += it->second.size();
    }
    it->second.clear();
    ready_.erase(std::remove(ready_.begin(), ready_.end(), peer), ready_.end());
    if (busy_.count(peer) == 0) {
        queues_.erase(it);
    }
    idle_cv_.notify_all();
}

bool UploadService::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        if (!busy_.empty()) {
            return false;
        }
        return std::all_of(queues_.begin(), queues_.end(),
                           [](const auto& entry) { return entry.second.empty(); });
    });
}

UploadStats UploadService::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    UploadStats snapshot = stats_;
    snapshot.queued = 0;
    for (const auto& [peer, queue] : queues_) {
        snapshot.queued += queue.size();
    }
    snapshot.active = busy_.size();
    return snapshot;
}

void UploadService::worker_loop() {
    while (true) {
        core::DeviceKey peer;
        ChunkRequestMessage request;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return !running_.load() || !ready_.empty(); });
            if (!running_.load()) {
                return;
            }
            peer = ready_.front();
            ready_.pop_front();
            auto it = queues_.find(peer);
            if (it == queues_.end() || it->second.empty()) {
                continue;
            }
            request = std::move(it->second.front());
            it->second.pop_front();
            busy_.insert(peer);
        }

        serve(peer, request);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_.erase(peer);
            auto it = queues_.find(peer);
            if (it != queues_.end()) {
                if (!it->second.empty()) {
                    // Back of the line so one greedy peer cannot starve others.
                    ready_.push_back(peer);
                    work_cv_.notify_one();
                } else {
                    queues_.erase(it);
                }
            }
        }
        idle_cv_.notify_all();
    }
}

void UploadService::serve(const core::DeviceKey& peer, const ChunkRequestMessage& request) {
    std::optional<crypto::EncryptedChunk> chunk;
    if (peer_may_fetch(peer, request.file_id)) {
        chunk = context_.store.get_chunk(request.file_id, request.chunk_index);
    }

    if (!chunk) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.unavailable;
        }
        LOG_DEBUG("Chunk {} of {} unavailable for {}", request.chunk_index, request.file_id, peer.to_string());
        if (!send_(peer, ChunkUnavailableMessage{request.file_id, request.chunk_index})) {
            LOG_DEBUG("Unable to tell {} chunk {} is unavailable", peer.to_string(), request.chunk_index);
        }
        return;
    }

    auto size = chunk->total_size();
    if (!send_(peer, ChunkDataMessage{request.file_id, request.chunk_index, std::move(*chunk)})) {
        LOG_WARN("Sending chunk {} of {} to {} failed", request.chunk_index, request.file_id, peer.to_string());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.chunks_served;
        stats_.bytes_served += size;
    }
    LOG_TRACE("Served chunk {} of {} to {}", request.chunk_index, request.file_id, peer.to_string());
    report_activity(request.file_id);
}

bool UploadService::peer_may_fetch(const core::DeviceKey& peer, const core::FileId& file_id) const {
    auto record = context_.files.get(file_id);
    if (!record) {
        return false;
    }
    if (peer.user_id == record->uploader_id) {
        return true;
    }
    // An empty scope means the uploader alone.
    bool in_scope = std::find(record->share_scope.begin(), record->share_scope.end(), peer.user_id) !=
                    record->share_scope.end();
    if (!in_scope) {
        LOG_WARN("Refusing {} chunk request from out-of-scope {}", file_id, peer.to_string());
    }
    return in_scope;
}

void UploadService::report_activity(const core::FileId& file_id) {
    auto now = context_.clock.now();
    if (!context_.files.touch_activity(file_id, now)) {
        LOG_DEBUG("No local record of {} to touch", file_id);
    }

    {
        std::lock_guard<std::mutex> lock(activity_mutex_);
        auto it = last_reported_.find(file_id);
        if (it != last_reported_.end() && now - it->second < context_.settings.activity_report_interval) {
            return;
        }
        last_reported_[file_id] = now;
        prune_reported(now);
    }

    auto reported = context_.tracker.record_activity(file_id);
    if (!reported) {
        LOG_DEBUG("Activity report for {} failed: {}", file_id, reported.describe());
    }
}

void UploadService::prune_reported(core::TimePoint now) {
    for (auto it = last_reported_.begin(); it != last_reported_.end();) {
        if (now - it->second >= context_.settings.activity_report_interval) {
            it = last_reported_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t UploadService::tracked_activity_entries() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return last_reported_.size();
}

} // namespace chunkswarm::transfer
