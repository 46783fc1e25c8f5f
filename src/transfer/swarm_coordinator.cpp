#include "chunkswarm/transfer/swarm_coordinator.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/overloaded.hpp"
#include "chunkswarm/crypto/key_cache.hpp"
#include "chunkswarm/storage/chunk_manager.hpp"
#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/storage/file_index.hpp"
#include "chunkswarm/storage/resume_manager.hpp"
#include "chunkswarm/tracker/tracker_api.hpp"
#include <algorithm>

namespace chunkswarm::transfer {

using core::ErrorCode;
using core::Result;
using core::overloaded;

namespace {

constexpr auto MAINTENANCE_INTERVAL = std::chrono::milliseconds(200);

}

SwarmCoordinator::SwarmCoordinator(SwarmContext& context, PeerTransport& transport)
    : context_(context)
    , transport_(transport)
    , uploads_(context, [this](const core::DeviceKey& peer, const PeerMessage& message) {
          return transport_.send(peer, message);
      }) {}

SwarmCoordinator::~SwarmCoordinator() {
    stop();
}

void SwarmCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }

    transport_.set_message_handler([this](const core::DeviceKey& peer, const PeerMessage& message) {
        on_peer_message(peer, message);
    });
    transport_.set_state_handler([this](const core::DeviceKey& peer, PeerConnectionState state) {
        on_peer_state(peer, state);
    });
    context_.tracker.set_notification_handler([this](const tracker::TrackerNotification& notification) {
        handle_notification(notification);
    });

    uploads_.start();
    maintenance_thread_ = std::thread(&SwarmCoordinator::maintenance_loop, this);
    LOG_INFO("Swarm coordinator started for {}", context_.self.to_string());
}

void SwarmCoordinator::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    context_.tracker.set_notification_handler(nullptr);
    transport_.set_message_handler(nullptr);
    transport_.set_state_handler(nullptr);

    // Running downloads are paused so they resume on the next start.
    std::map<core::FileId, ActiveTask> active;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        active.swap(tasks_);
    }
    for (auto& [file_id, entry] : active) {
        entry.task->post(PauseRequested{});
    }
    for (auto& [file_id, entry] : active) {
        if (entry.worker.joinable()) {
            entry.worker.join();
        }
    }

    uploads_.stop();
    LOG_INFO("Swarm coordinator stopped ({} downloads paused)", active.size());
}

void SwarmCoordinator::set_purge_handler(PurgeHandler handler) {
    purge_handler_ = std::move(handler);
}

Result SwarmCoordinator::share_file(const std::filesystem::path& source,
                                    const std::vector<core::UserId>& share_scope,
                                    const std::string& key_handle,
                                    FileDescriptor& out) {
    auto fetched = context_.keys.key_for(key_handle);
    if (!fetched) {
        return Result::fail(ErrorCode::UNAUTHORIZED, "file key unavailable for handle " + key_handle);
    }
    crypto::ScopedFileKey key(*fetched);
    crypto::wipe(*fetched);

    storage::IngestedFile ingested;
    auto result = context_.chunks.ingest_file(source, context_.self.user_id, key.get(), ingested);
    if (!result) {
        return result;
    }

    auto now = context_.clock.now();
    storage::LocalFileRecord record;
    record.file_id = ingested.file_id;
    record.total_size = ingested.total_size;
    record.chunk_count = ingested.chunk_count;
    record.checksum = ingested.checksum;
    record.uploader_id = context_.self.user_id;
    record.share_scope = share_scope;
    record.role = storage::FileRole::UPLOADER;
    record.download_complete = true;
    record.last_activity_at = now;
    record.seeder_since = now;
    record.created_at = now;
    record.key_handle = key_handle;
    record.local_path = source.string();
    if (!context_.files.upsert(record)) {
        auto purged = context_.store.purge_file(ingested.file_id);
        if (!purged) {
            LOG_WARN("Cleanup of unrecorded {} failed: {}", ingested.file_id, purged.describe());
        }
        return Result::fail(ErrorCode::STORAGE_FAILURE, "unable to record " + ingested.file_id);
    }

    tracker::Announcement announcement;
    announcement.file_id = ingested.file_id;
    announcement.device = context_.self;
    announcement.metadata = {ingested.total_size, ingested.checksum, ingested.chunk_count};
    announcement.bitmap = core::ChunkBitmap::full(ingested.chunk_count);
    announcement.share_scope = share_scope;
    announcement.upload_capacity = context_.settings.max_in_flight_per_peer;

    tracker::FileRecordSummary summary;
    auto announced = context_.tracker.announce(announcement, summary);
    if (!announced) {
        // A file the tracker never heard of would be purged on reconnect anyway.
        LOG_ERROR("Announce of {} failed: {}", ingested.file_id, announced.describe());
        auto purged = purge(ingested.file_id);
        if (!purged) {
            LOG_WARN("Cleanup of unannounced {} failed: {}", ingested.file_id, purged.describe());
        }
        return announced;
    }

    out.file_id = ingested.file_id;
    out.total_size = ingested.total_size;
    out.chunk_count = ingested.chunk_count;
    out.checksum = ingested.checksum;
    out.uploader_id = context_.self.user_id;
    out.key_handle = key_handle;
    out.share_scope = share_scope;

    LOG_INFO("Shared {} as {} ({} chunks, scope of {})", source.string(), ingested.file_id,
             ingested.chunk_count, share_scope.size());
    return Result::ok();
}

Result SwarmCoordinator::delete_share(const core::FileId& file_id) {
    auto result = context_.tracker.delete_share(file_id);
    if (!result) {
        LOG_WARN("Delete of {} refused: {}", file_id, result.describe());
        return result;
    }
    if (context_.files.contains(file_id)) {
        discard_file(file_id, "deleted by uploader");
    }
    return Result::ok();
}

Result SwarmCoordinator::update_share_scope(const core::FileId& file_id, const std::vector<core::UserId>& add,
                                            const std::vector<core::UserId>& remove,
                                            std::vector<core::UserId>& out) {
    auto result = context_.tracker.update_share_scope(file_id, add, remove, out);
    if (!result) {
        LOG_WARN("Scope change of {} refused: {}", file_id, result.describe());
        return result;
    }
    apply_share_scope(file_id, out);
    return Result::ok();
}

void SwarmCoordinator::apply_share_scope(const core::FileId& file_id, const std::vector<core::UserId>& scope) {
    auto record = context_.files.get(file_id);
    if (!record || record->share_scope == scope) {
        return;
    }
    record->share_scope = scope;
    if (!context_.files.upsert(*record)) {
        LOG_ERROR("Could not store the new scope of {}", file_id);
        return;
    }
    LOG_INFO("{} is now shared with {} users", file_id, scope.size());
}

Result SwarmCoordinator::start_download(const FileDescriptor& descriptor, const std::filesystem::path& output_path) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        if (tasks_.count(descriptor.file_id) > 0) {
            return Result::fail(ErrorCode::CONFLICT, "download of " + descriptor.file_id + " already running");
        }
    }

    auto task = std::make_shared<DownloadTask>(context_, *this, descriptor, output_path);
    auto started = task->start();
    if (!started) {
        LOG_ERROR("Download {} not started: {}", descriptor.file_id, started.describe());
        return started;
    }

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    if (tasks_.count(descriptor.file_id) > 0) {
        return Result::fail(ErrorCode::CONFLICT, "download of " + descriptor.file_id + " already running");
    }
    forget_finished(descriptor.file_id);
    ActiveTask entry;
    entry.task = task;
    entry.worker = std::thread([task]() { task->run(); });
    tasks_.emplace(descriptor.file_id, std::move(entry));
    return Result::ok();
}

Result SwarmCoordinator::pause(const core::FileId& file_id) {
    auto task = find_task(file_id);
    if (!task) {
        return Result::fail(ErrorCode::NOT_FOUND, "no running download of " + file_id);
    }
    task->post(PauseRequested{});
    return Result::ok();
}

Result SwarmCoordinator::resume(const core::FileId& file_id) {
    if (find_task(file_id)) {
        return Result::fail(ErrorCode::CONFLICT, "download of " + file_id + " already running");
    }
    auto state = context_.resume.load(file_id);
    if (!state) {
        return Result::fail(ErrorCode::NOT_FOUND, "no saved download of " + file_id);
    }

    FileDescriptor descriptor;
    descriptor.file_id = state->file_id;
    descriptor.total_size = state->total_size;
    descriptor.chunk_count = state->chunk_count;
    descriptor.checksum = state->checksum;
    descriptor.uploader_id = state->uploader_id;
    descriptor.key_handle = state->key_handle;
    if (auto record = context_.files.get(file_id)) {
        descriptor.share_scope = record->share_scope;
    }
    return start_download(descriptor, state->output_path);
}

Result SwarmCoordinator::cancel(const core::FileId& file_id) {
    auto task = find_task(file_id);
    if (task) {
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            auto it = tasks_.find(file_id);
            if (it != tasks_.end()) {
                it->second.purge_on_exit = true;
            }
        }
        task->post(CancelRequested{});
        return Result::ok();
    }
    if (context_.resume.contains(file_id)) {
        LOG_INFO("Cancelling paused download {}", file_id);
        return purge(file_id);
    }
    return Result::fail(ErrorCode::NOT_FOUND, "no download of " + file_id);
}

std::optional<DownloadProgress> SwarmCoordinator::progress(const core::FileId& file_id) const {
    if (auto task = find_task(file_id)) {
        return task->progress();
    }
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = finished_.find(file_id);
        if (it != finished_.end()) {
            return it->second;
        }
    }
    auto state = context_.resume.load(file_id);
    if (!state) {
        return std::nullopt;
    }
    DownloadProgress saved;
    saved.file_id = state->file_id;
    saved.phase = state->phase;
    saved.outcome = TaskOutcome::PAUSED;
    saved.completed_chunks = state->completed.count();
    saved.total_chunks = state->chunk_count;
    saved.total_bytes = state->total_size;
    return saved;
}

std::vector<DownloadProgress> SwarmCoordinator::tasks() const {
    std::vector<std::shared_ptr<DownloadTask>> active;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (const auto& [file_id, entry] : tasks_) {
            active.push_back(entry.task);
        }
    }
    std::vector<DownloadProgress> result;
    result.reserve(active.size());
    for (const auto& task : active) {
        result.push_back(task->progress());
    }
    return result;
}

bool SwarmCoordinator::is_downloading(const core::FileId& file_id) const {
    auto task = find_task(file_id);
    return task && task->outcome() == TaskOutcome::RUNNING;
}

std::optional<TaskOutcome> SwarmCoordinator::wait(const core::FileId& file_id, std::chrono::milliseconds timeout) const {
    if (auto task = find_task(file_id)) {
        return task->wait(timeout);
    }
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = finished_.find(file_id);
    if (it != finished_.end()) {
        return it->second.outcome;
    }
    return std::nullopt;
}

ReconnectReport SwarmCoordinator::on_tracker_reconnected() {
    ReconnectReport report;
    auto records = context_.files.list();
    report.checked = records.size();

    if (!records.empty()) {
        std::vector<core::FileId> ids;
        ids.reserve(records.size());
        for (const auto& record : records) {
            ids.push_back(record.file_id);
        }

        tracker::ExistenceReport existence;
        auto checked = context_.tracker.check_exists(ids, existence);
        if (!checked) {
            LOG_WARN("Existence check after reconnect failed: {}", checked.describe());
            return report;
        }

        std::set<core::FileId> missing(existence.missing.begin(), existence.missing.end());
        for (const auto& record : records) {
            bool uploader = record.role == storage::FileRole::UPLOADER;
            bool forgotten = missing.count(record.file_id) > 0;
            // A tracker that lost its memory learns our own shares again;
            // only files we fetched from others are dropped.
            if (forgotten && !uploader) {
                discard_file(record.file_id, "unknown to tracker");
                ++report.purged;
                continue;
            }
            if (is_downloading(record.file_id)) {
                continue;
            }

            auto bitmap = core::ChunkBitmap::from_indices(record.chunk_count,
                                                          context_.store.list_chunks(record.file_id));
            if (bitmap.none()) {
                if (forgotten) {
                    discard_file(record.file_id, "unknown to tracker");
                    ++report.purged;
                }
                continue;
            }
            bool complete = record.download_complete && bitmap.complete();

            tracker::FileRecordSummary summary;
            Result announced;
            if (uploader) {
                tracker::Announcement announcement;
                announcement.file_id = record.file_id;
                announcement.device = context_.self;
                announcement.metadata = {record.total_size, record.checksum, record.chunk_count};
                announcement.bitmap = bitmap;
                announcement.share_scope = record.share_scope;
                announcement.upload_capacity = context_.settings.max_in_flight_per_peer;
                announced = context_.tracker.announce(announcement, summary);
            } else {
                announced = context_.tracker.reannounce(record.file_id, bitmap, complete, summary);
            }

            if (announced) {
                if (forgotten) {
                    LOG_INFO("Tracker had forgotten {}; announced it again", record.file_id);
                }
                ++report.reannounced;
            } else if (announced.error == ErrorCode::NOT_FOUND) {
                discard_file(record.file_id, "unknown to tracker");
                ++report.purged;
            } else {
                LOG_WARN("Reannounce of {} failed: {}", record.file_id, announced.describe());
            }
        }
    }

    report.resumed = resume_all();
    LOG_INFO("Reconnect: {} files checked, {} reannounced, {} purged, {} downloads resumed",
             report.checked, report.reannounced, report.purged, report.resumed);
    return report;
}

void SwarmCoordinator::handle_notification(const tracker::TrackerNotification& notification) {
    LOG_INFO("Tracker notification: {}", tracker::describe(notification));
    std::visit(overloaded{
        [&](const tracker::UploaderOnline& n) {
            if (auto task = find_task(n.file_id)) {
                task->post(RediscoverRequested{});
            }
        },
        [&](const tracker::ShareDeleted& n) { discard_file(n.file_id, n.reason); },
        [&](const tracker::SeederRemoved& n) { discard_file(n.file_id, n.reason); },
        [&](const tracker::ShareScopeChanged& n) { apply_share_scope(n.file_id, n.share_scope); },
    }, notification);
}

size_t SwarmCoordinator::check_connections(core::TimePoint now) {
    std::vector<core::DeviceKey> stuck;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        for (auto it = connecting_since_.begin(); it != connecting_since_.end();) {
            if (now - it->second >= context_.settings.connect_timeout) {
                stuck.push_back(it->first);
                it = connecting_since_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& peer : stuck) {
        LOG_WARN("Connection to {} stuck connecting; giving up", peer.to_string());
        transport_.disconnect(peer);
        broadcast(ConnectionTimeout{peer});
    }
    return stuck.size();
}

size_t SwarmCoordinator::reap_finished() {
    std::vector<std::pair<core::FileId, ActiveTask>> stopped;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->second.task->outcome() != TaskOutcome::RUNNING) {
                stopped.emplace_back(it->first, std::move(it->second));
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& [file_id, entry] : stopped) {
        if (entry.worker.joinable()) {
            entry.worker.join();
        }
        auto outcome = entry.task->outcome();
        LOG_DEBUG("Reaped download {} ({})", file_id, to_string(outcome));

        if (entry.purge_on_exit || outcome == TaskOutcome::CANCELLED || entry.task->tracker_forgot_file()) {
            auto purged = purge(file_id);
            if (!purged) {
                LOG_ERROR("Purge of {} after download stop failed: {}", file_id, purged.describe());
            }
        }

        std::lock_guard<std::mutex> lock(tasks_mutex_);
        remember_finished(file_id, entry.task->progress());
    }
    return stopped.size();
}

size_t SwarmCoordinator::finished_count() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return finished_.size();
}

void SwarmCoordinator::remember_finished(const core::FileId& file_id, DownloadProgress progress) {
    if (finished_.count(file_id) == 0) {
        finished_order_.push_back(file_id);
    }
    finished_[file_id] = std::move(progress);
    while (finished_.size() > MAX_FINISHED_RETAINED) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

void SwarmCoordinator::forget_finished(const core::FileId& file_id) {
    if (finished_.erase(file_id) > 0) {
        finished_order_.erase(std::remove(finished_order_.begin(), finished_order_.end(), file_id),
                              finished_order_.end());
    }
}

void SwarmCoordinator::acquire(const core::DeviceKey& peer) {
    bool connect = false;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        if (++references_[peer] == 1) {
            auto state = transport_.state(peer);
            if (state != PeerConnectionState::ESTABLISHED && state != PeerConnectionState::CONNECTING) {
                connect = true;
                initiated_.insert(peer);
            }
        }
    }
    if (connect) {
        LOG_DEBUG("Connecting to {}", peer.to_string());
        transport_.connect(peer);
    }
}

void SwarmCoordinator::release(const core::DeviceKey& peer) {
    bool disconnect = false;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = references_.find(peer);
        if (it == references_.end()) {
            return;
        }
        if (--it->second == 0) {
            references_.erase(it);
            // Inbound connections stay up for the peer's own downloads.
            disconnect = initiated_.erase(peer) > 0;
            connecting_since_.erase(peer);
        }
    }
    if (disconnect) {
        LOG_DEBUG("Closing unused connection to {}", peer.to_string());
        transport_.disconnect(peer);
    }
}

bool SwarmCoordinator::is_established(const core::DeviceKey& peer) const {
    return transport_.state(peer) == PeerConnectionState::ESTABLISHED;
}

bool SwarmCoordinator::send(const core::DeviceKey& peer, const PeerMessage& message) {
    return transport_.send(peer, message);
}

void SwarmCoordinator::on_peer_message(const core::DeviceKey& peer, const PeerMessage& message) {
    std::visit(overloaded{
        [&](const ChunkRequestMessage& m) { uploads_.enqueue(peer, m); },
        [&](const DownloadCompleteMessage& m) { uploads_.handle_download_complete(peer, m.file_id); },
        [&](const ChunkDataMessage& m) {
            if (auto task = find_task(m.file_id)) {
                task->post(ChunkReceived{peer, m.chunk_index, m.chunk});
            } else {
                LOG_DEBUG("Chunk {} of {} from {} has no download", m.chunk_index, m.file_id, peer.to_string());
            }
        },
        [&](const ChunkUnavailableMessage& m) {
            if (auto task = find_task(m.file_id)) {
                task->post(ChunkRefused{peer, m.chunk_index});
            }
        },
    }, message);
}

void SwarmCoordinator::on_peer_state(const core::DeviceKey& peer, PeerConnectionState state) {
    LOG_DEBUG("Peer {} is {}", peer.to_string(), to_string(state));
    switch (state) {
        case PeerConnectionState::CONNECTING: {
            std::lock_guard<std::mutex> lock(peers_mutex_);
            connecting_since_.emplace(peer, context_.clock.now());
            break;
        }
        case PeerConnectionState::ESTABLISHED: {
            {
                std::lock_guard<std::mutex> lock(peers_mutex_);
                connecting_since_.erase(peer);
            }
            broadcast(PeerConnected{peer});
            break;
        }
        case PeerConnectionState::FAILED:
        case PeerConnectionState::CLOSED: {
            {
                std::lock_guard<std::mutex> lock(peers_mutex_);
                connecting_since_.erase(peer);
                initiated_.erase(peer);
            }
            uploads_.peer_closed(peer);
            broadcast(PeerDisconnected{peer});
            break;
        }
    }
}

std::shared_ptr<DownloadTask> SwarmCoordinator::find_task(const core::FileId& file_id) const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = tasks_.find(file_id);
    return it == tasks_.end() ? nullptr : it->second.task;
}

void SwarmCoordinator::broadcast(const DownloadEvent& event) {
    std::vector<std::shared_ptr<DownloadTask>> active;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (const auto& [file_id, entry] : tasks_) {
            active.push_back(entry.task);
        }
    }
    for (const auto& task : active) {
        task->post(event);
    }
}

void SwarmCoordinator::discard_file(const core::FileId& file_id, const std::string& why) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(file_id);
        if (it != tasks_.end()) {
            LOG_INFO("Cancelling download {} ({})", file_id, why);
            it->second.purge_on_exit = true;
            it->second.task->post(CancelRequested{});
            return;
        }
    }
    LOG_INFO("Discarding local copy of {} ({})", file_id, why);
    auto purged = purge(file_id);
    if (!purged && purged.error != ErrorCode::NOT_FOUND) {
        LOG_ERROR("Purge of {} failed: {}", file_id, purged.describe());
    }
}

Result SwarmCoordinator::purge(const core::FileId& file_id) {
    if (purge_handler_) {
        return purge_handler_(file_id);
    }
    // Without a collector the pieces go one at a time.
    auto result = context_.store.purge_file(file_id);
    bool resume_removed = context_.resume.remove(file_id);
    bool index_removed = context_.files.remove(file_id);
    if (!resume_removed || !index_removed) {
        LOG_WARN("Local records of {} were not fully removed", file_id);
    }
    return result;
}

size_t SwarmCoordinator::resume_all() {
    size_t resumed = 0;
    for (const auto& state : context_.resume.list_resumable()) {
        if (state.paused || find_task(state.file_id)) {
            continue;
        }
        auto result = resume(state.file_id);
        if (result) {
            ++resumed;
        } else {
            LOG_WARN("Unable to resume {}: {}", state.file_id, result.describe());
        }
    }
    return resumed;
}

void SwarmCoordinator::maintenance_loop() {
    while (running_.load()) {
        check_connections(context_.clock.now());
        reap_finished();

        std::unique_lock<std::mutex> lock(maintenance_mutex_);
        maintenance_cv_.wait_for(lock, MAINTENANCE_INTERVAL, [this]() { return !running_.load(); });
    }
}

} // namespace chunkswarm::transfer
