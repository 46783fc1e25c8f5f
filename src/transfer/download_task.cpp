#include "chunkswarm/transfer/download_task.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/overloaded.hpp"
#include "chunkswarm/core/utils.hpp"
#include "chunkswarm/crypto/key_cache.hpp"
#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/storage/file_index.hpp"
#include "chunkswarm/storage/resume_manager.hpp"
#include "chunkswarm/tracker/tracker_api.hpp"
#include <algorithm>

namespace chunkswarm::transfer {

using core::ErrorCode;
using core::Result;
using core::overloaded;
using core::TaskPhase;

DownloadTask::DownloadTask(SwarmContext& context, PeerPool& pool, FileDescriptor descriptor,
                           std::filesystem::path output_path)
    : context_(context)
    , pool_(pool)
    , descriptor_(std::move(descriptor))
    , output_path_(std::move(output_path))
    , completed_(descriptor_.chunk_count)
    , phase_(TaskPhase::DOWNLOADING)
    , outcome_(TaskOutcome::RUNNING)
    , tracker_forgot_(false)
    , duplicates_(0) {
    progress_.file_id = descriptor_.file_id;
    progress_.total_chunks = descriptor_.chunk_count;
    progress_.total_bytes = descriptor_.total_size;
}

DownloadTask::~DownloadTask() {
    events_.close();
    release_peers();
    crypto::wipe(key_);
}

Result DownloadTask::start() {
    const auto& file_id = descriptor_.file_id;
    if (!storage::ChunkStore::is_valid_file_id(file_id)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "invalid file id " + file_id);
    }
    if (descriptor_.total_size == 0 || descriptor_.checksum.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "incomplete file descriptor");
    }
    auto expected_count = storage::ChunkManager::chunk_count_for(descriptor_.total_size, context_.chunks.chunk_size());
    if (descriptor_.chunk_count != expected_count) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "chunk count " + std::to_string(descriptor_.chunk_count) +
                            " does not match size (expected " + std::to_string(expected_count) + ")");
    }

    auto existing = context_.files.get(file_id);
    if (existing && (existing->role == storage::FileRole::UPLOADER || existing->download_complete)) {
        return Result::fail(ErrorCode::CONFLICT, "file " + file_id + " is already held locally");
    }

    auto key = context_.keys.key_for(descriptor_.key_handle);
    if (!key) {
        return Result::fail(ErrorCode::UNAUTHORIZED, "file key unavailable for " + file_id);
    }
    key_ = *key;

    auto now = context_.clock.now();

    auto saved = context_.resume.load(file_id);
    if (saved && saved->chunk_count == descriptor_.chunk_count && saved->completed.size() == descriptor_.chunk_count) {
        completed_ = saved->completed;
        LOG_INFO("Resuming {} at {}/{} chunks (was {})", file_id, completed_.count(),
                 descriptor_.chunk_count, core::to_string(saved->phase));
    }

    // The chunk store is authoritative: a chunk may have been committed
    // just before a crash that lost the progress write.
    std::uint32_t recovered = 0;
    std::uint32_t dropped = 0;
    for (std::uint32_t index = 0; index < descriptor_.chunk_count; ++index) {
        bool stored = context_.store.has_chunk(file_id, index);
        if (stored && !completed_.test(index)) {
            completed_.set(index);
            ++recovered;
        } else if (!stored && completed_.test(index)) {
            completed_.reset(index);
            ++dropped;
        }
    }
    if (recovered > 0 || dropped > 0) {
        LOG_INFO("Reconciled {} with chunk store: {} recovered, {} missing", file_id, recovered, dropped);
    }

    bytes_completed_ = 0;
    for (auto index : completed_.set_indices()) {
        bytes_completed_ += context_.chunks.expected_plaintext_size(descriptor_.total_size, index);
    }

    scheduler_.emplace(descriptor_.chunk_count, completed_);

    storage::LocalFileRecord record;
    if (existing) {
        record = *existing;
    } else {
        record.file_id = file_id;
        record.total_size = descriptor_.total_size;
        record.chunk_count = descriptor_.chunk_count;
        record.checksum = descriptor_.checksum;
        record.uploader_id = descriptor_.uploader_id;
        record.role = storage::FileRole::DOWNLOADER;
        record.created_at = now;
        record.seeder_since = now;
        record.key_handle = descriptor_.key_handle;
        record.share_scope = descriptor_.share_scope;
    }
    record.last_activity_at = now;
    record.local_path = output_path_.string();
    if (!context_.files.upsert(record)) {
        return Result::fail(ErrorCode::STORAGE_FAILURE, "unable to record " + file_id + " in the file index");
    }

    set_phase(TaskPhase::DOWNLOADING);
    persist();

    auto register_result = context_.tracker.register_leecher(file_id, core::ChunkBitmap::from_indices(
        descriptor_.chunk_count, completed_.missing_indices()));
    if (!register_result) {
        LOG_WARN("Leecher registration for {} failed: {}", file_id, register_result.describe());
    }

    next_rediscovery_ = now;
    last_usable_peer_at_ = now;
    update_progress();

    LOG_INFO("Download {} started: {}/{} chunks present, output {}", file_id, completed_.count(),
             descriptor_.chunk_count, output_path_.string());
    return Result::ok();
}

bool DownloadTask::step(std::chrono::milliseconds max_wait) {
    if (outcome_ != TaskOutcome::RUNNING) {
        return false;
    }

    run_timers(context_.clock.now());

    if (outcome_ == TaskOutcome::RUNNING) {
        auto event = max_wait.count() > 0
            ? events_.wait_pop_until(std::chrono::steady_clock::now() + max_wait)
            : events_.try_pop();
        if (event) {
            auto now = context_.clock.now();
            handle_event(*event, now);
            if (outcome_ == TaskOutcome::RUNNING) {
                run_timers(now);
            }
        }
    }

    update_progress();
    return outcome_ == TaskOutcome::RUNNING;
}

void DownloadTask::run() {
    while (step(context_.settings.tick)) {
    }
    LOG_DEBUG("Download task {} stopped ({})", descriptor_.file_id, to_string(outcome_.load()));
}

void DownloadTask::post(DownloadEvent event) {
    if (!events_.push(std::move(event))) {
        LOG_TRACE("Event for stopped task {} dropped", descriptor_.file_id);
    }
}

TaskOutcome DownloadTask::wait(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    stopped_cv_.wait_for(lock, timeout, [this]() { return outcome_.load() != TaskOutcome::RUNNING; });
    return outcome_.load();
}

DownloadProgress DownloadTask::progress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return progress_;
}

Result DownloadTask::result() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return result_;
}

void DownloadTask::run_timers(core::TimePoint now) {
    if (phase_ == TaskPhase::DOWNLOADING) {
        if (now >= next_rediscovery_) {
            rediscover(now);
            if (outcome_ != TaskOutcome::RUNNING) {
                return;
            }
        }

        for (const auto& expired : scheduler_->expire(now, context_.settings.request_timeout)) {
            LOG_DEBUG("Request for chunk {} of {} to {} timed out", expired.chunk_index,
                      descriptor_.file_id, expired.peer.to_string());
        }

        if (completed_.complete()) {
            enter_draining(now);
        } else {
            schedule(now);

            if (scheduler_->has_usable_peer() || scheduler_->in_flight_count() > 0) {
                last_usable_peer_at_ = now;
            } else if (now - last_usable_peer_at_ >= context_.settings.no_seeder_timeout) {
                LOG_ERROR("No reachable seeder for {} in {}s", descriptor_.file_id,
                          context_.settings.no_seeder_timeout.count());
                fail(Result::fail(ErrorCode::TIMEOUT, "no reachable seeder"), completed_.missing_indices());
                return;
            }
        }
    }

    if (phase_ == TaskPhase::DRAINING) {
        auto outstanding = outstanding_count();
        if (outstanding == 0) {
            assemble();
        } else if (now >= drain_deadline_) {
            LOG_WARN("Drain timeout for {} with {} responses outstanding", descriptor_.file_id, outstanding);
            assemble();
        }
    }
}

void DownloadTask::handle_event(const DownloadEvent& event, core::TimePoint now) {
    std::visit(overloaded{
        [&](const ChunkReceived& e) { on_chunk(e, now); },
        [&](const ChunkRefused& e) { on_refused(e); },
        [&](const PeerConnected& e) {
            if (scheduler_->has_peer(e.peer)) {
                scheduler_->set_ready(e.peer, true);
                LOG_DEBUG("Peer {} ready for {}", e.peer.to_string(), descriptor_.file_id);
            }
        },
        [&](const PeerDisconnected& e) { on_peer_lost(e.peer, "disconnected"); },
        [&](const ConnectionTimeout& e) { on_peer_lost(e.peer, "connect timeout"); },
        [&](const RediscoverRequested&) { next_rediscovery_ = now; },
        [&](const PauseRequested&) { pause(); },
        [&](const CancelRequested&) { cancel(); },
    }, event);
}

void DownloadTask::on_chunk(const ChunkReceived& event, core::TimePoint now) {
    const auto index = event.chunk_index;
    note_response(event.peer, index);

    if (phase_ != TaskPhase::DOWNLOADING && phase_ != TaskPhase::DRAINING) {
        LOG_DEBUG("Late chunk {} of {} ignored in {}", index, descriptor_.file_id, core::to_string(phase_.load()));
        return;
    }
    if (index >= descriptor_.chunk_count) {
        LOG_WARN("Peer {} sent out-of-range chunk {} for {}", event.peer.to_string(), index, descriptor_.file_id);
        return;
    }
    if (completed_.test(index)) {
        ++duplicates_;
        LOG_DEBUG("Duplicate chunk {} of {} from {} ignored", index, descriptor_.file_id, event.peer.to_string());
        return;
    }

    const auto expected_size = context_.chunks.expected_plaintext_size(descriptor_.total_size, index);
    storage::ChunkVerifier verifier = [&](const crypto::EncryptedChunk& chunk) {
        return chunk.ciphertext.size() == expected_size &&
               cipher_.verify_chunk(key_, descriptor_.file_id, index, chunk);
    };

    Result put;
    std::uint32_t attempts = std::max<std::uint32_t>(1, context_.settings.max_storage_retries);
    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        put = context_.store.put_chunk(descriptor_.file_id, index, event.chunk, verifier);
        if (put.error != ErrorCode::STORAGE_FAILURE) {
            break;
        }
        LOG_WARN("Storing chunk {} of {} failed (attempt {}/{}): {}", index, descriptor_.file_id,
                 attempt, attempts, put.message);
    }

    switch (put.error) {
        case ErrorCode::SUCCESS:
        case ErrorCode::CONFLICT:
            commit_chunk(index, now);
            break;
        case ErrorCode::CORRUPT:
            LOG_WARN("Chunk {} of {} from {} failed verification", index, descriptor_.file_id, event.peer.to_string());
            scheduler_->release(index, event.peer, ReleaseReason::REFUSED);
            break;
        default:
            LOG_ERROR("Giving up storing chunk {} of {} from {}; requeueing: {}", index, descriptor_.file_id,
                      event.peer.to_string(), put.describe());
            scheduler_->release(index, event.peer, ReleaseReason::RETRY);
            break;
    }
}

void DownloadTask::on_refused(const ChunkRefused& event) {
    note_response(event.peer, event.chunk_index);
    if (phase_ != TaskPhase::DOWNLOADING || event.chunk_index >= descriptor_.chunk_count) {
        return;
    }
    LOG_DEBUG("Peer {} does not have chunk {} of {}", event.peer.to_string(), event.chunk_index, descriptor_.file_id);
    scheduler_->release(event.chunk_index, event.peer, ReleaseReason::REFUSED);
}

void DownloadTask::on_peer_lost(const core::DeviceKey& peer, const char* why) {
    outstanding_.erase(peer);
    if (!scheduler_->has_peer(peer)) {
        return;
    }
    auto requeued = scheduler_->remove_peer(peer);
    if (acquired_.erase(peer) > 0) {
        pool_.release(peer);
    }
    LOG_INFO("Peer {} {} during {}; {} chunks requeued", peer.to_string(), why, descriptor_.file_id, requeued.size());
}

void DownloadTask::rediscover(core::TimePoint now) {
    next_rediscovery_ = now + context_.settings.rediscovery_interval;

    std::vector<tracker::SeederAvailability> seeders;
    auto result = context_.tracker.get_available_chunks(descriptor_.file_id, seeders);
    if (result.error == ErrorCode::NOT_FOUND || result.error == ErrorCode::UNAUTHORIZED) {
        if (result.error == ErrorCode::NOT_FOUND) {
            tracker_forgot_ = true;
        }
        LOG_ERROR("Tracker rejected {}: {}", descriptor_.file_id, result.describe());
        fail(result, completed_.missing_indices());
        return;
    }
    if (!result) {
        LOG_WARN("Seeder discovery for {} failed: {}", descriptor_.file_id, result.describe());
        return;
    }

    size_t added = 0;
    for (const auto& seeder : seeders) {
        if (!seeder.reachable || seeder.device == context_.self) {
            continue;
        }
        if (!scheduler_->has_peer(seeder.device)) {
            ++added;
        }
        scheduler_->update_peer(seeder.device, seeder.bitmap, seeder.upload_capacity);
        if (!scheduler_->has_peer(seeder.device)) {
            continue;
        }
        if (acquired_.insert(seeder.device).second) {
            pool_.acquire(seeder.device);
        }
        scheduler_->set_ready(seeder.device, pool_.is_established(seeder.device));
    }
    if (added > 0) {
        LOG_INFO("Discovered {} new seeders for {} ({} listed)", added, descriptor_.file_id, seeders.size());
    }

    // Partial holders seed too.
    if (!completed_.none()) {
        tracker::FileRecordSummary summary;
        auto announced = context_.tracker.reannounce(descriptor_.file_id, completed_, false, summary);
        if (announced.error == ErrorCode::NOT_FOUND) {
            tracker_forgot_ = true;
            LOG_ERROR("Tracker no longer knows {}", descriptor_.file_id);
            fail(announced, completed_.missing_indices());
        } else if (!announced) {
            LOG_DEBUG("Partial reannounce of {} failed: {}", descriptor_.file_id, announced.describe());
        }
    }
}

void DownloadTask::schedule(core::TimePoint now) {
    for (const auto& assignment : scheduler_->next_assignments(now)) {
        ChunkRequestMessage request{descriptor_.file_id, assignment.chunk_index};
        if (pool_.send(assignment.peer, request)) {
            outstanding_[assignment.peer].insert(assignment.chunk_index);
            LOG_TRACE("Requested chunk {} of {} from {}", assignment.chunk_index, descriptor_.file_id,
                      assignment.peer.to_string());
        } else {
            LOG_DEBUG("Send to {} failed; marking not ready", assignment.peer.to_string());
            scheduler_->release(assignment.chunk_index, assignment.peer, ReleaseReason::RETRY);
            scheduler_->set_ready(assignment.peer, false);
        }
    }
}

void DownloadTask::commit_chunk(std::uint32_t chunk_index, core::TimePoint now) {
    completed_.set(chunk_index);
    scheduler_->mark_completed(chunk_index);
    bytes_completed_ += context_.chunks.expected_plaintext_size(descriptor_.total_size, chunk_index);

    persist();
    if (!context_.files.touch_activity(descriptor_.file_id, now)) {
        LOG_WARN("Could not record activity on {}", descriptor_.file_id);
    }

    LOG_TRACE("Committed chunk {} of {} ({}/{})", chunk_index, descriptor_.file_id,
              completed_.count(), descriptor_.chunk_count);

    if (completed_.complete() && phase_ == TaskPhase::DOWNLOADING) {
        enter_draining(now);
    }
}

void DownloadTask::note_response(const core::DeviceKey& peer, std::uint32_t chunk_index) {
    if (scheduler_) {
        scheduler_->response_arrived(peer, chunk_index);
    }
    auto it = outstanding_.find(peer);
    if (it == outstanding_.end()) {
        return;
    }
    auto request = it->second.find(chunk_index);
    if (request != it->second.end()) {
        it->second.erase(request);
    }
    if (it->second.empty()) {
        outstanding_.erase(it);
    }
}

size_t DownloadTask::outstanding_count() const {
    size_t count = 0;
    for (const auto& [peer, requests] : outstanding_) {
        count += requests.size();
    }
    return count;
}

void DownloadTask::enter_draining(core::TimePoint now) {
    set_phase(TaskPhase::DRAINING);
    drain_deadline_ = now + context_.settings.drain_timeout;
    persist();

    for (const auto& peer : scheduler_->peers()) {
        if (pool_.is_established(peer)) {
            pool_.send(peer, DownloadCompleteMessage{descriptor_.file_id});
        }
    }

    LOG_INFO("All {} chunks of {} received; draining {} outstanding responses",
             descriptor_.chunk_count, descriptor_.file_id, outstanding_count());
}

void DownloadTask::assemble() {
    set_phase(TaskPhase::ASSEMBLING);
    persist();

    auto report = context_.chunks.check_chunks(descriptor_.file_id, descriptor_.chunk_count, descriptor_.total_size);
    if (!report.ok()) {
        fail_corrupt(report, Result::fail(ErrorCode::CORRUPT, report.summary()));
        return;
    }

    set_phase(TaskPhase::VERIFYING);
    persist();

    storage::AssemblyReport verify_report;
    auto assembled = context_.chunks.assemble_file(descriptor_.file_id, descriptor_.chunk_count,
                                                   descriptor_.total_size, descriptor_.checksum, key_,
                                                   output_path_, verify_report);
    if (!assembled) {
        if (verify_report.ok()) {
            fail(assembled, {});
        } else {
            fail_corrupt(verify_report, assembled);
        }
        return;
    }

    complete();
}

void DownloadTask::complete() {
    const auto& file_id = descriptor_.file_id;
    auto now = context_.clock.now();

    if (!context_.files.mark_complete(file_id, now)) {
        LOG_ERROR("Could not mark {} complete in the file index", file_id);
    }
    if (!context_.resume.remove(file_id)) {
        LOG_WARN("Stale resume state left for {}", file_id);
    }

    tracker::FileRecordSummary summary;
    auto announced = context_.tracker.reannounce(file_id, completed_, true, summary);
    if (announced.error == ErrorCode::NOT_FOUND) {
        tracker_forgot_ = true;
        LOG_WARN("{} completed but the tracker no longer knows it", file_id);
    } else if (!announced) {
        LOG_WARN("Reannounce of completed {} failed: {}", file_id, announced.describe());
    }
    auto unregistered = context_.tracker.unregister_leecher(file_id);
    if (!unregistered) {
        LOG_DEBUG("Leecher unregister for {}: {}", file_id, unregistered.describe());
    }

    release_peers();
    set_phase(TaskPhase::COMPLETE);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        result_ = Result::ok();
    }
    LOG_INFO("Download {} complete: {} written to {}", file_id,
             core::utils::StringUtils::format_bytes(descriptor_.total_size), output_path_.string());
    finish(TaskOutcome::COMPLETE);
}

void DownloadTask::fail(Result error, std::vector<std::uint32_t> missing) {
    const auto& file_id = descriptor_.file_id;

    context_.resume.remove(file_id);
    auto unregistered = context_.tracker.unregister_leecher(file_id);
    if (!unregistered) {
        LOG_DEBUG("Leecher unregister for {}: {}", file_id, unregistered.describe());
    }
    release_peers();

    set_phase(TaskPhase::FAILED);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        result_ = error;
        progress_.missing = std::move(missing);
        progress_.error = error.describe();
    }
    LOG_ERROR("Download {} failed: {}", file_id, error.describe());
    finish(TaskOutcome::FAILED);
}

void DownloadTask::fail_corrupt(const storage::AssemblyReport& report, const Result& error) {
    // Offending chunks go so a retry fetches them again. A whole-file
    // checksum mismatch cannot be pinned on one chunk, so all of them go.
    auto offending = report.offending();
    if (report.checksum_mismatch && offending.empty()) {
        offending.reserve(descriptor_.chunk_count);
        for (std::uint32_t index = 0; index < descriptor_.chunk_count; ++index) {
            offending.push_back(index);
        }
        LOG_WARN("{} failed its checksum; discarding all {} chunks", descriptor_.file_id, descriptor_.chunk_count);
    }
    for (auto index : offending) {
        if (context_.store.has_chunk(descriptor_.file_id, index)) {
            auto removed = context_.store.delete_chunk(descriptor_.file_id, index);
            if (!removed) {
                LOG_WARN("Unable to remove bad chunk {} of {}: {}", index, descriptor_.file_id, removed.describe());
            }
        }
    }
    fail(Result::fail(ErrorCode::CORRUPT, error.message.empty() ? report.summary() : error.message),
         std::move(offending));
}

void DownloadTask::pause() {
    LOG_INFO("Pausing {} at {}/{} chunks", descriptor_.file_id, completed_.count(), descriptor_.chunk_count);

    storage::ResumeState state;
    state.file_id = descriptor_.file_id;
    state.chunk_count = descriptor_.chunk_count;
    state.completed = completed_;
    state.phase = TaskPhase::DOWNLOADING;
    state.paused = true;
    state.key_handle = descriptor_.key_handle;
    state.total_size = descriptor_.total_size;
    state.checksum = descriptor_.checksum;
    state.uploader_id = descriptor_.uploader_id;
    state.output_path = output_path_.string();
    state.updated_at = context_.clock.now();
    if (!context_.resume.save(state)) {
        LOG_ERROR("Unable to persist paused state of {}", descriptor_.file_id);
    }

    auto unregistered = context_.tracker.unregister_leecher(descriptor_.file_id);
    if (!unregistered) {
        LOG_DEBUG("Leecher unregister for {}: {}", descriptor_.file_id, unregistered.describe());
    }
    release_peers();
    finish(TaskOutcome::PAUSED);
}

void DownloadTask::cancel() {
    LOG_INFO("Cancelling {}", descriptor_.file_id);
    context_.resume.remove(descriptor_.file_id);
    auto unregistered = context_.tracker.unregister_leecher(descriptor_.file_id);
    if (!unregistered) {
        LOG_DEBUG("Leecher unregister for {}: {}", descriptor_.file_id, unregistered.describe());
    }
    release_peers();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        result_ = Result::fail(ErrorCode::INVALID_STATE, "cancelled");
    }
    finish(TaskOutcome::CANCELLED);
}

void DownloadTask::set_phase(TaskPhase phase) {
    auto previous = phase_.exchange(phase);
    if (previous != phase) {
        LOG_INFO("Download {}: {} -> {}", descriptor_.file_id, core::to_string(previous), core::to_string(phase));
    }
}

void DownloadTask::finish(TaskOutcome outcome) {
    events_.close();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        outcome_ = outcome;
    }
    update_progress();
    stopped_cv_.notify_all();
}

void DownloadTask::persist() {
    storage::ResumeState state;
    state.file_id = descriptor_.file_id;
    state.chunk_count = descriptor_.chunk_count;
    state.completed = completed_;
    state.phase = phase_.load();
    state.key_handle = descriptor_.key_handle;
    state.total_size = descriptor_.total_size;
    state.checksum = descriptor_.checksum;
    state.uploader_id = descriptor_.uploader_id;
    state.output_path = output_path_.string();
    state.updated_at = context_.clock.now();
    if (!context_.resume.save(state)) {
        LOG_ERROR("Unable to persist progress of {}", descriptor_.file_id);
    }
}

void DownloadTask::release_peers() {
    for (const auto& peer : acquired_) {
        pool_.release(peer);
    }
    acquired_.clear();
    outstanding_.clear();
}

void DownloadTask::update_progress() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    progress_.phase = phase_.load();
    progress_.outcome = outcome_.load();
    progress_.completed_chunks = completed_.count();
    progress_.bytes_completed = bytes_completed_;
    progress_.in_flight = outstanding_count();
    progress_.known_peers = scheduler_ ? scheduler_->peers().size() : 0;
}

} // namespace chunkswarm::transfer
