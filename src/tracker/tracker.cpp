#include "chunkswarm/tracker/tracker.hpp"
#include "chunkswarm/core/logger.hpp"

namespace chunkswarm::tracker {

using core::ErrorCode;
using core::Result;

Tracker::Tracker(TrackerSettings settings, core::Clock& clock)
    : settings_(std::move(settings))
    , clock_(clock)
    , notifier_(nullptr)
    , presence_(nullptr) {
}

Result Tracker::announce(const Announcement& announcement, FileRecordSummary& out) {
    const auto& metadata = announcement.metadata;
    if (announcement.file_id.empty() || announcement.device.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "file id and device are required");
    }
    if (metadata.chunk_count == 0 || metadata.total_size == 0 || metadata.checksum.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "incomplete file metadata");
    }
    if (announcement.bitmap.size() != metadata.chunk_count) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "bitmap length does not match chunk count");
    }

    Outbox outbox;
    auto now = clock_.now();

    for (;;) {
        auto slot = find_or_create_slot(announcement.file_id);
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->erased) {
            continue;
        }

        auto& record = slot->record;
        const auto& user = announcement.device.user_id;

        if (!slot->initialized) {
            record.file_id = announcement.file_id;
            record.total_size = metadata.total_size;
            record.chunk_count = metadata.chunk_count;
            record.checksum = metadata.checksum;
            record.share_scope = ShareScope(announcement.share_scope);
            record.uploader_id = user;
            record.created_at = now;
            record.expires_at = now + settings_.file_ttl;
            slot->initialized = true;
            LOG_INFO("Created record {} ({} chunks) for uploader {}",
                     record.file_id, record.chunk_count, user);
        } else {
            if (record.deleted) {
                LOG_DEBUG("Announce of deleted file {} by {} rejected", record.file_id, announcement.device.to_string());
                return Result::fail(ErrorCode::NOT_FOUND, "file has been deleted");
            }
            if (!record.can_access(user)) {
                LOG_WARN("Announce of {} by out-of-scope user {} rejected", record.file_id, user);
                return Result::fail(ErrorCode::UNAUTHORIZED, "not within the file's share scope");
            }
            if (record.chunk_count != metadata.chunk_count ||
                record.total_size != metadata.total_size ||
                record.checksum != metadata.checksum) {
                LOG_WARN("Announce of {} by {} carries conflicting metadata", record.file_id, announcement.device.to_string());
                return Result::fail(ErrorCode::CONFLICT, "metadata does not match the existing record");
            }
            // Only the uploader can widen who may see the file.
            if (user == record.uploader_id) {
                record.share_scope.merge(ShareScope(announcement.share_scope));
            }
            refresh_ttl(record, now);
        }

        auto it = record.seeders.find(announcement.device);
        if (it == record.seeders.end()) {
            it = record.seeders.emplace(announcement.device, SeederEntry{}).first;
            it->second.seeder_since = now;
        }
        auto& seeder = it->second;
        seeder.bitmap = announcement.bitmap;
        seeder.upload_capacity = announcement.upload_capacity > 0 ? announcement.upload_capacity : DEFAULT_UPLOAD_CAPACITY;
        seeder.last_activity_at = now;
        seeder.download_complete = announcement.bitmap.complete();

        if (seeder.download_complete) {
            record.leechers.erase(announcement.device);
        }

        if (user == record.uploader_id) {
            for (const auto& [leecher, entry] : record.leechers) {
                outbox.emplace_back(leecher, UploaderOnline{record.file_id, announcement.device});
            }
        }

        LOG_DEBUG("Seeder {} announced {} with {}/{} chunks",
                  announcement.device.to_string(), record.file_id, seeder.bitmap.count(), record.chunk_count);
        out = FileRecordSummary::from_record(record);
        break;
    }

    deliver(outbox);
    return Result::ok();
}

Result Tracker::reannounce(const core::FileId& file_id, const core::DeviceKey& device,
                           const core::ChunkBitmap& bitmap, bool download_complete,
                           FileRecordSummary& out) {
    if (device.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "device is required");
    }

    Outbox outbox;
    auto now = clock_.now();
    {
        auto slot = find_slot(file_id);
        if (!slot) {
            return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& record = slot->record;
        if (slot->erased || !slot->initialized || record.deleted) {
            return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
        }
        if (!record.can_access(device.user_id)) {
            return Result::fail(ErrorCode::UNAUTHORIZED, "not within the file's share scope");
        }
        if (bitmap.size() != record.chunk_count) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "bitmap length does not match chunk count");
        }
        if (download_complete && !bitmap.complete()) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "complete seeder must hold every chunk");
        }

        auto existing = record.seeders.find(device);
        SeederEntry seeder;
        seeder.seeder_since = existing != record.seeders.end() ? existing->second.seeder_since : now;
        seeder.upload_capacity = existing != record.seeders.end() ? existing->second.upload_capacity : DEFAULT_UPLOAD_CAPACITY;
        seeder.bitmap = bitmap;
        seeder.download_complete = download_complete;
        seeder.last_activity_at = now;
        record.seeders[device] = std::move(seeder);

        if (download_complete) {
            record.leechers.erase(device);
        }
        refresh_ttl(record, now);

        if (device.user_id == record.uploader_id) {
            for (const auto& [leecher, entry] : record.leechers) {
                outbox.emplace_back(leecher, UploaderOnline{record.file_id, device});
            }
        }

        LOG_DEBUG("Seeder {} reannounced {} ({}/{} chunks, complete={})",
                  device.to_string(), file_id, bitmap.count(), record.chunk_count, download_complete);
        out = FileRecordSummary::from_record(record);
    }

    deliver(outbox);
    return Result::ok();
}

ExistenceReport Tracker::check_exists(const std::vector<core::FileId>& file_ids) const {
    ExistenceReport report;
    for (const auto& file_id : file_ids) {
        bool present = false;
        if (auto slot = find_slot(file_id)) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            present = !slot->erased && slot->initialized && !slot->record.deleted;
        }
        (present ? report.exists : report.missing).push_back(file_id);
    }
    return report;
}

Result Tracker::get_available_chunks(const core::FileId& file_id, const core::DeviceKey& requester,
                                     std::vector<SeederAvailability>& out) const {
    out.clear();
    auto slot = find_slot(file_id);
    if (!slot) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }

    std::vector<SeederAvailability> result;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        const auto& record = slot->record;
        if (slot->erased || !slot->initialized || record.deleted) {
            return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
        }
        if (!record.can_access(requester.user_id)) {
            LOG_WARN("Availability query for {} by out-of-scope user {}", file_id, requester.user_id);
            return Result::fail(ErrorCode::UNAUTHORIZED, "not within the file's share scope");
        }

        for (const auto& [device, seeder] : record.seeders) {
            if (device == requester) {
                continue;
            }
            SeederAvailability entry;
            entry.device = device;
            entry.bitmap = seeder.bitmap;
            entry.upload_capacity = seeder.upload_capacity;
            entry.download_complete = seeder.download_complete;
            result.push_back(std::move(entry));
        }
    }

    // Presence is consulted outside the record lock.
    for (auto& entry : result) {
        entry.reachable = is_reachable(entry.device);
    }
    out = std::move(result);
    return Result::ok();
}

Result Tracker::delete_share(const core::FileId& file_id, const core::DeviceKey& requester) {
    Outbox outbox;
    {
        auto slot = find_slot(file_id);
        if (!slot) {
            return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& record = slot->record;
        if (slot->erased || !slot->initialized) {
            return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
        }
        if (requester.user_id != record.uploader_id) {
            LOG_WARN("Delete of {} by non-uploader {} rejected", file_id, requester.to_string());
            return Result::fail(ErrorCode::UNAUTHORIZED, "only the uploader may delete a share");
        }
        if (record.deleted) {
            return Result::fail(ErrorCode::NOT_FOUND, "file already deleted");
        }

        record.deleted = true;
        record.deleted_at = clock_.now();

        const std::string reason = "deleted by uploader";
        for (const auto& [device, seeder] : record.seeders) {
            if (!(device == requester)) {
                outbox.emplace_back(device, ShareDeleted{file_id, reason});
            }
        }
        for (const auto& [device, leecher] : record.leechers) {
            if (!(device == requester) && record.seeders.count(device) == 0) {
                outbox.emplace_back(device, ShareDeleted{file_id, reason});
            }
        }
        record.seeders.clear();
        record.leechers.clear();

        LOG_INFO("Share {} deleted by {}; notifying {} devices", file_id, requester.to_string(), outbox.size());
    }

    deliver(outbox);
    return Result::ok();
}

Result Tracker::update_share_scope(const core::FileId& file_id, const core::DeviceKey& requester,
                                   const std::vector<core::UserId>& add,
                                   const std::vector<core::UserId>& remove,
                                   std::vector<core::UserId>& out) {
    Outbox outbox;
    {
        auto slot = find_slot(file_id);
        if (!slot) {
            return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& record = slot->record;
        if (slot->erased || !slot->initialized || record.deleted) {
            return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
        }
        const auto& user = requester.user_id;
        if (!record.can_access(user)) {
            LOG_WARN("Scope change of {} by out-of-scope user {} rejected", file_id, user);
            return Result::fail(ErrorCode::UNAUTHORIZED, "not within the file's share scope");
        }

        bool uploader = user == record.uploader_id;
        for (const auto& removed : remove) {
            if (removed == record.uploader_id) {
                return Result::fail(ErrorCode::INVALID_ARGUMENT, "the uploader cannot leave the scope");
            }
            if (!uploader && removed != user) {
                LOG_WARN("{} tried to revoke {} from {}", requester.to_string(), removed, file_id);
                return Result::fail(ErrorCode::UNAUTHORIZED, "only the uploader may revoke other users");
            }
        }

        ShareScope updated = record.share_scope;
        for (const auto& added : add) {
            if (!added.empty() && added != record.uploader_id) {
                updated.members.insert(added);
            }
        }
        for (const auto& removed : remove) {
            updated.members.erase(removed);
        }
        if (updated.size() > MAX_SHARE_SCOPE) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                                "a file may be shared with at most " + std::to_string(MAX_SHARE_SCOPE) + " users");
        }

        if (updated.members != record.share_scope.members) {
            std::set<core::UserId> revoked;
            for (const auto& member : record.share_scope.members) {
                if (!updated.contains(member)) {
                    revoked.insert(member);
                }
            }
            record.share_scope = std::move(updated);

            std::set<core::DeviceKey> cut;
            for (auto it = record.seeders.begin(); it != record.seeders.end();) {
                if (revoked.count(it->first.user_id) > 0) {
                    cut.insert(it->first);
                    it = record.seeders.erase(it);
                } else {
                    ++it;
                }
            }
            for (auto it = record.leechers.begin(); it != record.leechers.end();) {
                if (revoked.count(it->first.user_id) > 0) {
                    cut.insert(it->first);
                    it = record.leechers.erase(it);
                } else {
                    ++it;
                }
            }
            for (const auto& device : cut) {
                outbox.emplace_back(device, ShareDeleted{file_id, "access revoked"});
            }

            auto scope = record.share_scope.to_vector();
            for (const auto& [device, seeder] : record.seeders) {
                outbox.emplace_back(device, ShareScopeChanged{file_id, scope});
            }
            LOG_INFO("Scope of {} changed by {}: {} users, {} revoked, {} devices cut",
                     file_id, requester.to_string(), record.share_scope.size(), revoked.size(), cut.size());
        }
        out = record.share_scope.to_vector();
    }

    deliver(outbox);
    return Result::ok();
}

size_t Tracker::disconnect(const core::DeviceKey& device) {
    size_t affected = 0;
    for (const auto& slot : all_slots()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->erased || !slot->initialized) {
            continue;
        }
        auto& record = slot->record;
        size_t removed = record.seeders.erase(device) + record.leechers.erase(device);
        if (removed > 0) {
            ++affected;
        }
    }
    if (affected > 0) {
        LOG_INFO("Device {} disconnected; removed from {} records", device.to_string(), affected);
    }
    return affected;
}

Result Tracker::unannounce(const core::FileId& file_id, const core::DeviceKey& device) {
    auto slot = find_slot(file_id);
    if (!slot) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->erased || !slot->initialized || slot->record.deleted) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    if (slot->record.seeders.erase(device) == 0) {
        return Result::fail(ErrorCode::NOT_FOUND, "device is not seeding " + file_id);
    }
    LOG_DEBUG("Seeder {} stopped seeding {}", device.to_string(), file_id);
    return Result::ok();
}

Result Tracker::register_leecher(const core::FileId& file_id, const core::DeviceKey& device,
                                 const core::ChunkBitmap& requested) {
    auto slot = find_slot(file_id);
    if (!slot) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto& record = slot->record;
    if (slot->erased || !slot->initialized || record.deleted) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    if (!record.can_access(device.user_id)) {
        return Result::fail(ErrorCode::UNAUTHORIZED, "not within the file's share scope");
    }
    if (requested.size() != record.chunk_count) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "bitmap length does not match chunk count");
    }

    auto& leecher = record.leechers[device];
    leecher.requested = requested;
    leecher.last_seen_at = clock_.now();
    LOG_DEBUG("Leecher {} registered for {} ({} chunks requested)",
              device.to_string(), file_id, requested.count());
    return Result::ok();
}

Result Tracker::unregister_leecher(const core::FileId& file_id, const core::DeviceKey& device) {
    auto slot = find_slot(file_id);
    if (!slot) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->erased || !slot->initialized || slot->record.leechers.erase(device) == 0) {
        return Result::fail(ErrorCode::NOT_FOUND, "device is not leeching " + file_id);
    }
    return Result::ok();
}

Result Tracker::record_activity(const core::FileId& file_id, const core::DeviceKey& device) {
    auto slot = find_slot(file_id);
    if (!slot) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto& record = slot->record;
    if (slot->erased || !slot->initialized || record.deleted) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    auto it = record.seeders.find(device);
    if (it == record.seeders.end()) {
        return Result::fail(ErrorCode::NOT_FOUND, "device is not seeding " + file_id);
    }
    auto now = clock_.now();
    it->second.last_activity_at = now;
    refresh_ttl(record, now);
    return Result::ok();
}

Result Tracker::get_file_summary(const core::FileId& file_id, const core::DeviceKey& requester,
                                 FileRecordSummary& out) const {
    auto slot = find_slot(file_id);
    if (!slot) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& record = slot->record;
    if (slot->erased || !slot->initialized || record.deleted) {
        return Result::fail(ErrorCode::NOT_FOUND, "unknown file " + file_id);
    }
    if (!record.can_access(requester.user_id)) {
        return Result::fail(ErrorCode::UNAUTHORIZED, "not within the file's share scope");
    }
    out = FileRecordSummary::from_record(record);
    return Result::ok();
}

SweepReport Tracker::sweep() {
    SweepReport report;
    Outbox outbox;
    auto now = clock_.now();

    for (const auto& slot : all_slots()) {
        bool erase = false;
        core::FileId file_id;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->erased || !slot->initialized) {
                continue;
            }
            auto& record = slot->record;
            file_id = record.file_id;

            if (record.deleted) {
                if (now - record.deleted_at >= settings_.delete_grace) {
                    erase = true;
                    ++report.deleted_records_removed;
                }
            } else {
                // Complete seeders never age out; incomplete ones do after
                // seeder_ttl without activity.
                for (auto it = record.seeders.begin(); it != record.seeders.end();) {
                    const auto& seeder = it->second;
                    if (!seeder.download_complete && now - seeder.last_activity_at > settings_.seeder_ttl) {
                        LOG_INFO("Removing inactive seeder {} from {}", it->first.to_string(), file_id);
                        outbox.emplace_back(it->first, SeederRemoved{file_id, "inactive"});
                        it = record.seeders.erase(it);
                        ++report.seeders_removed;
                    } else {
                        ++it;
                    }
                }

                for (auto it = record.leechers.begin(); it != record.leechers.end();) {
                    if (now - it->second.last_seen_at > settings_.seeder_ttl) {
                        it = record.leechers.erase(it);
                        ++report.leechers_removed;
                    } else {
                        ++it;
                    }
                }

                // A record with a surviving seeder lives on regardless of expires_at.
                if (record.seeders.empty() && now >= record.expires_at) {
                    for (const auto& [device, leecher] : record.leechers) {
                        outbox.emplace_back(device, ShareDeleted{file_id, "expired"});
                    }
                    erase = true;
                    ++report.expired_records_removed;
                    LOG_INFO("Record {} expired with no seeders", file_id);
                }
            }

            if (erase) {
                slot->erased = true;
            }
        }

        if (erase) {
            erase_slot(file_id, slot);
        }
    }

    if (report.total() > 0) {
        LOG_INFO("Tracker sweep: {} deleted, {} expired, {} seeders and {} leechers removed",
                 report.deleted_records_removed, report.expired_records_removed,
                 report.seeders_removed, report.leechers_removed);
    }

    deliver(outbox);
    return report;
}

TrackerStats Tracker::stats() const {
    TrackerStats stats;
    for (const auto& slot : all_slots()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->erased || !slot->initialized) {
            continue;
        }
        const auto& record = slot->record;
        if (record.deleted) {
            ++stats.deleted_files;
            continue;
        }
        ++stats.files;
        stats.seeders += record.seeders.size();
        stats.leechers += record.leechers.size();
        for (const auto& [device, seeder] : record.seeders) {
            if (seeder.download_complete) {
                ++stats.complete_seeders;
            }
        }
    }
    return stats;
}

std::optional<FileRecord> Tracker::snapshot(const core::FileId& file_id) const {
    auto slot = find_slot(file_id);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->erased || !slot->initialized) {
        return std::nullopt;
    }
    return slot->record;
}

std::shared_ptr<Tracker::Slot> Tracker::find_slot(const core::FileId& file_id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = records_.find(file_id);
    if (it == records_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Tracker::Slot> Tracker::find_or_create_slot(const core::FileId& file_id) {
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        auto it = records_.find(file_id);
        if (it != records_.end() && !it->second->erased) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    auto& slot = records_[file_id];
    if (!slot || slot->erased) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

std::vector<std::shared_ptr<Tracker::Slot>> Tracker::all_slots() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    std::vector<std::shared_ptr<Slot>> slots;
    slots.reserve(records_.size());
    for (const auto& [file_id, slot] : records_) {
        slots.push_back(slot);
    }
    return slots;
}

void Tracker::erase_slot(const core::FileId& file_id, const std::shared_ptr<Slot>& slot) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    auto it = records_.find(file_id);
    if (it != records_.end() && it->second == slot) {
        records_.erase(it);
    }
}

void Tracker::refresh_ttl(FileRecord& record, core::TimePoint now) const {
    if (record.expires_at - now < settings_.ttl_refresh_threshold) {
        record.expires_at = now + settings_.file_ttl;
        LOG_DEBUG("Refreshed TTL of {}", record.file_id);
    }
}

bool Tracker::is_reachable(const core::DeviceKey& device) const {
    return presence_ ? presence_->is_online(device) : true;
}

void Tracker::deliver(const Outbox& outbox) {
    if (!notifier_) {
        return;
    }
    for (const auto& [target, notification] : outbox) {
        LOG_DEBUG("Notify {}: {}", target.to_string(), describe(notification));
        notifier_->notify(target, notification);
    }
}

}
