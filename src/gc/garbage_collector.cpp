#include "chunkswarm/gc/garbage_collector.hpp"
#include "chunkswarm/core/config.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/storage/database.hpp"
#include "chunkswarm/storage/file_index.hpp"
#include "chunkswarm/storage/resume_manager.hpp"
#include <set>

namespace chunkswarm::gc {

using core::ErrorCode;
using core::Result;

GcSettings GcSettings::from_config(const core::Config& config) {
    GcSettings settings;
    settings.interval = std::chrono::seconds(config.get_int64("gc.interval_seconds", 3600));
    settings.seeder_ttl = std::chrono::hours(24 * config.get_int64("gc.seeder_ttl_days", 30));
    return settings;
}

GarbageCollector::GarbageCollector(storage::ChunkStore& store, storage::Database& db, storage::FileIndex& files,
                                   storage::ResumeManager& resume, core::Clock& clock, GcSettings settings)
    : store_(store), db_(db), files_(files), resume_(resume), clock_(clock), settings_(settings) {}

void GarbageCollector::set_active_predicate(ActivePredicate predicate) {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    is_active_ = std::move(predicate);
}

GcReport GarbageCollector::sweep() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    GcReport report;
    auto cutoff = clock_.now() - settings_.seeder_ttl;

    for (const auto& record : files_.find_stale_incomplete(cutoff)) {
        if (is_active_ && is_active_(record.file_id)) {
            ++report.skipped_active;
            continue;
        }
        auto bytes = store_.stored_bytes(record.file_id);
        auto result = purge_file(record.file_id);
        if (result) {
            ++report.stale_files_removed;
            report.bytes_freed += bytes;
            LOG_INFO("GC removed stale partial file {} (last activity {})", record.file_id,
                     core::utils::TimeUtils::to_iso_string(record.last_activity_at));
        } else {
            ++report.failures;
        }
    }

    std::set<core::FileId> owned;
    for (const auto& record : files_.list()) {
        owned.insert(record.file_id);
    }
    for (const auto& state : resume_.list_resumable()) {
        owned.insert(state.file_id);
    }
    for (const auto& file_id : store_.list_files()) {
        if (owned.count(file_id) > 0 || (is_active_ && is_active_(file_id))) {
            continue;
        }
        auto bytes = store_.stored_bytes(file_id);
        auto result = store_.purge_file(file_id);
        if (result) {
            ++report.orphans_removed;
            report.bytes_freed += bytes;
            LOG_INFO("GC removed orphaned chunks of {}", file_id);
        } else {
            ++report.failures;
            LOG_WARN("GC could not remove orphan {}: {}", file_id, result.describe());
        }
    }

    report.leftovers_removed = store_.cleanup_leftovers();

    LOG_INFO("GC sweep: {} stale, {} orphaned, {} leftovers removed, {} freed, {} active skipped, {} failures",
             report.stale_files_removed, report.orphans_removed, report.leftovers_removed,
             core::utils::StringUtils::format_bytes(report.bytes_freed), report.skipped_active, report.failures);
    return report;
}

Result GarbageCollector::purge_file(const core::FileId& file_id) {
    bool indexed = files_.contains(file_id);
    bool resumable = resume_.contains(file_id);

    std::filesystem::path tombstone;
    auto moved = store_.begin_purge(file_id, tombstone);
    if (!moved) {
        LOG_ERROR("Purge of {} failed: {}", file_id, moved.describe());
        return moved;
    }
    if (!indexed && !resumable && tombstone.empty()) {
        return Result::fail(ErrorCode::NOT_FOUND, "nothing held for " + file_id);
    }

    bool committed = db_.transaction([&]() {
        return files_.remove(file_id) && resume_.remove(file_id);
    });
    if (!committed) {
        auto restored = store_.abort_purge(file_id, tombstone);
        if (!restored) {
            LOG_CRITICAL("Purge of {} rolled back but chunks could not be restored: {}", file_id, restored.describe());
        }
        return Result::fail(ErrorCode::STORAGE_FAILURE, "unable to remove " + file_id + ": " + db_.last_error());
    }

    auto finished = store_.finish_purge(tombstone);
    if (!finished) {
        LOG_WARN("Trash for {} left behind: {}", file_id, finished.describe());
    }
    LOG_INFO("Purged {} (index {}, resume state {}, chunks {})", file_id, indexed ? "yes" : "no",
             resumable ? "yes" : "no", tombstone.empty() ? "none" : "yes");
    return Result::ok();
}

}
