#pragma once

#include "chunkswarm/core/clock.hpp"
#include "chunkswarm/core/result.hpp"
#include "chunkswarm/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace chunkswarm::core { class Config; }

namespace chunkswarm::storage {
class ChunkStore;
class Database;
class FileIndex;
class ResumeManager;
}

namespace chunkswarm::gc {

struct GcSettings {
    std::chrono::seconds interval{3600};
    std::chrono::seconds seeder_ttl = std::chrono::hours(24 * 30);

    static GcSettings from_config(const core::Config& config);
};

struct GcReport {
    size_t stale_files_removed = 0;
    size_t orphans_removed = 0;
    size_t leftovers_removed = 0;
    size_t skipped_active = 0;
    size_t failures = 0;
    std::uint64_t bytes_freed = 0;

    size_t total_removed() const { return stale_files_removed + orphans_removed + leftovers_removed; }
};

// Client-side collector. Removes partially downloaded files nobody has
// touched within the seeder TTL, chunk directories with no owner and
// leftovers of interrupted purges. Every removal of a file is a cascade
// over its chunks, its FileIndex entry and its resume state.
class GarbageCollector {
public:
    using ActivePredicate = std::function<bool(const core::FileId& file_id)>;

    GarbageCollector(storage::ChunkStore& store, storage::Database& db, storage::FileIndex& files,
                     storage::ResumeManager& resume, core::Clock& clock, GcSettings settings = {});

    // Files for which this returns true are left alone by sweep().
    void set_active_predicate(ActivePredicate predicate);

    GcReport sweep();

    // Chunks go to the trash first and come back if the database half
    // fails, so the three stores never disagree. NOT_FOUND when nothing
    // was held for the file.
    core::Result purge_file(const core::FileId& file_id);

    const GcSettings& settings() const { return settings_; }

private:
    storage::ChunkStore& store_;
    storage::Database& db_;
    storage::FileIndex& files_;
    storage::ResumeManager& resume_;
    core::Clock& clock_;
    GcSettings settings_;
    ActivePredicate is_active_;

    std::mutex sweep_mutex_;
};

}
