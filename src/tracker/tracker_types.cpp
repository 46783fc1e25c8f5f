#include "chunkswarm/tracker/tracker_types.hpp"
#include "chunkswarm/core/config.hpp"

namespace chunkswarm::tracker {

FileRecordSummary FileRecordSummary::from_record(const FileRecord& record) {
    FileRecordSummary summary;
    summary.file_id = record.file_id;
    summary.total_size = record.total_size;
    summary.chunk_count = record.chunk_count;
    summary.checksum = record.checksum;
    summary.uploader_id = record.uploader_id;
    summary.seeder_count = static_cast<std::uint32_t>(record.seeders.size());
    for (const auto& [device, seeder] : record.seeders) {
        if (seeder.download_complete) {
            ++summary.complete_seeder_count;
        }
    }
    summary.leecher_count = static_cast<std::uint32_t>(record.leechers.size());
    summary.expires_at = record.expires_at;
    return summary;
}

std::string describe(const TrackerNotification& notification) {
    if (auto* online = std::get_if<UploaderOnline>(&notification)) {
        return "uploaderOnline(" + online->file_id + ", " + online->uploader.to_string() + ")";
    }
    if (auto* deleted = std::get_if<ShareDeleted>(&notification)) {
        return "shareDeleted(" + deleted->file_id + ", " + deleted->reason + ")";
    }
    if (auto* removed = std::get_if<SeederRemoved>(&notification)) {
        return "seederRemoved(" + removed->file_id + ", " + removed->reason + ")";
    }
    const auto& changed = std::get<ShareScopeChanged>(notification);
    return "shareScopeChanged(" + changed.file_id + ", " + std::to_string(changed.share_scope.size()) + " users)";
}

TrackerSettings TrackerSettings::from_config(const core::Config& config) {
    TrackerSettings settings;
    settings.file_ttl = std::chrono::hours(24 * config.get_int64("tracker.file_ttl_days", 30));
    settings.ttl_refresh_threshold = std::chrono::hours(24 * config.get_int64("tracker.ttl_refresh_threshold_days", 3));
    settings.seeder_ttl = std::chrono::hours(24 * config.get_int64("tracker.seeder_ttl_days", 30));
    settings.delete_grace = std::chrono::seconds(config.get_int64("tracker.delete_grace_seconds", 300));
    settings.sweep_interval = std::chrono::seconds(config.get_int64("tracker.sweep_interval_seconds", 3600));
    settings.port = static_cast<std::uint16_t>(config.get_int("tracker.port", 7420));
    return settings;
}

}
