#include "chunkswarm/transfer/swarm_types.hpp"
#include "chunkswarm/core/config.hpp"

namespace chunkswarm::transfer {

SwarmSettings SwarmSettings::from_config(const core::Config& config) {
    SwarmSettings settings;
    settings.chunk_size = static_cast<std::uint32_t>(config.get_int64("transfer.chunk_size", 65536));
    settings.max_in_flight_per_peer = static_cast<std::uint32_t>(config.get_int("transfer.max_in_flight_per_peer", 5));
    settings.drain_timeout = std::chrono::milliseconds(config.get_int64("transfer.drain_timeout_ms", 5000));
    settings.request_timeout = std::chrono::milliseconds(config.get_int64("transfer.request_timeout_ms", 30000));
    settings.max_storage_retries = static_cast<std::uint32_t>(config.get_int("transfer.max_storage_retries", 3));
    settings.max_concurrent_uploads = static_cast<std::uint32_t>(config.get_int("transfer.max_concurrent_uploads", 4));
    settings.max_queued_per_peer = static_cast<std::uint32_t>(config.get_int("transfer.max_queued_per_peer", 32));
    settings.connect_timeout = std::chrono::milliseconds(config.get_int64("transfer.connect_timeout_ms", 15000));
    settings.no_seeder_timeout = std::chrono::seconds(config.get_int64("transfer.no_seeder_timeout_seconds", 600));
    settings.rediscovery_interval = std::chrono::seconds(config.get_int64("transfer.rediscovery_interval_seconds", 30));
    settings.activity_report_interval = std::chrono::seconds(config.get_int64("transfer.activity_report_interval_seconds", 60));

    if (settings.max_in_flight_per_peer == 0) settings.max_in_flight_per_peer = 1;
    if (settings.max_concurrent_uploads == 0) settings.max_concurrent_uploads = 1;
    return settings;
}

std::string_view to_string(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::RUNNING: return "running";
        case TaskOutcome::PAUSED: return "paused";
        case TaskOutcome::CANCELLED: return "cancelled";
        case TaskOutcome::COMPLETE: return "complete";
        case TaskOutcome::FAILED: return "failed";
    }
    return "unknown";
}

} // namespace chunkswarm::transfer
