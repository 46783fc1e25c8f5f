#pragma once

#include "chunkswarm/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkswarm::core { class Config; }

namespace chunkswarm::transfer {

// What a downloader is handed out of band together with the file key.
struct FileDescriptor {
    core::FileId file_id;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_count = 0;
    std::string checksum;
    core::UserId uploader_id;
    std::string key_handle;
    // Users besides the uploader this device may serve chunks to.
    std::vector<core::UserId> share_scope;
};

struct SwarmSettings {
    std::uint32_t chunk_size = 65536;
    std::uint32_t max_in_flight_per_peer = 5;
    std::chrono::milliseconds drain_timeout{5000};
    std::chrono::milliseconds request_timeout{30000};
    std::uint32_t max_storage_retries = 3;
    std::uint32_t max_concurrent_uploads = 4;
    std::uint32_t max_queued_per_peer = 32;
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::seconds no_seeder_timeout{600};
    std::chrono::seconds rediscovery_interval{30};
    std::chrono::seconds activity_report_interval{60};
    // Upper bound on how long a task blocks waiting for events.
    std::chrono::milliseconds tick{100};

    static SwarmSettings from_config(const core::Config& config);
};

enum class TaskOutcome {
    RUNNING,
    PAUSED,
    CANCELLED,
    COMPLETE,
    FAILED
};

std::string_view to_string(TaskOutcome outcome);

struct DownloadProgress {
    core::FileId file_id;
    core::TaskPhase phase = core::TaskPhase::DOWNLOADING;
    TaskOutcome outcome = TaskOutcome::RUNNING;
    std::uint32_t completed_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes_completed = 0;
    std::uint64_t total_bytes = 0;
    size_t in_flight = 0;
    size_t known_peers = 0;
    std::vector<std::uint32_t> missing;
    std::string error;

    double percentage() const {
        return total_chunks == 0 ? 0.0 : 100.0 * completed_chunks / total_chunks;
    }
};

} // namespace chunkswarm::transfer
