#pragma once

#include "chunkswarm/core/chunk_bitmap.hpp"
#include "chunkswarm/core/clock.hpp"
#include "chunkswarm/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkswarm::storage {

class Database;

// Persisted DownloadTask progress, keyed by fileId.
struct ResumeState {
    std::string file_id;
    std::uint32_t chunk_count = 0;
    core::ChunkBitmap completed;
    core::TaskPhase phase = core::TaskPhase::DOWNLOADING;
    bool paused = false;
    std::string key_handle;
    std::uint64_t total_size = 0;
    std::string checksum;
    std::string uploader_id;
    std::string output_path;
    core::TimePoint updated_at{};
};

class ResumeManager {
public:
    explicit ResumeManager(Database& db);

    bool initialize();

    bool save(const ResumeState& state);
    std::optional<ResumeState> load(const std::string& file_id) const;
    std::vector<ResumeState> list_resumable() const;
    bool remove(const std::string& file_id);
    bool contains(const std::string& file_id) const;

private:
    Database& db_;
};

} // namespace chunkswarm::storage
