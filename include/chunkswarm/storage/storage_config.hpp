#pragma once

#include <cstdint>
#include <filesystem>

namespace chunkswarm::core { class Config; }

namespace chunkswarm::storage {

// On-disk layout of one device: <base>/chunks and <base>/chunkswarm.db.
struct StorageConfig {
    std::filesystem::path chunks_directory;
    std::filesystem::path database_path;
    std::uint32_t chunk_size = 65536;

    StorageConfig() = default;
    explicit StorageConfig(const std::filesystem::path& base_dir);

    static StorageConfig from_config(const core::Config& config);

    // Absolute paths and a chunk size between 1 KiB and 10 MiB.
    bool validate() const;
    bool create_directories() const;
};

} // namespace chunkswarm::storage
