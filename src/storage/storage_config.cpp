#include "chunkswarm/storage/storage_config.hpp"
#include "chunkswarm/core/config.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"

namespace chunkswarm::storage {

namespace {
constexpr std::uint32_t MIN_CHUNK_SIZE = 1024;
constexpr std::uint32_t MAX_CHUNK_SIZE = 10 * 1024 * 1024;
}

StorageConfig::StorageConfig(const std::filesystem::path& base_dir)
    : chunks_directory(base_dir / "chunks")
    , database_path(base_dir / "chunkswarm.db") {
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    auto base = core::utils::FileUtils::expand_user(config.get_string("storage.base_dir", "./chunkswarm_data"));
    StorageConfig storage(std::filesystem::absolute(base));
    storage.chunk_size = static_cast<std::uint32_t>(config.get_int("transfer.chunk_size", 65536));
    return storage;
}

bool StorageConfig::validate() const {
    if (!chunks_directory.is_absolute() || !database_path.is_absolute()) {
        return false;
    }
    return chunk_size >= MIN_CHUNK_SIZE && chunk_size <= MAX_CHUNK_SIZE;
}

bool StorageConfig::create_directories() const {
    if (!core::utils::FileUtils::create_directories(chunks_directory)) {
        LOG_ERROR("Cannot create chunk directory {}", chunks_directory.string());
        return false;
    }
    auto db_dir = database_path.parent_path();
    return db_dir.empty() || core::utils::FileUtils::create_directories(db_dir);
}

} // namespace chunkswarm::storage
