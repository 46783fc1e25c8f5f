#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include "chunkswarm/crypto/random.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <fstream>

namespace chunkswarm::storage {

namespace {

constexpr const char* CHUNK_SUFFIX = ".chunk";
constexpr const char* TEMP_SUFFIX = ".tmp";

std::string chunk_file_name(std::uint32_t chunk_index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%06u%s", chunk_index, CHUNK_SUFFIX);
    return buffer;
}

std::optional<std::uint32_t> parse_chunk_file_name(const std::string& name) {
    auto suffix_len = std::char_traits<char>::length(CHUNK_SUFFIX);
    if (name.size() <= suffix_len || name.compare(name.size() - suffix_len, suffix_len, CHUNK_SUFFIX) != 0) {
        return std::nullopt;
    }
    std::uint32_t index = 0;
    auto digits_end = name.data() + name.size() - suffix_len;
    auto [ptr, ec] = std::from_chars(name.data(), digits_end, index);
    if (ec != std::errc() || ptr != digits_end) {
        return std::nullopt;
    }
    return index;
}

std::optional<std::vector<std::uint8_t>> read_all(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return data;
}

}

ChunkStore::ChunkStore(const std::filesystem::path& root)
    : root_(root), trash_(root / ".trash") {
}

core::Result ChunkStore::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(trash_, ec);
    if (ec) {
        return core::Result(core::ErrorCode::STORAGE_FAILURE,
                            "Cannot create chunk store at " + root_.string() + ": " + ec.message());
    }
    auto removed = cleanup_leftovers();
    if (removed > 0) {
        LOG_INFO("Chunk store removed {} leftover entries", removed);
    }
    return core::Result();
}

bool ChunkStore::is_valid_file_id(const std::string& file_id) {
    if (file_id.size() < 2 || file_id.size() > 128) {
        return false;
    }
    return std::all_of(file_id.begin(), file_id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
    });
}

std::filesystem::path ChunkStore::file_directory(const std::string& file_id) const {
    return root_ / file_id.substr(0, 2) / file_id;
}

std::filesystem::path ChunkStore::chunk_path(const std::string& file_id, std::uint32_t chunk_index) const {
    return file_directory(file_id) / chunk_file_name(chunk_index);
}

std::mutex& ChunkStore::stripe_for(const std::string& file_id, std::uint32_t chunk_index) const {
    auto h = std::hash<std::string>{}(file_id) ^ (static_cast<size_t>(chunk_index) * 0x9e3779b97f4a7c15ULL);
    return stripes_[h % LOCK_STRIPES];
}

core::Result ChunkStore::put_chunk(const std::string& file_id,
                                   std::uint32_t chunk_index,
                                   const crypto::EncryptedChunk& chunk,
                                   const ChunkVerifier& verifier) {
    if (!is_valid_file_id(file_id)) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid file id: " + file_id);
    }

    if (chunk.ciphertext.empty()) {
        return core::Result(core::ErrorCode::CORRUPT,
                            "Chunk " + std::to_string(chunk_index) + " has no ciphertext");
    }

    if (verifier && !verifier(chunk)) {
        return core::Result(core::ErrorCode::CORRUPT,
                            "Chunk " + std::to_string(chunk_index) + " failed verification");
    }

    std::lock_guard<std::mutex> lock(stripe_for(file_id, chunk_index));

    auto final_path = chunk_path(file_id, chunk_index);
    std::error_code ec;
    if (std::filesystem::exists(final_path, ec)) {
        return core::Result(core::ErrorCode::CONFLICT,
                            "Chunk " + std::to_string(chunk_index) + " already stored");
    }

    return write_and_commit(final_path, chunk.serialize());
}

core::Result ChunkStore::write_and_commit(const std::filesystem::path& final_path,
                                          const std::vector<std::uint8_t>& record) {
    std::error_code ec;
    std::filesystem::create_directories(final_path.parent_path(), ec);
    if (ec) {
        return core::Result(core::ErrorCode::STORAGE_FAILURE,
                            "Cannot create chunk directory: " + ec.message());
    }

    auto temp_path = final_path;
    temp_path += "." + crypto::SecureRandom::generate_id(6) + TEMP_SUFFIX;

    auto discard_temp = [&temp_path]() {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
    };

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return core::Result(core::ErrorCode::STORAGE_FAILURE, "Cannot open " + temp_path.string());
        }
        file.write(reinterpret_cast<const char*>(record.data()), static_cast<std::streamsize>(record.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            discard_temp();
            return core::Result(core::ErrorCode::STORAGE_FAILURE, "Short write to " + temp_path.string());
        }
    }

    if (!core::utils::FileUtils::sync_file(temp_path)) {
        discard_temp();
        return core::Result(core::ErrorCode::STORAGE_FAILURE, "fsync failed for " + temp_path.string());
    }

    auto readback = read_all(temp_path);
    if (!readback || *readback != record) {
        discard_temp();
        return core::Result(core::ErrorCode::STORAGE_FAILURE, "Read-back mismatch for " + temp_path.string());
    }

    // Hard link fails if the target exists, which keeps commits write-once
    // even against another process sharing the directory. There is no
    // fallback: rename would replace an existing chunk.
    link_into_place(temp_path, final_path, ec);
    discard_temp();
    if (ec == std::errc::file_exists) {
        return core::Result(core::ErrorCode::CONFLICT, "Chunk already stored: " + final_path.string());
    }
    if (ec) {
        LOG_ERROR("Cannot commit {}: {}", final_path.string(), ec.message());
        return core::Result(core::ErrorCode::STORAGE_FAILURE,
                            "Cannot commit " + final_path.string() + ": " + ec.message());
    }
    return core::Result();
}

void ChunkStore::link_into_place(const std::filesystem::path& temp_path, const std::filesystem::path& final_path,
                                 std::error_code& ec) {
    std::filesystem::create_hard_link(temp_path, final_path, ec);
}

std::optional<crypto::EncryptedChunk> ChunkStore::get_chunk(const std::string& file_id,
                                                            std::uint32_t chunk_index) const {
    if (!is_valid_file_id(file_id)) {
        return std::nullopt;
    }
    auto record = read_all(chunk_path(file_id, chunk_index));
    if (!record) {
        return std::nullopt;
    }
    return crypto::EncryptedChunk::parse(*record);
}

bool ChunkStore::has_chunk(const std::string& file_id, std::uint32_t chunk_index) const {
    if (!is_valid_file_id(file_id)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(chunk_path(file_id, chunk_index), ec);
}

std::optional<std::uint64_t> ChunkStore::record_size(const std::string& file_id, std::uint32_t chunk_index) const {
    if (!is_valid_file_id(file_id)) {
        return std::nullopt;
    }
    return core::utils::FileUtils::file_size(chunk_path(file_id, chunk_index));
}

std::vector<std::uint32_t> ChunkStore::list_chunks(const std::string& file_id) const {
    std::vector<std::uint32_t> indices;
    if (!is_valid_file_id(file_id)) {
        return indices;
    }

    std::error_code ec;
    for (std::filesystem::directory_iterator it(file_directory(file_id), ec), end; !ec && it != end; it.increment(ec)) {
        if (auto index = parse_chunk_file_name(it->path().filename().string())) {
            indices.push_back(*index);
        }
    }
    std::sort(indices.begin(), indices.end());
    return indices;
}

core::Result ChunkStore::delete_chunk(const std::string& file_id, std::uint32_t chunk_index) {
    if (!is_valid_file_id(file_id)) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid file id: " + file_id);
    }

    std::lock_guard<std::mutex> lock(stripe_for(file_id, chunk_index));
    std::error_code ec;
    if (!std::filesystem::remove(chunk_path(file_id, chunk_index), ec)) {
        if (ec) {
            return core::Result(core::ErrorCode::STORAGE_FAILURE, ec.message());
        }
        return core::Result(core::ErrorCode::NOT_FOUND,
                            "Chunk " + std::to_string(chunk_index) + " not stored");
    }
    return core::Result();
}

std::vector<std::string> ChunkStore::list_files() const {
    std::vector<std::string> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator shard(root_, ec), end; !ec && shard != end; shard.increment(ec)) {
        if (!shard->is_directory() || shard->path() == trash_) {
            continue;
        }
        std::error_code inner_ec;
        for (std::filesystem::directory_iterator it(shard->path(), inner_ec);
             !inner_ec && it != std::filesystem::directory_iterator(); it.increment(inner_ec)) {
            auto name = it->path().filename().string();
            if (it->is_directory() && is_valid_file_id(name)) {
                files.push_back(name);
            }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::uint64_t ChunkStore::stored_bytes(const std::string& file_id) const {
    std::uint64_t total = 0;
    for (auto index : list_chunks(file_id)) {
        total += record_size(file_id, index).value_or(0);
    }
    return total;
}

core::Result ChunkStore::begin_purge(const std::string& file_id, std::filesystem::path& tombstone) {
    if (!is_valid_file_id(file_id)) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid file id: " + file_id);
    }

    auto directory = file_directory(file_id);
    std::error_code ec;
    if (!std::filesystem::exists(directory, ec)) {
        tombstone.clear();
        return core::Result();
    }

    std::filesystem::create_directories(trash_, ec);
    tombstone = trash_ / (file_id + "." + crypto::SecureRandom::generate_id(6));
    std::filesystem::rename(directory, tombstone, ec);
    if (ec) {
        tombstone.clear();
        return core::Result(core::ErrorCode::STORAGE_FAILURE,
                            "Cannot move " + directory.string() + " to trash: " + ec.message());
    }
    return core::Result();
}

core::Result ChunkStore::finish_purge(const std::filesystem::path& tombstone) {
    if (tombstone.empty()) {
        return core::Result();
    }
    std::error_code ec;
    std::filesystem::remove_all(tombstone, ec);
    if (ec) {
        // Left for cleanup_leftovers(); the chunks are already invisible.
        LOG_WARN("Failed to remove {}: {}", tombstone.string(), ec.message());
    }
    return core::Result();
}

core::Result ChunkStore::abort_purge(const std::string& file_id, const std::filesystem::path& tombstone) {
    if (tombstone.empty()) {
        return core::Result();
    }
    std::error_code ec;
    std::filesystem::rename(tombstone, file_directory(file_id), ec);
    if (ec) {
        return core::Result(core::ErrorCode::STORAGE_FAILURE,
                            "Cannot restore " + file_id + " from trash: " + ec.message());
    }
    return core::Result();
}

core::Result ChunkStore::purge_file(const std::string& file_id) {
    std::filesystem::path tombstone;
    auto result = begin_purge(file_id, tombstone);
    if (!result) {
        return result;
    }
    return finish_purge(tombstone);
}

size_t ChunkStore::cleanup_leftovers() {
    std::vector<std::filesystem::path> leftovers;
    std::error_code ec;

    for (std::filesystem::directory_iterator it(trash_, ec), end; !ec && it != end; it.increment(ec)) {
        leftovers.push_back(it->path());
    }

    for (std::filesystem::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().parent_path() == trash_) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file() && it->path().extension() == TEMP_SUFFIX) {
            leftovers.push_back(it->path());
        }
    }

    size_t removed = 0;
    for (const auto& path : leftovers) {
        std::error_code remove_ec;
        if (std::filesystem::remove_all(path, remove_ec) > 0 && !remove_ec) {
            ++removed;
        }
    }
    return removed;
}

} // namespace chunkswarm::storage
