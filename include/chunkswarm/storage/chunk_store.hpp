#pragma once

#include "chunkswarm/core/result.hpp"
#include "chunkswarm/crypto/encryption.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace chunkswarm::storage {

// Caller-supplied content check run before commit (normally an AEAD
// authentication with the file key).
using ChunkVerifier = std::function<bool(const crypto::EncryptedChunk& chunk)>;

// Write-once store of encrypted chunks, one file per (fileId, chunkIndex):
//   <root>/<fileId[0:2]>/<fileId>/<index>.chunk
// A committed chunk is never overwritten; it must be deleted first.
class ChunkStore {
public:
    static constexpr size_t LOCK_STRIPES = 64;

    explicit ChunkStore(const std::filesystem::path& root);
    virtual ~ChunkStore() = default;

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    core::Result initialize();

    // SUCCESS when written, CONFLICT when the index is already committed,
    // CORRUPT when the record fails the format check or the verifier,
    // STORAGE_FAILURE on I/O errors (nothing is left behind).
    virtual core::Result put_chunk(const std::string& file_id,
                                   std::uint32_t chunk_index,
                                   const crypto::EncryptedChunk& chunk,
                                   const ChunkVerifier& verifier = nullptr);

    std::optional<crypto::EncryptedChunk> get_chunk(const std::string& file_id, std::uint32_t chunk_index) const;
    bool has_chunk(const std::string& file_id, std::uint32_t chunk_index) const;
    std::optional<std::uint64_t> record_size(const std::string& file_id, std::uint32_t chunk_index) const;
    std::vector<std::uint32_t> list_chunks(const std::string& file_id) const;
    core::Result delete_chunk(const std::string& file_id, std::uint32_t chunk_index);

    std::vector<std::string> list_files() const;
    std::uint64_t stored_bytes(const std::string& file_id) const;

    // Two-phase removal of a whole file: begin_purge renames the file's
    // directory into the trash in one step so readers never see a partial
    // file; finish_purge deletes it, abort_purge puts it back.
    core::Result begin_purge(const std::string& file_id, std::filesystem::path& tombstone);
    core::Result finish_purge(const std::filesystem::path& tombstone);
    core::Result abort_purge(const std::string& file_id, const std::filesystem::path& tombstone);
    core::Result purge_file(const std::string& file_id);

    // Removes trash left by interrupted purges and stray temp files.
    size_t cleanup_leftovers();

    std::filesystem::path file_directory(const std::string& file_id) const;
    std::filesystem::path chunk_path(const std::string& file_id, std::uint32_t chunk_index) const;
    const std::filesystem::path& root() const { return root_; }

    static bool is_valid_file_id(const std::string& file_id);

protected:
    // Publishes a fully written temp file under its final name. Must fail
    // with file_exists rather than replace a committed chunk.
    virtual void link_into_place(const std::filesystem::path& temp_path,
                                 const std::filesystem::path& final_path,
                                 std::error_code& ec);

private:
    std::mutex& stripe_for(const std::string& file_id, std::uint32_t chunk_index) const;
    core::Result write_and_commit(const std::filesystem::path& final_path,
                                  const std::vector<std::uint8_t>& record);

    std::filesystem::path root_;
    std::filesystem::path trash_;
    mutable std::array<std::mutex, LOCK_STRIPES> stripes_;
};

} // namespace chunkswarm::storage
