#pragma once

#include "chunkswarm/core/result.hpp"
#include "chunkswarm/crypto/crypto_types.hpp"
#include "chunkswarm/crypto/encryption.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkswarm::storage {

class ChunkStore;

struct IngestedFile {
    std::string file_id;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_count = 0;
    std::string checksum;
};

// Result of checking or reassembling a file. Lists every offending index
// rather than stopping at the first.
struct AssemblyReport {
    std::vector<std::uint32_t> missing;
    std::vector<std::uint32_t> malformed;
    std::vector<std::uint32_t> undecryptable;
    bool checksum_mismatch = false;
    std::string actual_checksum;

    bool ok() const {
        return missing.empty() && malformed.empty() && undecryptable.empty() && !checksum_mismatch;
    }
    std::vector<std::uint32_t> offending() const;
    std::string summary() const;
};

// Splits plaintext files into encrypted chunks and reassembles them.
class ChunkManager {
public:
    static constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 65536; // 64KB

    explicit ChunkManager(ChunkStore& store, std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    static std::uint32_t chunk_count_for(std::uint64_t total_size, std::uint32_t chunk_size);
    // fileId derived from content checksum and uploader.
    static std::string derive_file_id(const crypto::Digest& checksum, const std::string& uploader_id);

    std::uint64_t expected_plaintext_size(std::uint64_t total_size, std::uint32_t chunk_index) const;
    std::uint32_t chunk_size() const { return chunk_size_; }

    core::Result ingest_file(const std::filesystem::path& source,
                             const std::string& uploader_id,
                             const crypto::FileKey& key,
                             IngestedFile& out);

    // Presence and size check of every index in [0, chunk_count).
    AssemblyReport check_chunks(const std::string& file_id,
                                std::uint32_t chunk_count,
                                std::uint64_t total_size) const;

    // Decrypts all chunks into output_path and verifies the whole-file
    // checksum. Output appears at output_path only on success.
    core::Result assemble_file(const std::string& file_id,
                               std::uint32_t chunk_count,
                               std::uint64_t total_size,
                               const std::string& expected_checksum,
                               const crypto::FileKey& key,
                               const std::filesystem::path& output_path,
                               AssemblyReport& report);

private:
    ChunkStore& store_;
    std::uint32_t chunk_size_;
    crypto::ChunkCipher cipher_;
};

} // namespace chunkswarm::storage
