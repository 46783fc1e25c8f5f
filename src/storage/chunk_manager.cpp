#include "chunkswarm/storage/chunk_manager.hpp"
#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/crypto/hash.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace chunkswarm::storage {

namespace {

std::string join_indices(const std::vector<std::uint32_t>& indices) {
    std::ostringstream oss;
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) oss << ",";
        oss << indices[i];
    }
    return oss.str();
}

}

std::vector<std::uint32_t> AssemblyReport::offending() const {
    std::vector<std::uint32_t> all;
    all.insert(all.end(), missing.begin(), missing.end());
    all.insert(all.end(), malformed.begin(), malformed.end());
    all.insert(all.end(), undecryptable.begin(), undecryptable.end());
    std::sort(all.begin(), all.end());
    all.erase(std::unique(all.begin(), all.end()), all.end());
    return all;
}

std::string AssemblyReport::summary() const {
    std::ostringstream oss;
    if (!missing.empty()) oss << "missing=[" << join_indices(missing) << "] ";
    if (!malformed.empty()) oss << "malformed=[" << join_indices(malformed) << "] ";
    if (!undecryptable.empty()) oss << "undecryptable=[" << join_indices(undecryptable) << "] ";
    if (checksum_mismatch) oss << "checksum_mismatch actual=" << actual_checksum;
    auto text = oss.str();
    if (!text.empty() && text.back() == ' ') text.pop_back();
    return text.empty() ? "ok" : text;
}

ChunkManager::ChunkManager(ChunkStore& store, std::uint32_t chunk_size)
    : store_(store), chunk_size_(chunk_size) {
}

std::uint32_t ChunkManager::chunk_count_for(std::uint64_t total_size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

std::string ChunkManager::derive_file_id(const crypto::Digest& checksum, const std::string& uploader_id) {
    std::vector<std::uint8_t> material(checksum.begin(), checksum.end());
    material.insert(material.end(), uploader_id.begin(), uploader_id.end());
    auto digest = crypto::Hasher::hash(material);
    return crypto::hash_utils::to_hex(std::span(digest.data(), 16));
}

std::uint64_t ChunkManager::expected_plaintext_size(std::uint64_t total_size, std::uint32_t chunk_index) const {
    std::uint64_t offset = static_cast<std::uint64_t>(chunk_index) * chunk_size_;
    if (offset >= total_size) {
        return 0;
    }
    return std::min<std::uint64_t>(chunk_size_, total_size - offset);
}

core::Result ChunkManager::ingest_file(const std::filesystem::path& source,
                                       const std::string& uploader_id,
                                       const crypto::FileKey& key,
                                       IngestedFile& out) {
    auto size = core::utils::FileUtils::file_size(source);
    if (!size) {
        return core::Result(core::ErrorCode::NOT_FOUND, "File not found: " + source.string());
    }
    if (*size == 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Cannot share an empty file");
    }

    crypto::Digest checksum;
    auto hash_result = crypto::Hasher::hash_file(source, checksum);
    if (!hash_result) {
        return core::Result(core::ErrorCode::STORAGE_FAILURE, hash_result.message);
    }

    out.total_size = *size;
    out.chunk_count = chunk_count_for(*size, chunk_size_);
    out.checksum = crypto::hash_utils::digest_to_hex(checksum);
    out.file_id = derive_file_id(checksum, uploader_id);

    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::STORAGE_FAILURE, "Cannot open " + source.string());
    }

    std::vector<std::uint8_t> buffer(chunk_size_);
    for (std::uint32_t index = 0; index < out.chunk_count; ++index) {
        file.read(reinterpret_cast<char*>(buffer.data()), chunk_size_);
        auto bytes_read = static_cast<size_t>(file.gcount());
        if (bytes_read != expected_plaintext_size(out.total_size, index)) {
            return core::Result(core::ErrorCode::STORAGE_FAILURE,
                                "File changed while chunking: " + source.string());
        }

        crypto::EncryptedChunk chunk;
        auto encrypt_result = cipher_.encrypt_chunk(key, out.file_id, index,
                                                    std::span(buffer.data(), bytes_read), chunk);
        if (!encrypt_result) {
            return core::Result(core::ErrorCode::STORAGE_FAILURE, encrypt_result.message);
        }

        auto put_result = store_.put_chunk(out.file_id, index, chunk);
        if (!put_result && put_result.error != core::ErrorCode::CONFLICT) {
            return put_result;
        }
    }

    crypto::wipe(std::span(buffer));
    LOG_INFO("Chunked {} into {} chunks as {}", source.filename().string(), out.chunk_count, out.file_id);
    return core::Result();
}

AssemblyReport ChunkManager::check_chunks(const std::string& file_id,
                                          std::uint32_t chunk_count,
                                          std::uint64_t total_size) const {
    AssemblyReport report;
    for (std::uint32_t index = 0; index < chunk_count; ++index) {
        auto size = store_.record_size(file_id, index);
        if (!size) {
            report.missing.push_back(index);
            continue;
        }
        auto expected = expected_plaintext_size(total_size, index);
        if (expected == 0 || *size != crypto::EncryptedChunk::HEADER_SIZE + expected) {
            report.malformed.push_back(index);
        }
    }
    return report;
}

core::Result ChunkManager::assemble_file(const std::string& file_id,
                                         std::uint32_t chunk_count,
                                         std::uint64_t total_size,
                                         const std::string& expected_checksum,
                                         const crypto::FileKey& key,
                                         const std::filesystem::path& output_path,
                                         AssemblyReport& report) {
    report = check_chunks(file_id, chunk_count, total_size);
    if (!report.ok()) {
        return core::Result(core::ErrorCode::CORRUPT, report.summary());
    }

    std::error_code ec;
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
    }

    auto partial_path = output_path;
    partial_path += ".part";

    crypto::Hasher hasher;
    auto hash_init = hasher.initialize();
    if (!hash_init) {
        return core::Result(core::ErrorCode::STORAGE_FAILURE, hash_init.message);
    }

    {
        std::ofstream out(partial_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Result(core::ErrorCode::STORAGE_FAILURE, "Cannot create " + partial_path.string());
        }

        std::vector<std::uint8_t> plaintext;
        for (std::uint32_t index = 0; index < chunk_count; ++index) {
            auto chunk = store_.get_chunk(file_id, index);
            if (!chunk || !cipher_.decrypt_chunk(key, file_id, index, *chunk, plaintext)) {
                report.undecryptable.push_back(index);
                continue;
            }
            if (!report.undecryptable.empty()) {
                // Already failed; keep going only to collect the full list.
                continue;
            }
            if (!hasher.update(plaintext)) {
                report.undecryptable.push_back(index);
                continue;
            }
            out.write(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::streamsize>(plaintext.size()));
        }
        crypto::wipe(std::span(plaintext));

        if (!report.undecryptable.empty()) {
            out.close();
            std::filesystem::remove(partial_path, ec);
            return core::Result(core::ErrorCode::CORRUPT, report.summary());
        }

        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(partial_path, ec);
            return core::Result(core::ErrorCode::STORAGE_FAILURE, "Write failed for " + partial_path.string());
        }
    }

    crypto::Digest digest;
    auto hash_final = hasher.finalize(digest);
    if (!hash_final) {
        std::filesystem::remove(partial_path, ec);
        return core::Result(core::ErrorCode::STORAGE_FAILURE, hash_final.message);
    }
    report.actual_checksum = crypto::hash_utils::digest_to_hex(digest);
    if (report.actual_checksum != expected_checksum) {
        report.checksum_mismatch = true;
        std::filesystem::remove(partial_path, ec);
        return core::Result(core::ErrorCode::CORRUPT, report.summary());
    }

    if (!core::utils::FileUtils::sync_file(partial_path)) {
        std::filesystem::remove(partial_path, ec);
        return core::Result(core::ErrorCode::STORAGE_FAILURE, "fsync failed for " + partial_path.string());
    }

    std::filesystem::rename(partial_path, output_path, ec);
    if (ec) {
        std::filesystem::remove(partial_path, ec);
        return core::Result(core::ErrorCode::STORAGE_FAILURE, "Cannot move output into place: " + output_path.string());
    }

    LOG_INFO("Assembled {} ({}) at {}", file_id, core::utils::StringUtils::format_bytes(total_size),
             output_path.string());
    return core::Result();
}

} // namespace chunkswarm::storage
