#include "chunkswarm/storage/file_index.hpp"
#include "chunkswarm/storage/database.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include <sqlite3.h>

namespace chunkswarm::storage {

namespace {

constexpr const char* SELECT_COLUMNS =
    "SELECT file_id, total_size, chunk_count, checksum, uploader_id, share_scope, role, "
    "download_complete, last_activity_at, seeder_since, created_at, key_handle, local_path FROM local_files";

LocalFileRecord read_record(const Statement& stmt) {
    LocalFileRecord record;
    record.file_id = stmt.column_text(0);
    record.total_size = static_cast<std::uint64_t>(stmt.column_int64(1));
    record.chunk_count = static_cast<std::uint32_t>(stmt.column_int64(2));
    record.checksum = stmt.column_text(3);
    record.uploader_id = stmt.column_text(4);

    auto scope = stmt.column_text(5);
    if (!scope.empty()) {
        record.share_scope = core::utils::StringUtils::split(scope, '\n');
    }

    record.role = stmt.column_int64(6) == 0 ? FileRole::UPLOADER : FileRole::DOWNLOADER;
    record.download_complete = stmt.column_int64(7) != 0;
    record.last_activity_at = core::from_unix_ms(stmt.column_int64(8));
    record.seeder_since = core::from_unix_ms(stmt.column_int64(9));
    record.created_at = core::from_unix_ms(stmt.column_int64(10));
    record.key_handle = stmt.column_text(11);
    record.local_path = stmt.column_text(12);
    return record;
}

}

FileIndex::FileIndex(Database& db) : db_(db) {
}

bool FileIndex::initialize() {
    return db_.exec(R"(
        CREATE TABLE IF NOT EXISTS local_files (
            file_id TEXT PRIMARY KEY,
            total_size INTEGER NOT NULL,
            chunk_count INTEGER NOT NULL,
            checksum TEXT NOT NULL,
            uploader_id TEXT NOT NULL,
            share_scope TEXT NOT NULL DEFAULT '',
            role INTEGER NOT NULL,
            download_complete INTEGER NOT NULL DEFAULT 0,
            last_activity_at INTEGER NOT NULL,
            seeder_since INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            key_handle TEXT NOT NULL DEFAULT '',
            local_path TEXT NOT NULL DEFAULT ''
        );
        CREATE INDEX IF NOT EXISTS idx_local_files_activity ON local_files(download_complete, last_activity_at);
    )");
}

bool FileIndex::upsert(const LocalFileRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, R"(
        INSERT OR REPLACE INTO local_files
        (file_id, total_size, chunk_count, checksum, uploader_id, share_scope, role,
         download_complete, last_activity_at, seeder_since, created_at, key_handle, local_path)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    if (!stmt.ok()) {
        return false;
    }

    stmt.bind_text(1, record.file_id);
    stmt.bind_int64(2, static_cast<std::int64_t>(record.total_size));
    stmt.bind_int64(3, record.chunk_count);
    stmt.bind_text(4, record.checksum);
    stmt.bind_text(5, record.uploader_id);
    stmt.bind_text(6, core::utils::StringUtils::join(record.share_scope, "\n"));
    stmt.bind_int64(7, record.role == FileRole::UPLOADER ? 0 : 1);
    stmt.bind_int64(8, record.download_complete ? 1 : 0);
    stmt.bind_int64(9, core::to_unix_ms(record.last_activity_at));
    stmt.bind_int64(10, core::to_unix_ms(record.seeder_since));
    stmt.bind_int64(11, core::to_unix_ms(record.created_at));
    stmt.bind_text(12, record.key_handle);
    stmt.bind_text(13, record.local_path);

    if (!stmt.execute()) {
        LOG_ERROR("Failed to store local file {}: {}", record.file_id, db_.last_error());
        return false;
    }
    return true;
}

std::optional<LocalFileRecord> FileIndex::get(const std::string& file_id) const {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, (std::string(SELECT_COLUMNS) + " WHERE file_id = ?;").c_str());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bind_text(1, file_id);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_record(stmt);
}

std::vector<LocalFileRecord> FileIndex::list() const {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    std::vector<LocalFileRecord> records;
    Statement stmt(db_, (std::string(SELECT_COLUMNS) + " ORDER BY created_at;").c_str());
    while (stmt.ok() && stmt.step() == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }
    return records;
}

bool FileIndex::contains(const std::string& file_id) const {
    return get(file_id).has_value();
}

bool FileIndex::remove(const std::string& file_id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "DELETE FROM local_files WHERE file_id = ?;");
    if (!stmt.ok()) {
        return false;
    }
    stmt.bind_text(1, file_id);
    return stmt.execute();
}

bool FileIndex::touch_activity(const std::string& file_id, core::TimePoint when) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "UPDATE local_files SET last_activity_at = ? WHERE file_id = ?;");
    if (!stmt.ok()) {
        return false;
    }
    stmt.bind_int64(1, core::to_unix_ms(when));
    stmt.bind_text(2, file_id);
    return stmt.execute() && sqlite3_changes(db_.handle()) > 0;
}

bool FileIndex::mark_complete(const std::string& file_id, core::TimePoint when) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "UPDATE local_files SET download_complete = 1, last_activity_at = ? WHERE file_id = ?;");
    if (!stmt.ok()) {
        return false;
    }
    stmt.bind_int64(1, core::to_unix_ms(when));
    stmt.bind_text(2, file_id);
    return stmt.execute() && sqlite3_changes(db_.handle()) > 0;
}

std::vector<LocalFileRecord> FileIndex::find_stale_incomplete(core::TimePoint cutoff) const {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    std::vector<LocalFileRecord> records;
    Statement stmt(db_, (std::string(SELECT_COLUMNS) +
                         " WHERE download_complete = 0 AND last_activity_at < ?;").c_str());
    if (!stmt.ok()) {
        return records;
    }
    stmt.bind_int64(1, core::to_unix_ms(cutoff));
    while (stmt.step() == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }
    return records;
}

size_t FileIndex::count() const {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT COUNT(*) FROM local_files;");
    if (stmt.ok() && stmt.step() == SQLITE_ROW) {
        return static_cast<size_t>(stmt.column_int64(0));
    }
    return 0;
}

} // namespace chunkswarm::storage
