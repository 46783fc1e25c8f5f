#include "chunkswarm/storage/resume_manager.hpp"
#include "chunkswarm/storage/database.hpp"
#include "chunkswarm/core/logger.hpp"
#include <sqlite3.h>

namespace chunkswarm::storage {

namespace {

constexpr const char* SELECT_COLUMNS =
    "SELECT file_id, chunk_count, completed, phase, paused, key_handle, total_size, checksum, "
    "uploader_id, output_path, updated_at FROM resume_state";

std::optional<ResumeState> read_state(const Statement& stmt) {
    ResumeState state;
    state.file_id = stmt.column_text(0);
    state.chunk_count = static_cast<std::uint32_t>(stmt.column_int64(1));

    auto bitmap = core::ChunkBitmap::from_bytes(state.chunk_count, stmt.column_blob(2));
    if (!bitmap) {
        LOG_WARN("Discarding unreadable resume bitmap for {}", state.file_id);
        return std::nullopt;
    }
    state.completed = std::move(*bitmap);

    auto phase = core::parse_task_phase(stmt.column_text(3));
    if (!phase) {
        LOG_WARN("Unknown persisted phase for {}", state.file_id);
        return std::nullopt;
    }
    state.phase = *phase;
    state.paused = stmt.column_int64(4) != 0;
    state.key_handle = stmt.column_text(5);
    state.total_size = static_cast<std::uint64_t>(stmt.column_int64(6));
    state.checksum = stmt.column_text(7);
    state.uploader_id = stmt.column_text(8);
    state.output_path = stmt.column_text(9);
    state.updated_at = core::from_unix_ms(stmt.column_int64(10));
    return state;
}

}

ResumeManager::ResumeManager(Database& db) : db_(db) {
}

bool ResumeManager::initialize() {
    return db_.exec(R"(
        CREATE TABLE IF NOT EXISTS resume_state (
            file_id TEXT PRIMARY KEY,
            chunk_count INTEGER NOT NULL,
            completed BLOB NOT NULL,
            phase TEXT NOT NULL,
            paused INTEGER NOT NULL DEFAULT 0,
            key_handle TEXT NOT NULL DEFAULT '',
            total_size INTEGER NOT NULL DEFAULT 0,
            checksum TEXT NOT NULL DEFAULT '',
            uploader_id TEXT NOT NULL DEFAULT '',
            output_path TEXT NOT NULL DEFAULT '',
            updated_at INTEGER NOT NULL
        );
    )");
}

bool ResumeManager::save(const ResumeState& state) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, R"(
        INSERT OR REPLACE INTO resume_state
        (file_id, chunk_count, completed, phase, paused, key_handle, total_size, checksum,
         uploader_id, output_path, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    if (!stmt.ok()) {
        return false;
    }

    stmt.bind_text(1, state.file_id);
    stmt.bind_int64(2, state.chunk_count);
    stmt.bind_blob(3, state.completed.bytes());
    stmt.bind_text(4, std::string(core::to_string(state.phase)));
    stmt.bind_int64(5, state.paused ? 1 : 0);
    stmt.bind_text(6, state.key_handle);
    stmt.bind_int64(7, static_cast<std::int64_t>(state.total_size));
    stmt.bind_text(8, state.checksum);
    stmt.bind_text(9, state.uploader_id);
    stmt.bind_text(10, state.output_path);
    stmt.bind_int64(11, core::to_unix_ms(state.updated_at));

    if (!stmt.execute()) {
        LOG_ERROR("Failed to persist resume state for {}: {}", state.file_id, db_.last_error());
        return false;
    }
    return true;
}

std::optional<ResumeState> ResumeManager::load(const std::string& file_id) const {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, (std::string(SELECT_COLUMNS) + " WHERE file_id = ?;").c_str());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bind_text(1, file_id);
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_state(stmt);
}

std::vector<ResumeState> ResumeManager::list_resumable() const {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    std::vector<ResumeState> states;
    Statement stmt(db_, (std::string(SELECT_COLUMNS) + " ORDER BY updated_at;").c_str());
    while (stmt.ok() && stmt.step() == SQLITE_ROW) {
        auto state = read_state(stmt);
        if (state && !core::is_terminal(state->phase)) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

bool ResumeManager::remove(const std::string& file_id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "DELETE FROM resume_state WHERE file_id = ?;");
    if (!stmt.ok()) {
        return false;
    }
    stmt.bind_text(1, file_id);
    return stmt.execute();
}

bool ResumeManager::contains(const std::string& file_id) const {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT 1 FROM resume_state WHERE file_id = ?;");
    if (!stmt.ok()) {
        return false;
    }
    stmt.bind_text(1, file_id);
    return stmt.step() == SQLITE_ROW;
}

} // namespace chunkswarm::storage
