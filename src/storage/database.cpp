#include "chunkswarm/storage/database.hpp"
#include "chunkswarm/core/logger.hpp"
#include <sqlite3.h>

namespace chunkswarm::storage {

Database::Database(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

Database::~Database() {
    close();
}

bool Database::open() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    auto db_dir = db_path_.parent_path();
    if (!db_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(db_dir, ec);
        if (ec) {
            LOG_ERROR("Failed to create database directory {}: {}", db_dir.string(), ec.message());
            return false;
        }
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    if (!exec("PRAGMA journal_mode=WAL;") || !exec("PRAGMA foreign_keys=ON;")) {
        close();
        return false;
    }

    LOG_DEBUG("Database opened: {}", db_path_.string());
    return true;
}

void Database::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool Database::transaction(const std::function<bool()>& body) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!exec("BEGIN IMMEDIATE;")) {
        return false;
    }

    bool committed = false;
    try {
        if (body()) {
            committed = exec("COMMIT;");
        }
    } catch (...) {
        exec("ROLLBACK;");
        throw;
    }

    if (!committed) {
        exec("ROLLBACK;");
    }
    return committed;
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

Statement::Statement(Database& db, const char* sql) : stmt_(nullptr) {
    if (!db.handle()) {
        return;
    }
    if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: {}", db.last_error());
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::bind_text(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind_int64(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
}

void Statement::bind_blob(int index, const std::vector<std::uint8_t>& value) {
    // A null pointer would bind NULL rather than an empty blob.
    if (value.empty()) {
        sqlite3_bind_zeroblob(stmt_, index, 0);
        return;
    }
    sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

int Statement::step() {
    return stmt_ ? sqlite3_step(stmt_) : SQLITE_MISUSE;
}

bool Statement::execute() {
    return step() == SQLITE_DONE;
}

std::string Statement::column_text(int column) const {
    auto text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::int64_t Statement::column_int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::vector<std::uint8_t> Statement::column_blob(int column) const {
    auto data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, column));
    int size = sqlite3_column_bytes(stmt_, column);
    if (!data || size <= 0) {
        return {};
    }
    return std::vector<std::uint8_t>(data, data + size);
}

} // namespace chunkswarm::storage
