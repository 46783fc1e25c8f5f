#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkswarm::storage {

// Owns the SQLite handle shared by FileIndex and ResumeManager so that a
// cascading delete across both commits as one transaction.
class Database {
public:
    explicit Database(const std::filesystem::path& db_path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    bool open();
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool exec(const std::string& sql);

    // Runs body between BEGIN IMMEDIATE and COMMIT. Rolls back when body
    // returns false or throws; the exception is rethrown.
    bool transaction(const std::function<bool()>& body);

    std::string last_error() const;

    sqlite3* handle() const { return db_; }
    std::recursive_mutex& mutex() { return mutex_; }

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::recursive_mutex mutex_;
};

// Prepared statement guard; finalized on destruction.
class Statement {
public:
    Statement(Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }

    void bind_text(int index, const std::string& value);
    void bind_int64(int index, std::int64_t value);
    void bind_blob(int index, const std::vector<std::uint8_t>& value);

    // Returns the raw sqlite result code (SQLITE_ROW, SQLITE_DONE, ...).
    int step();
    bool execute();

    std::string column_text(int column) const;
    std::int64_t column_int64(int column) const;
    std::vector<std::uint8_t> column_blob(int column) const;

private:
    sqlite3_stmt* stmt_;
};

} // namespace chunkswarm::storage
