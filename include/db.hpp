#pragma once
#include "keypass_common.hpp"

#include <sqlite3.h>

// -------- Scoped SQLite connection --------
// One per vault operation; closed on every exit path.
class DbConnection {
public:
    explicit DbConnection(const std::string& path);
    ~DbConnection();

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    bool ok() const { return db_ != nullptr; }
    sqlite3* handle() const { return db_; }

    // Runs parameterless SQL, logs the sqlite message on failure
    bool exec(const char* sql, const char* event);

    int changes() const { return sqlite3_changes(db_); }
    int extended_errcode() const { return sqlite3_extended_errcode(db_); }
    const char* errmsg() const { return sqlite3_errmsg(db_); }

private:
    sqlite3* db_ = nullptr;
};

// -------- Scoped prepared statement --------
class Statement {
public:
    Statement(DbConnection& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }

    bool bind_text(int idx, const std::string& value);
    bool bind_optional_text(int idx, const std::optional<std::string>& value);

    // SQLITE_ROW, SQLITE_DONE or an error code
    int step();

    std::string column_text(int col) const;
    long long column_int64(int col) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// -------- Schema --------
// Idempotent; run once at startup before any request is served.
VaultStatus migrate_schema(const std::string& db_path);

// -------- Master password record --------
// OK with out_hash empty when no record exists yet
VaultStatus load_master_hash(const std::string& db_path, std::string& out_hash);

// DUPLICATE_ENTRY when a record already exists
VaultStatus store_master_hash(const std::string& db_path, const std::string& hash_hex);
