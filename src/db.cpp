#include "db.hpp"
#include "logging.hpp"

// -------- Schema --------
static const char* const SCHEMA_SQL[] = {
    "CREATE TABLE IF NOT EXISTS passwords ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " title TEXT NOT NULL,"
    " username TEXT NOT NULL,"
    " url TEXT NOT NULL,"
    " password TEXT NOT NULL,"
    " UNIQUE (title, username)"
    ")",

    // single row, written once
    "CREATE TABLE IF NOT EXISTS master_password ("
    " id INTEGER PRIMARY KEY CHECK (id = 1),"
    " hash TEXT NOT NULL"
    ")",

    "CREATE TRIGGER IF NOT EXISTS master_password_no_update"
    " BEFORE UPDATE ON master_password"
    " BEGIN SELECT RAISE(ABORT, 'master password is immutable'); END",

    "CREATE TRIGGER IF NOT EXISTS master_password_no_delete"
    " BEFORE DELETE ON master_password"
    " BEGIN SELECT RAISE(ABORT, 'master password is immutable'); END",
};


// -------- DbConnection --------
DbConnection::DbConnection(const std::string& path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        log_event(LogLevel::ERROR,
            std::string("sqlite3_open_v2 failed: ") + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)),
            "db_module",
            "failure");
        sqlite3_close(db);
        return;
    }
    sqlite3_busy_timeout(db, DB_BUSY_TIMEOUT_MS);
    db_ = db;
}

DbConnection::~DbConnection() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool DbConnection::exec(const char* sql, const char* event) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        log_event(LogLevel::ERROR,
            std::string("sqlite3_exec failed: ") + (err ? err : "unknown"),
            event,
            "failure");
        sqlite3_free(err);
        return false;
    }
    return true;
}


// -------- Statement --------
Statement::Statement(DbConnection& db, const char* sql) {
    if (!db.ok()) return;
    if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        log_event(LogLevel::ERROR,
            std::string("sqlite3_prepare_v2 failed: ") + db.errmsg(),
            "db_module",
            "failure");
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

bool Statement::bind_text(int idx, const std::string& value) {
    return sqlite3_bind_text(stmt_, idx, value.data(),
        static_cast<int>(value.size()), SQLITE_TRANSIENT) == SQLITE_OK;
}

bool Statement::bind_optional_text(int idx, const std::optional<std::string>& value) {
    if (!value) {
        return sqlite3_bind_null(stmt_, idx) == SQLITE_OK;
    }
    return bind_text(idx, *value);
}

int Statement::step() {
    return sqlite3_step(stmt_);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return std::string();
    int len = sqlite3_column_bytes(stmt_, col);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

long long Statement::column_int64(int col) const {
    return static_cast<long long>(sqlite3_column_int64(stmt_, col));
}


// -------- Schema migration --------
VaultStatus migrate_schema(const std::string& db_path) {
    DbConnection db(db_path);
    if (!db.ok()) {
        return VaultStatus::STORAGE_ERROR;
    }
    if (!db.exec("BEGIN IMMEDIATE", "db_migrate")) {
        return VaultStatus::STORAGE_ERROR;
    }
    for (const char* sql : SCHEMA_SQL) {
        if (!db.exec(sql, "db_migrate")) {
            (void)db.exec("ROLLBACK", "db_migrate");
            return VaultStatus::STORAGE_ERROR;
        }
    }
    if (!db.exec("COMMIT", "db_migrate")) {
        (void)db.exec("ROLLBACK", "db_migrate");
        return VaultStatus::STORAGE_ERROR;
    }
    // database file holds ciphertexts and the master hash: owner only
    if (chmod(db_path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        log_event(LogLevel::WARN,
            "migrate_schema: chmod on database failed",
            "db_migrate",
            "failure");
    }

    log_event(LogLevel::INFO,
        "Schema ready",
        "db_migrate",
        "success");
    return VaultStatus::OK;
}


// -------- Master password record --------
VaultStatus load_master_hash(const std::string& db_path, std::string& out_hash) {
    out_hash.clear();
    DbConnection db(db_path);
    Statement stmt(db, "SELECT hash FROM master_password WHERE id = 1");
    if (!stmt.ok()) {
        return VaultStatus::STORAGE_ERROR;
    }

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        out_hash = stmt.column_text(0);
        return VaultStatus::OK;
    }
    if (rc == SQLITE_DONE) {
        return VaultStatus::OK;
    }
    log_event(LogLevel::ERROR,
        std::string("load_master_hash: step failed: ") + db.errmsg(),
        "db_module",
        "failure");
    return VaultStatus::STORAGE_ERROR;
}

VaultStatus store_master_hash(const std::string& db_path, const std::string& hash_hex) {
    DbConnection db(db_path);
    Statement stmt(db, "INSERT INTO master_password (id, hash) VALUES (1, ?1)");
    if (!stmt.ok() || !stmt.bind_text(1, hash_hex)) {
        return VaultStatus::STORAGE_ERROR;
    }

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return VaultStatus::OK;
    }
    if (db.extended_errcode() == SQLITE_CONSTRAINT_PRIMARYKEY) {
        log_event(LogLevel::ALERT,
            "Attempt to overwrite master password record",
            "db_module",
            "failure");
        return VaultStatus::DUPLICATE_ENTRY;
    }
    log_event(LogLevel::ERROR,
        std::string("store_master_hash: step failed: ") + db.errmsg(),
        "db_module",
        "failure");
    return VaultStatus::STORAGE_ERROR;
}
