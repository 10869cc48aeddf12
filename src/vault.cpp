#include "vault.hpp"
#include "db.hpp"
#include "logging.hpp"
#include "password_generator.hpp"
#include "util.hpp"

// -------- Helpers --------
static bool valid_key_pair(const std::string& title, const std::string& username, const char* event) {
    if (!valid_title_or_username(title) || !valid_title_or_username(username)
        || username.size() > MAX_USER_LEN) {
        log_event(LogLevel::WARN,
            "Invalid title or username",
            event,
            "failure");
        return false;
    }
    return true;
}

// Resolves the plaintext to store: generator output wins over a supplied value
static VaultStatus resolve_password(const std::optional<std::string>& supplied, bool generate,
    std::optional<std::string>& out, const char* event)
{
    out.reset();
    if (generate) {
        std::string pw;
        VaultStatus st = generate_password(pw);
        if (st != VaultStatus::OK) return st;
        out = std::move(pw);
        return VaultStatus::OK;
    }
    if (supplied) {
        if (!valid_password(*supplied)) {
            log_event(LogLevel::WARN,
                "Invalid password",
                event,
                "failure");
            return VaultStatus::INVALID_ARGUMENT;
        }
        out = supplied;
    }
    return VaultStatus::OK;
}

static VaultStatus decrypt_row(const VaultContext& ctx, Statement& stmt, CredentialRecord& rec) {
    rec.id = stmt.column_int64(0);
    rec.title = stmt.column_text(1);
    rec.username = stmt.column_text(2);
    rec.url = stmt.column_text(3);
    return ctx.cipher.decrypt(stmt.column_text(4), rec.password);
}

static void wipe_records(std::vector<CredentialRecord>& v) {
    for (auto& r : v) {
        wipe_string(r.password);
    }
    v.clear();
}


// -------- create --------
VaultStatus vault_create(VaultContext& ctx, const CredentialEntry& entry, CredentialRecord& out) {
    if (!valid_key_pair(entry.title, entry.username, "create_cred")) {
        return VaultStatus::INVALID_ARGUMENT;
    }
    std::string url = entry.url.empty() ? DEFAULT_URL : entry.url;
    if (!valid_url(url)) {
        return VaultStatus::INVALID_ARGUMENT;
    }

    std::optional<std::string> plain;
    VaultStatus st = resolve_password(entry.password, entry.generate, plain, "create_cred");
    if (st != VaultStatus::OK) return st;
    if (!plain) {
        log_event(LogLevel::WARN,
            "Create without password or generate flag",
            "create_cred",
            "failure");
        return VaultStatus::INVALID_ARGUMENT;
    }

    std::string ct;
    st = ctx.cipher.encrypt(*plain, ct);
    if (st != VaultStatus::OK) {
        wipe_string(*plain);
        return st;
    }

    DbConnection db(ctx.db_path);
    Statement stmt(db,
        "INSERT INTO passwords (title, username, url, password) VALUES (?1, ?2, ?3, ?4)");
    if (!stmt.ok()
        || !stmt.bind_text(1, entry.title)
        || !stmt.bind_text(2, entry.username)
        || !stmt.bind_text(3, url)
        || !stmt.bind_text(4, ct)) {
        wipe_string(*plain);
        return VaultStatus::STORAGE_ERROR;
    }

    // the UNIQUE constraint decides, no prior lookup
    if (stmt.step() != SQLITE_DONE) {
        wipe_string(*plain);
        if (db.extended_errcode() == SQLITE_CONSTRAINT_UNIQUE) {
            log_event(LogLevel::WARN,
                "Duplicate entry for title: " + entry.title,
                "create_cred",
                "failure");
            return VaultStatus::DUPLICATE_ENTRY;
        }
        log_event(LogLevel::ERROR,
            std::string("vault_create: insert failed: ") + db.errmsg(),
            "create_cred",
            "failure");
        return VaultStatus::STORAGE_ERROR;
    }

    out.id = static_cast<long long>(sqlite3_last_insert_rowid(db.handle()));
    out.title = entry.title;
    out.username = entry.username;
    out.url = url;
    out.password = std::move(*plain);

    log_event(LogLevel::INFO,
        "Credential added for title: " + entry.title,
        "create_cred",
        "success");
    return VaultStatus::OK;
}


// -------- read --------
VaultStatus vault_list_by_title(VaultContext& ctx, const std::string& title,
    std::vector<CredentialRecord>& out)
{
    out.clear();
    if (!ctx.cipher.initialized()) {
        return VaultStatus::UNINITIALIZED;
    }

    DbConnection db(ctx.db_path);
    Statement stmt(db,
        "SELECT id, title, username, url, password FROM passwords WHERE title = ?1 ORDER BY id");
    if (!stmt.ok() || !stmt.bind_text(1, title)) {
        return VaultStatus::STORAGE_ERROR;
    }

    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        CredentialRecord rec;
        VaultStatus st = decrypt_row(ctx, stmt, rec);
        if (st != VaultStatus::OK) {
            // all or nothing
            wipe_records(out);
            log_event(LogLevel::WARN,
                "Record failed to decrypt under current master password, title: " + title,
                "read_title",
                "failure");
            return st;
        }
        out.push_back(std::move(rec));
    }
    if (rc != SQLITE_DONE) {
        wipe_records(out);
        log_event(LogLevel::ERROR,
            std::string("vault_list_by_title: step failed: ") + db.errmsg(),
            "read_title",
            "failure");
        return VaultStatus::STORAGE_ERROR;
    }
    if (out.empty()) {
        return VaultStatus::NOT_FOUND;
    }

    log_event(LogLevel::INFO,
        "Revealed " + std::to_string(out.size()) + " credential(s) for title: " + title,
        "read_title",
        "success");
    return VaultStatus::OK;
}

VaultStatus vault_get_one(VaultContext& ctx, const std::string& title,
    const std::string& username, CredentialRecord& out)
{
    if (!ctx.cipher.initialized()) {
        return VaultStatus::UNINITIALIZED;
    }

    DbConnection db(ctx.db_path);
    Statement stmt(db,
        "SELECT id, title, username, url, password FROM passwords"
        " WHERE title = ?1 AND username = ?2");
    if (!stmt.ok() || !stmt.bind_text(1, title) || !stmt.bind_text(2, username)) {
        return VaultStatus::STORAGE_ERROR;
    }

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return VaultStatus::NOT_FOUND;
    }
    if (rc != SQLITE_ROW) {
        log_event(LogLevel::ERROR,
            std::string("vault_get_one: step failed: ") + db.errmsg(),
            "read_one",
            "failure");
        return VaultStatus::STORAGE_ERROR;
    }

    CredentialRecord rec;
    VaultStatus st = decrypt_row(ctx, stmt, rec);
    if (st != VaultStatus::OK) {
        log_event(LogLevel::WARN,
            "Record failed to decrypt under current master password, title: " + title,
            "read_one",
            "failure");
        return st;
    }
    out = std::move(rec);
    log_event(LogLevel::INFO,
        "Revealed credential for title: " + title,
        "read_one",
        "success");
    return VaultStatus::OK;
}


// -------- update --------
VaultStatus vault_update(VaultContext& ctx, const CredentialUpdate& request, CredentialRecord& out) {
    if (!valid_key_pair(request.title, request.username, "upd_cred")) {
        return VaultStatus::INVALID_ARGUMENT;
    }
    std::optional<std::string> url = request.url;
    if (url && url->empty()) url = std::string(DEFAULT_URL);
    if (url && !valid_url(*url)) {
        return VaultStatus::INVALID_ARGUMENT;
    }
    if (!ctx.cipher.initialized()) {
        return VaultStatus::UNINITIALIZED;
    }

    std::optional<std::string> plain;
    VaultStatus st = resolve_password(request.password, request.generate, plain, "upd_cred");
    if (st != VaultStatus::OK) return st;

    std::optional<std::string> ct;
    if (plain) {
        std::string enc;
        st = ctx.cipher.encrypt(*plain, enc);
        if (st != VaultStatus::OK) {
            wipe_string(*plain);
            return st;
        }
        ct = std::move(enc);
    }

    // The row is read back by the UPDATE itself so the result always
    // describes what was committed.
    std::string stored_ct;
    {
        DbConnection db(ctx.db_path);
        // NULL keeps the stored value; title and username are never written
        Statement stmt(db,
            "UPDATE passwords SET url = COALESCE(?1, url), password = COALESCE(?2, password)"
            " WHERE title = ?3 AND username = ?4"
            " RETURNING id, url, password");
        if (!stmt.ok()
            || !stmt.bind_optional_text(1, url)
            || !stmt.bind_optional_text(2, ct)
            || !stmt.bind_text(3, request.title)
            || !stmt.bind_text(4, request.username)) {
            if (plain) wipe_string(*plain);
            return VaultStatus::STORAGE_ERROR;
        }
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            if (plain) wipe_string(*plain);
            log_event(LogLevel::WARN,
                "Update requested for non-existent entry, title: " + request.title,
                "upd_cred",
                "failure");
            return VaultStatus::NOT_FOUND;
        }
        if (rc == SQLITE_ROW) {
            out.id = stmt.column_int64(0);
            out.url = stmt.column_text(1);
            stored_ct = stmt.column_text(2);
            rc = stmt.step();
        }
        if (rc != SQLITE_DONE) {
            if (plain) wipe_string(*plain);
            log_event(LogLevel::ERROR,
                std::string("vault_update: update failed: ") + db.errmsg(),
                "upd_cred",
                "failure");
            return VaultStatus::STORAGE_ERROR;
        }
    }
    out.title = request.title;
    out.username = request.username;

    log_event(LogLevel::INFO,
        "Update success for title: " + request.title,
        "upd_cred",
        "success");

    if (plain) {
        out.password = std::move(*plain);
        return VaultStatus::OK;
    }
    // url-only update: the stored password is shown when the current key
    // opens it, otherwise left empty. The write itself already succeeded.
    if (ctx.cipher.decrypt(stored_ct, out.password) != VaultStatus::OK) {
        out.password.clear();
        log_event(LogLevel::WARN,
            "Updated entry not readable with current key, title: " + request.title,
            "upd_cred",
            "partial");
    }
    return VaultStatus::OK;
}


// -------- delete --------
VaultStatus vault_delete(VaultContext& ctx, const std::string& title, const std::string& username) {
    DbConnection db(ctx.db_path);
    Statement stmt(db, "DELETE FROM passwords WHERE title = ?1 AND username = ?2");
    if (!stmt.ok() || !stmt.bind_text(1, title) || !stmt.bind_text(2, username)) {
        return VaultStatus::STORAGE_ERROR;
    }
    if (stmt.step() != SQLITE_DONE) {
        log_event(LogLevel::ERROR,
            std::string("vault_delete: delete failed: ") + db.errmsg(),
            "del_cred",
            "failure");
        return VaultStatus::STORAGE_ERROR;
    }
    if (db.changes() == 0) {
        log_event(LogLevel::WARN,
            "Deletion requested for non-existent entry, title: " + title,
            "del_cred",
            "failure");
        return VaultStatus::NOT_FOUND;
    }

    log_event(LogLevel::INFO,
        "Deletion success for title: " + title,
        "del_cred",
        "success");
    return VaultStatus::OK;
}


// -------- titles --------
VaultStatus vault_list_titles(VaultContext& ctx, std::vector<std::string>& out) {
    out.clear();
    DbConnection db(ctx.db_path);
    Statement stmt(db, "SELECT DISTINCT title FROM passwords");
    if (!stmt.ok()) {
        return VaultStatus::STORAGE_ERROR;
    }

    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        out.push_back(stmt.column_text(0));
    }
    if (rc != SQLITE_DONE) {
        out.clear();
        log_event(LogLevel::ERROR,
            std::string("vault_list_titles: step failed: ") + db.errmsg(),
            "list_titles",
            "failure");
        return VaultStatus::STORAGE_ERROR;
    }
    return VaultStatus::OK;
}
