#include "service.hpp"
#include "logging.hpp"

int service_http_status(VaultStatus st) {
    switch (st) {
    case VaultStatus::OK:                  return 200;
    case VaultStatus::DUPLICATE_ENTRY:     return 400;
    case VaultStatus::INVALID_CREDENTIALS: return 401;
    case VaultStatus::NOT_FOUND:           return 404;
    case VaultStatus::INVALID_ARGUMENT:    return 422;
    case VaultStatus::LOCKED:              return 503;
    case VaultStatus::UNINITIALIZED:
    case VaultStatus::STORAGE_ERROR:
    case VaultStatus::CRYPTO_ERROR:
    case VaultStatus::IO_ERROR:
        break;
    }
    return 500;
}

std::string service_detail(VaultStatus st, const std::string& what) {
    switch (st) {
    case VaultStatus::OK:                  return "";
    case VaultStatus::DUPLICATE_ENTRY:     return "Username already exists for this title.";
    case VaultStatus::INVALID_CREDENTIALS: return "Invalid credentials. Set main password correctly.";
    case VaultStatus::NOT_FOUND:           return what + " not found.";
    case VaultStatus::INVALID_ARGUMENT:    return "Invalid input.";
    case VaultStatus::UNINITIALIZED:       return "Vault is locked. Restart and enter the master password.";
    case VaultStatus::LOCKED:              return "Vault is locked.";
    case VaultStatus::STORAGE_ERROR:
    case VaultStatus::CRYPTO_ERROR:
    case VaultStatus::IO_ERROR:
        break;
    }
    return "An unexpected error occurred. Check the log.";
}

static ServiceResponse from_status(VaultStatus st, const std::string& what, const char* event) {
    ServiceResponse r;
    r.status = service_http_status(st);
    r.detail = service_detail(st, what);
    if (r.status >= 500) {
        log_event(LogLevel::ERROR,
            std::string("Request failed: ") + vault_status_str(st),
            event,
            "failure");
    }
    return r;
}

ServiceResponse handle_create(VaultContext& ctx, const CredentialEntry& entry) {
    CredentialRecord rec;
    VaultStatus st = vault_create(ctx, entry, rec);
    ServiceResponse r = from_status(st, "Password entry", "POST /passwords/");
    if (st == VaultStatus::OK) {
        r.records.push_back(std::move(rec));
    }
    return r;
}

ServiceResponse handle_read_title(VaultContext& ctx, const std::string& title) {
    std::vector<CredentialRecord> recs;
    VaultStatus st = vault_list_by_title(ctx, title, recs);
    ServiceResponse r = from_status(st, "title", "GET /passwords/{title}");
    if (st == VaultStatus::OK) {
        r.records = std::move(recs);
    }
    return r;
}

ServiceResponse handle_read_one(VaultContext& ctx, const std::string& title, const std::string& username) {
    CredentialRecord rec;
    VaultStatus st = vault_get_one(ctx, title, username, rec);
    ServiceResponse r = from_status(st, "Entry", "GET /passwords/{title}/{username}");
    if (st == VaultStatus::OK) {
        r.records.push_back(std::move(rec));
    }
    return r;
}

ServiceResponse handle_update(VaultContext& ctx, const CredentialUpdate& request) {
    CredentialRecord rec;
    VaultStatus st = vault_update(ctx, request, rec);
    ServiceResponse r = from_status(st, "Password entry", "PUT /passwords/");
    if (st == VaultStatus::OK) {
        r.records.push_back(std::move(rec));
    }
    return r;
}

ServiceResponse handle_delete(VaultContext& ctx, const std::string& title, const std::string& username) {
    VaultStatus st = vault_delete(ctx, title, username);
    ServiceResponse r = from_status(st, "Password entry", "DELETE /passwords/{title}/{username}");
    if (st == VaultStatus::OK) {
        r.detail = "Password entry deleted.";
    }
    return r;
}

ServiceResponse handle_list_titles(VaultContext& ctx) {
    std::vector<std::string> titles;
    VaultStatus st = vault_list_titles(ctx, titles);
    ServiceResponse r = from_status(st, "title", "GET /titles/");
    if (st == VaultStatus::OK) {
        r.titles = std::move(titles);
    }
    return r;
}
