#pragma once
#include "keypass_common.hpp"
#include "vault.hpp"

// Request-level boundary. Every vault status is turned into a response here;
// nothing below escapes to the caller.
//
//   POST   /passwords/                   handle_create
//   GET    /passwords/{title}            handle_read_title
//   GET    /passwords/{title}/{username} handle_read_one
//   PUT    /passwords/                   handle_update
//   DELETE /passwords/{title}/{username} handle_delete
//   GET    /titles/                      handle_list_titles
struct ServiceResponse {
    int status = 200;
    std::string detail;
    std::vector<CredentialRecord> records;
    std::vector<std::string> titles;

    bool ok() const { return status == 200; }
};

int service_http_status(VaultStatus st);

// |what| names the missing resource in NOT_FOUND messages
std::string service_detail(VaultStatus st, const std::string& what);

ServiceResponse handle_create(VaultContext& ctx, const CredentialEntry& entry);
ServiceResponse handle_read_title(VaultContext& ctx, const std::string& title);
ServiceResponse handle_read_one(VaultContext& ctx, const std::string& title, const std::string& username);
ServiceResponse handle_update(VaultContext& ctx, const CredentialUpdate& request);
ServiceResponse handle_delete(VaultContext& ctx, const std::string& title, const std::string& username);
ServiceResponse handle_list_titles(VaultContext& ctx);
