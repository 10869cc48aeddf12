#pragma once
#include "keypass_common.hpp"
#include "record_cipher.hpp"

// Built once by the startup sequence and handed by reference to every
// request. The cipher is read-only once unlock_vault() returns OK.
struct VaultContext {
    explicit VaultContext(std::string db)
        : db_path(std::move(db))
    {
    }

    std::string db_path;
    RecordCipher cipher;
};

// -------- Vault operations --------
// Each call opens and closes its own connection.

// DUPLICATE_ENTRY if (title, username) exists. |out| carries the plaintext
// password actually stored (generated when entry.generate is set).
VaultStatus vault_create(VaultContext& ctx, const CredentialEntry& entry, CredentialRecord& out);

// All records with |title| ordered by id. NOT_FOUND when none; any record
// failing to decrypt aborts the read with INVALID_CREDENTIALS.
VaultStatus vault_list_by_title(VaultContext& ctx, const std::string& title,
    std::vector<CredentialRecord>& out);

VaultStatus vault_get_one(VaultContext& ctx, const std::string& title,
    const std::string& username, CredentialRecord& out);

// Changes url and/or password of an existing record. NOT_FOUND when the
// pair does not exist. On OK |out| holds the committed row; after a url-only
// update of a record the current key cannot open, out.password is empty.
VaultStatus vault_update(VaultContext& ctx, const CredentialUpdate& request, CredentialRecord& out);

// NOT_FOUND when nothing was deleted
VaultStatus vault_delete(VaultContext& ctx, const std::string& title, const std::string& username);

VaultStatus vault_list_titles(VaultContext& ctx, std::vector<std::string>& out);
