#pragma once
#include "keypass_common.hpp"
#include "logging.hpp"

// -------- Key derivation --------
// Repeat the master password up to KEY_LEN bytes and truncate. Kept as-is so
// vaults written by earlier builds keep decrypting.
bool derive_key_from_master(
    const byte* pw,
    size_t pw_len,
    byte key[KEY_LEN]
);

// -------- Master password hash --------
// Lowercase hex SHA-256, stored as the vault's master password record.
bool hash_master_password(
    const byte* pw,
    size_t pw_len,
    std::string& out_hex
);

// -------- Field encryption --------
// out = base64(nonce || ciphertext || tag)
bool encrypt_field(
    const byte key[KEY_LEN],
    const std::string& plaintext,
    std::string& out_b64
);

// INVALID_CREDENTIALS when the field does not authenticate under |key|
VaultStatus decrypt_field(
    const byte key[KEY_LEN],
    const std::string& field_b64,
    std::string& out_plain
);

// -------- Encoding --------
std::string to_base64(const byte* bin, size_t len);
bool from_base64(const std::string& b64, std::vector<byte>& out);
