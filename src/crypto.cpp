#include "crypto.hpp"

// -------- Key derivation --------
bool derive_key_from_master( // repeat-and-truncate, no salt, no stretching
    const byte* pw,
    size_t pw_len,
    byte key[KEY_LEN]
)
{
    if (!pw || !key) {
        log_event(LogLevel::ERROR,
            "derive_key_from_master: null pointer",
            "crypto_module",
            "failure");
        return false;
    }

    if (pw_len == 0 || pw_len > MAX_PASS_LEN) {
        log_event(LogLevel::WARN,
            "derive_key_from_master: invalid password length",
            "crypto_module",
            "failure");
        return false;
    }

    for (size_t i = 0; i < KEY_LEN; ++i) {
        key[i] = pw[i % pw_len];
    }
    return true;
}


// -------- Master password hash --------
bool hash_master_password(
    const byte* pw,
    size_t pw_len,
    std::string& out_hex
)
{
    if (!pw || pw_len == 0) {
        log_event(LogLevel::WARN,
            "hash_master_password: empty password",
            "crypto_module",
            "failure");
        return false;
    }

    byte digest[HASH_LEN];
    if (crypto_hash_sha256(digest, pw, pw_len) != 0) {
        log_event(LogLevel::ERROR,
            "hash_master_password: crypto_hash_sha256 failed",
            "crypto_module",
            "failure");
        return false;
    }

    out_hex.assign(HASH_LEN * 2 + 1, '\0');
    sodium_bin2hex(&out_hex[0], out_hex.size(), digest, HASH_LEN);
    out_hex.resize(HASH_LEN * 2);
    sodium_memzero(digest, sizeof(digest));
    return true;
}


// -------- Encoding --------
std::string to_base64(const byte* bin, size_t len) {
    if (!bin || len == 0) return "";
    size_t out_len = sodium_base64_encoded_len(len, sodium_base64_VARIANT_ORIGINAL);
    std::string out;
    out.resize(out_len);
    sodium_bin2base64(&out[0], out_len, bin, len, sodium_base64_VARIANT_ORIGINAL);
    // encoded_len counts the terminating null
    size_t pos = out.find('\0');
    if (pos != std::string::npos) out.resize(pos);
    return out;
}

bool from_base64(const std::string& b64, std::vector<byte>& out) {
    out.clear();
    if (b64.empty()) return false;
    out.resize(b64.size());
    size_t out_len = 0;
    if (sodium_base642bin(out.data(),
        out.size(),
        b64.c_str(),
        b64.size(),
        nullptr,
        &out_len,
        nullptr,
        sodium_base64_VARIANT_ORIGINAL) != 0) {
        out.clear();
        return false;
    }
    out.resize(out_len);
    return true;
}


// -------- Field encryption (XChaCha20-Poly1305-IETF) --------
bool encrypt_field(
    const byte key[KEY_LEN],
    const std::string& plaintext,
    std::string& out_b64
)
{
    if (!key) {
        log_event(LogLevel::ERROR,
            "encrypt_field: null key",
            "crypto_module",
            "failure");
        return false;
    }

    if (plaintext.size() > MAX_PASS_LEN) {
        log_event(LogLevel::WARN,
            "encrypt_field: plaintext too large",
            "crypto_module",
            "failure");
        return false;
    }

    // nonce || ciphertext || tag
    std::vector<byte> blob(NONCE_LEN + plaintext.size() + ABYTES);
    byte* nonce = blob.data();
    byte* ct = blob.data() + NONCE_LEN;
    randombytes_buf(nonce, NONCE_LEN);

    unsigned long long ct_len_ull = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
        ct,
        &ct_len_ull,
        reinterpret_cast<const byte*>(plaintext.data()),
        plaintext.size(),
        nullptr,          // additional data - none
        0,
        nullptr,          // nsec - not used
        nonce,
        key) != 0)
    {
        log_event(LogLevel::ERROR,
            "encrypt_field: crypto_aead_xchacha20poly1305_ietf_encrypt failed",
            "crypto_module",
            "failure");
        return false;
    }

    blob.resize(NONCE_LEN + static_cast<size_t>(ct_len_ull));
    out_b64 = to_base64(blob.data(), blob.size());
    return true;
}

VaultStatus decrypt_field(
    const byte key[KEY_LEN],
    const std::string& field_b64,
    std::string& out_plain
)
{
    out_plain.clear();
    if (!key) {
        log_event(LogLevel::ERROR,
            "decrypt_field: null key",
            "crypto_module",
            "failure");
        return VaultStatus::CRYPTO_ERROR;
    }

    std::vector<byte> blob;
    if (!from_base64(field_b64, blob) || blob.size() < NONCE_LEN + ABYTES) {
        log_event(LogLevel::WARN,
            "decrypt_field: malformed or truncated field",
            "crypto_module",
            "failure");
        return VaultStatus::INVALID_CREDENTIALS;
    }

    const byte* nonce = blob.data();
    const byte* ct = blob.data() + NONCE_LEN;
    size_t ct_len = blob.size() - NONCE_LEN;
    size_t max_plain_len = ct_len - ABYTES;

    std::vector<byte> plain(max_plain_len + 1);
    unsigned long long out_len_ull = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
        plain.data(),
        &out_len_ull,
        nullptr,      // nsec - not used
        ct,
        ct_len,
        nullptr,      // additional data - none
        0,
        nonce,
        key) != 0)
    {
        // wrong key, corrupted or tampered ciphertext
        log_event(LogLevel::WARN,
            "decrypt_field: authentication failed",
            "crypto_module",
            "failure");
        return VaultStatus::INVALID_CREDENTIALS;
    }

    size_t out_len = static_cast<size_t>(out_len_ull);
    out_plain.assign(reinterpret_cast<const char*>(plain.data()), out_len);
    sodium_memzero(plain.data(), plain.size());
    return VaultStatus::OK;
}
