#include "record_cipher.hpp"
#include "crypto.hpp"
#include "logging.hpp"

VaultStatus RecordCipher::init(const SecureBuffer& master_password) {
    if (initialized()) {
        log_event(LogLevel::ERROR,
            "RecordCipher::init called twice",
            "cipher_init",
            "failure");
        return VaultStatus::CRYPTO_ERROR;
    }
    if (master_password.empty()) {
        return VaultStatus::INVALID_ARGUMENT;
    }

    SecureBuffer key(KEY_LEN);
    if (!derive_key_from_master(master_password.data(), master_password.size(), key.data())) {
        return VaultStatus::CRYPTO_ERROR;
    }
    if (!key.protect_readonly()) {
        log_event(LogLevel::WARN,
            "Could not mark derived key read-only",
            "cipher_init",
            "degraded");
    }
    key_ = std::move(key);

    log_event(LogLevel::INFO,
        "Record cipher initialized",
        "cipher_init",
        "success");
    return VaultStatus::OK;
}

VaultStatus RecordCipher::encrypt(const std::string& plaintext, std::string& out) const {
    if (!initialized()) {
        log_event(LogLevel::ERROR,
            "encrypt before cipher initialization",
            "cipher",
            "failure");
        return VaultStatus::UNINITIALIZED;
    }
    if (!encrypt_field(key_.data(), plaintext, out)) {
        return VaultStatus::CRYPTO_ERROR;
    }
    return VaultStatus::OK;
}

VaultStatus RecordCipher::decrypt(const std::string& ciphertext, std::string& out) const {
    if (!initialized()) {
        log_event(LogLevel::ERROR,
            "decrypt before cipher initialization",
            "cipher",
            "failure");
        return VaultStatus::UNINITIALIZED;
    }
    return decrypt_field(key_.data(), ciphertext, out);
}
