#pragma once
#include "keypass_common.hpp"
#include "secure_buffer.hpp"

// Holds the key derived from the verified master password. After init() the
// key page is read-only, so concurrent encrypt/decrypt calls need no lock.
class RecordCipher {
public:
    RecordCipher() = default;

    RecordCipher(const RecordCipher&) = delete;
    RecordCipher& operator=(const RecordCipher&) = delete;

    // Derives the key. Fails with INVALID_ARGUMENT on an empty password and
    // CRYPTO_ERROR if the cipher was already initialized.
    VaultStatus init(const SecureBuffer& master_password);

    bool initialized() const { return !key_.empty(); }

    VaultStatus encrypt(const std::string& plaintext, std::string& out) const;

    // INVALID_CREDENTIALS when |ciphertext| was not produced under this key
    VaultStatus decrypt(const std::string& ciphertext, std::string& out) const;

private:
    SecureBuffer key_;
};
