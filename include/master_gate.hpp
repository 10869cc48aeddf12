#pragma once
#include "keypass_common.hpp"
#include "secure_buffer.hpp"

struct VaultContext;

enum class GateState {
    UNINITIALIZED,
    AWAITING_SETUP,
    AWAITING_VERIFICATION,
    READY,
    LOCKED
};

// Asks for a secret; returns false when input is exhausted.
using PasswordPrompt = std::function<bool(const char* prompt, SecureBuffer& out)>;

// Decides between first-run setup and verification of the stored hash.
class MasterGate {
public:
    MasterGate(std::string db_path, PasswordPrompt prompt);

    GateState state() const { return state_; }
    unsigned attempts() const { return attempts_; }

    // On OK |master_out| holds the verified plaintext and state() is READY.
    // LOCKED after MAX_VERIFY_ATTEMPTS wrong candidates; IO_ERROR if the
    // prompt runs dry; STORAGE_ERROR/CRYPTO_ERROR otherwise.
    VaultStatus open(SecureBuffer& master_out);

private:
    VaultStatus run_setup(SecureBuffer& master_out);
    VaultStatus run_verification(const std::string& stored_hash, SecureBuffer& master_out);

    std::string db_path_;
    PasswordPrompt prompt_;
    GateState state_ = GateState::UNINITIALIZED;
    unsigned attempts_ = 0;
};

// Startup sequence: gate, then cipher init on |ctx|. Nothing may be served
// unless this returns OK.
VaultStatus unlock_vault(VaultContext& ctx, const PasswordPrompt& prompt);
