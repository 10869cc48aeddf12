#include "master_gate.hpp"
#include "crypto.hpp"
#include "db.hpp"
#include "logging.hpp"
#include "util.hpp"
#include "vault.hpp"

MasterGate::MasterGate(std::string db_path, PasswordPrompt prompt)
    : db_path_(std::move(db_path)), prompt_(std::move(prompt))
{
}

VaultStatus MasterGate::open(SecureBuffer& master_out) {
    if (state_ == GateState::READY || state_ == GateState::LOCKED) {
        log_event(LogLevel::ERROR,
            "MasterGate::open called after the gate settled",
            "master_gate",
            "failure");
        return state_ == GateState::LOCKED ? VaultStatus::LOCKED : VaultStatus::CRYPTO_ERROR;
    }

    std::string stored_hash;
    VaultStatus st = load_master_hash(db_path_, stored_hash);
    if (st != VaultStatus::OK) {
        return st;
    }

    if (stored_hash.empty()) {
        state_ = GateState::AWAITING_SETUP;
        std::cout << "No master password set. Initialize new vault.\n";
        log_event(LogLevel::INFO,
            "No master password record, starting setup",
            "vault_init",
            "notify");
        return run_setup(master_out);
    }

    state_ = GateState::AWAITING_VERIFICATION;
    return run_verification(stored_hash, master_out);
}

VaultStatus MasterGate::run_setup(SecureBuffer& master_out) {
    for (;;) {
        SecureBuffer pw1;
        if (!prompt_("Create master password: ", pw1)) {
            log_event(LogLevel::WARN,
                "Input closed during master password setup",
                "vault_init",
                "failure");
            return VaultStatus::IO_ERROR;
        }
        if (utf8_length(pw1.data(), pw1.size()) < MIN_MASTER_LEN) {
            std::cout << "Master password must be at least " << MIN_MASTER_LEN << " characters.\n";
            log_event(LogLevel::WARN,
                "Setup rejected: master password too short",
                "vault_init",
                "failure");
            continue;
        }
        if (pw1.size() > MAX_PASS_LEN) {
            std::cout << "Master password must be at most " << MAX_PASS_LEN << " bytes.\n";
            continue;
        }

        SecureBuffer pw2;
        if (!prompt_("Confirm master password: ", pw2)) {
            log_event(LogLevel::WARN,
                "Input closed during master password setup",
                "vault_init",
                "failure");
            return VaultStatus::IO_ERROR;
        }
        if (!pw1.equals(pw2)) {
            std::cout << "Passwords do not match. Try again.\n";
            log_event(LogLevel::WARN,
                "Setup rejected: passwords did not match",
                "vault_init",
                "failure");
            continue;
        }

        std::string hash;
        if (!hash_master_password(pw1.data(), pw1.size(), hash)) {
            return VaultStatus::CRYPTO_ERROR;
        }
        VaultStatus st = store_master_hash(db_path_, hash);
        if (st != VaultStatus::OK) {
            return st;
        }

        master_out = std::move(pw1);
        state_ = GateState::READY;
        log_event(LogLevel::INFO,
            "Master password set",
            "vault_init",
            "success");
        return VaultStatus::OK;
    }
}

VaultStatus MasterGate::run_verification(const std::string& stored_hash, SecureBuffer& master_out) {
    while (attempts_ < MAX_VERIFY_ATTEMPTS) {
        SecureBuffer candidate;
        if (!prompt_("Master password: ", candidate)) {
            log_event(LogLevel::WARN,
                "Input closed during master password verification",
                "unlock",
                "failure");
            return VaultStatus::IO_ERROR;
        }
        attempts_++;

        std::string hash;
        bool matched = !candidate.empty() &&
            hash_master_password(candidate.data(), candidate.size(), hash) &&
            hash.size() == stored_hash.size() &&
            sodium_memcmp(hash.data(), stored_hash.data(), hash.size()) == 0;

        if (matched) {
            master_out = std::move(candidate);
            state_ = GateState::READY;
            log_event(LogLevel::INFO,
                "Master password accepted - session opened",
                "unlock",
                "success");
            return VaultStatus::OK;
        }

        log_event(LogLevel::WARN,
            "Failed master password attempt " + std::to_string(attempts_),
            "unlock",
            "failure");
        if (attempts_ < MAX_VERIFY_ATTEMPTS) {
            std::cout << "Master password incorrect.\n";
        }
    }

    state_ = GateState::LOCKED;
    std::cerr << "Too many failed attempts; exiting.\n";
    log_event(LogLevel::ALERT,
        "Too many failed master password attempts - lockout",
        "unlock",
        "failure");
    return VaultStatus::LOCKED;
}


// ---------------- Startup sequence ----------------
VaultStatus unlock_vault(VaultContext& ctx, const PasswordPrompt& prompt) {
    MasterGate gate(ctx.db_path, prompt);
    SecureBuffer master;
    VaultStatus st = gate.open(master);
    if (st != VaultStatus::OK) {
        return st;
    }
    return ctx.cipher.init(master);
}
