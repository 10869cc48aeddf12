#pragma once

#include <sodium.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <sys/types.h>
#include <pwd.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>
#include <ctime>
#include <cerrno>
#include <limits>
#include <algorithm>
#include <functional>
#include <optional>
#include <cctype>

// -------- Configuration constants --------
inline constexpr const char* DB_FILENAME = "vault.db";
inline constexpr const char* LOG_FILENAME = "keypass.log";
inline constexpr const char* HOME_ENV = "KEYPASS_HOME";
inline constexpr const char* LOG_LEVEL_ENV = "KEYPASS_LOG_LEVEL";
inline constexpr const char* DEFAULT_DIR_NAME = ".keypass";
inline constexpr size_t KEY_LEN = crypto_aead_xchacha20poly1305_ietf_KEYBYTES;
inline constexpr size_t NONCE_LEN = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
inline constexpr size_t ABYTES = crypto_aead_xchacha20poly1305_ietf_ABYTES;
inline constexpr size_t HASH_LEN = crypto_hash_sha256_BYTES;

// master password gate
inline constexpr size_t MIN_MASTER_LEN = 4;
inline constexpr unsigned MAX_VERIFY_ATTEMPTS = 3;

// generator
inline constexpr int DEFAULT_GENERATED_LEN = 16;

// limits for record fields
inline constexpr size_t MAX_TITLE_LEN = 256;
inline constexpr size_t MAX_USER_LEN = 256;
inline constexpr size_t MAX_URL_LEN = 2048;
inline constexpr size_t MAX_PASS_LEN = 1024;
inline constexpr const char* DEFAULT_URL = "N/A";

// sqlite
inline constexpr int DB_BUSY_TIMEOUT_MS = 5000;

// process exit codes
inline constexpr int EXIT_INIT_FAILED = 1;
inline constexpr int EXIT_GATE_ABORTED = 2;
inline constexpr int EXIT_LOCKED = 3;

using byte = unsigned char;

// -------- Result codes shared by every vault module --------
enum class VaultStatus {
    OK,
    INVALID_ARGUMENT,     // bad generator length, malformed input
    DUPLICATE_ENTRY,      // (title, username) already stored
    NOT_FOUND,
    INVALID_CREDENTIALS,  // record failed authentication under the current key
    UNINITIALIZED,        // cipher used before the gate opened
    LOCKED,               // master password attempts exhausted
    STORAGE_ERROR,
    CRYPTO_ERROR,
    IO_ERROR
};

const char* vault_status_str(VaultStatus st);

// Decrypted view of a row in the passwords table
struct CredentialRecord {
    long long id = 0;
    std::string title;
    std::string username;
    std::string url;
    std::string password;
};

// Create request
struct CredentialEntry {
    std::string title;
    std::string username;
    std::string url = DEFAULT_URL;
    std::optional<std::string> password;
    bool generate = false;
};

// Update request: absent fields keep their stored value
struct CredentialUpdate {
    std::string title;
    std::string username;
    std::optional<std::string> url;
    std::optional<std::string> password;
    bool generate = false;
};
