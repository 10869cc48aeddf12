#pragma once
#include "keypass_common.hpp"
#include "logging.hpp"
#include "secure_buffer.hpp"

// -------- Vault location --------
struct VaultPaths {
    std::string dir;
    std::string db_path;
    std::string log_path;
};

// dir = override_dir, else $KEYPASS_HOME, else $HOME/.keypass. A missing
// directory is created 0700; only the default one is tightened if it exists.
// Refuses a directory or files not owned by us or open to group/other.
bool init_vault_paths(const char* override_dir, VaultPaths& out);

// -------- Ownership and permission checks --------
bool check_dir_ownership_and_perms(const std::string& path);
bool check_file_ownership_and_perms(const std::string& path, bool allow_missing);

// -------- Terminal input --------
// Reads one line with echo disabled into locked memory; false on EOF.
bool get_password_secure(const char* prompt, SecureBuffer& out);

// Plain visible line; false on EOF
bool read_line(const char* prompt, std::string& out);
