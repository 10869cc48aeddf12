#include "io.hpp"
#include "util.hpp"

// ---------- Path helpers ----------
static std::string get_user_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
    if (!home || !*home) return ".";
    return std::string(home);
}

// Creates |path| with |mode|. An existing directory is only tightened when
// |may_tighten| is set, i.e. it is keypass's own default location.
static bool ensure_dir_exists(const std::string& path, mode_t mode, bool may_tighten) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cerr << path << " exists but is not a directory\n";
            return false;
        }
        if (may_tighten && (st.st_mode & 0777) != mode) {
            if (chmod(path.c_str(), mode) != 0) {
                std::cerr << "Failed to restrict permissions on " << path << ": " << strerror(errno) << "\n";
                return false;
            }
        }
        return true;
    }
    if (mkdir(path.c_str(), mode) != 0) {
        if (errno != EEXIST) {
            std::cerr << "Failed to create directory " << path << ": " << strerror(errno) << "\n";
            return false;
        }
    }
    return true;
}

// -------- Ownership and permission checks ----------
static bool check_owner_and_mode(const struct stat& st, const std::string& path, const char* kind) {
    if (st.st_uid != geteuid()) {
        log_event(LogLevel::ERROR,
            std::string(kind) + " ownership violation: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: vault file access check failed.\n";
        return false;
    }
    // No group/other access allowed
    if ((st.st_mode & 0077) != 0) {
        log_event(LogLevel::ERROR,
            std::string("Insecure ") + kind + " permissions on: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: vault file access check failed.\n";
        return false;
    }
    return true;
}

bool check_dir_ownership_and_perms(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        std::cerr << "Internal error: vault directory check failed.\n";
        return false;
    }
    return check_owner_and_mode(st, path, "directory");
}

bool check_file_ownership_and_perms(const std::string& path, bool allow_missing) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT && allow_missing) return true;
        std::cerr << "Internal error: vault file check failed.\n";
        return false;
    }
    return check_owner_and_mode(st, path, "file");
}


// ---------- Vault location ----------
bool init_vault_paths(const char* override_dir, VaultPaths& out) {
    std::string dir;
    bool user_supplied = true;
    const char* env = std::getenv(HOME_ENV);
    if (override_dir && *override_dir) {
        dir = override_dir;
    }
    else if (env && *env) {
        dir = env;
    }
    else {
        dir = get_user_home_dir() + "/" + DEFAULT_DIR_NAME;
        user_supplied = false;
    }
    while (dir.size() > 1 && dir.back() == '/') dir.pop_back();

    // a directory the user named is never re-permissioned; an open one is refused
    if (!ensure_dir_exists(dir, S_IRWXU, !user_supplied)) {
        return false;
    }
    if (!check_dir_ownership_and_perms(dir)) {
        return false;
    }

    out.dir = dir;
    out.db_path = dir + "/" + DB_FILENAME;
    out.log_path = dir + "/" + LOG_FILENAME;

    // if files don't exist yet, just check that any existing ones are secure
    if (!check_file_ownership_and_perms(out.db_path, true)) return false;
    if (!check_file_ownership_and_perms(out.log_path, true)) return false;

    return true;
}


// ---------- Terminal input ----------
static void disable_echo(bool disable) {
    termios tty;
    if (tcgetattr(STDIN_FILENO, &tty) != 0) return; // not a tty

    if (disable) tty.c_lflag &= ~ECHO;
    else         tty.c_lflag |= ECHO;

    if (tcsetattr(STDIN_FILENO, TCSANOW, &tty) != 0) {
        log_event(LogLevel::WARN,
            std::string("tcsetattr failed: ") + strerror(errno),
            "tty_echo",
            "failure");
    }
}

bool get_password_secure(const char* prompt, SecureBuffer& out) {
    std::cout << prompt;
    std::cout.flush();

    disable_echo(true);
    std::string s;
    bool got = static_cast<bool>(std::getline(std::cin, s));
    disable_echo(false);
    std::cout << "\n";

    if (!got) {
        wipe_string(s);
        return false;
    }
    strip_cr(s);
    out = SecureBuffer(s.data(), s.size());
    wipe_string(s);
    return true;
}

bool read_line(const char* prompt, std::string& out) {
    std::cout << prompt;
    std::cout.flush();
    if (!std::getline(std::cin, out)) {
        return false;
    }
    strip_cr(out);
    return true;
}
