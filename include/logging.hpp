#pragma once
#include "keypass_common.hpp"

// -------- Logging --------
enum class LogLevel { INFO = 0, WARN = 1, ERROR = 2, ALERT = 3 };

struct LogContext {
    std::string user;
    std::string session;
    std::string ip;
    std::string vault_dir;              // "-" until the vault location is resolved
    LogLevel min_level = LogLevel::INFO;
};

extern LogContext g_log_ctx;

// Captures user, client ip, a fresh session id and the minimum level from
// LOG_LEVEL_ENV. Requires sodium_init().
void init_log_context();

// Until this is called lines go to stderr; afterwards to |path|
// (<vault dir>/LOG_FILENAME). An empty path switches back to stderr.
void set_log_path(const std::string& path, const std::string& vault_dir = "");

// Parses "info", "warn", "error" or "alert" (any case).
std::optional<LogLevel> parse_log_level(const std::string& name);

// log_event(LogLevel::INFO, "Record created", "create_cred", "success");
// Safe to call from several threads.
void log_event(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);
