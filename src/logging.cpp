#include "logging.hpp"
#include "util.hpp"

#include <mutex>

LogContext g_log_ctx;

static std::mutex g_log_mutex;
static std::string g_log_path;   // empty -> stderr


// ---------------- Context ----------------
static std::string lookup_user() {
    struct passwd* pw = getpwuid(geteuid());
    if (pw && pw->pw_name) {
        return pw->pw_name;
    }
    const char* env = std::getenv("USER");
    return (env && *env) ? env : "unknown";
}

// first token of SSH_CONNECTION / SSH_CLIENT, else loopback
static std::string lookup_client_ip() {
    const char* vars[] = { "SSH_CONNECTION", "SSH_CLIENT" };
    for (const char* var : vars) {
        const char* v = std::getenv(var);
        if (!v || !*v) continue;
        std::istringstream iss(v);
        std::string ip;
        if (iss >> ip) return ip;
    }
    return "127.0.0.1";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n;
    for (char c : name) n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (n == "info")  return LogLevel::INFO;
    if (n == "warn")  return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    if (n == "alert") return LogLevel::ALERT;
    return std::nullopt;
}

void init_log_context() {
    LogContext ctx;
    ctx.user = lookup_user();
    ctx.session = generate_session_id();
    ctx.ip = lookup_client_ip();
    ctx.vault_dir = "-";

    const char* lvl = std::getenv(LOG_LEVEL_ENV);
    if (lvl && *lvl) {
        std::optional<LogLevel> parsed = parse_log_level(lvl);
        if (parsed) ctx.min_level = *parsed;
        else std::cerr << "Ignoring unknown " << LOG_LEVEL_ENV << " value: " << lvl << "\n";
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_ctx = ctx;
}

void set_log_path(const std::string& path, const std::string& vault_dir) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
    if (!vault_dir.empty()) g_log_ctx.vault_dir = vault_dir;
}


// ---------------- Formatting ----------------
static const char* level_name(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    }
    return "UNKNOWN";
}

// one record per line, '|' separates fields
static std::string sanitize_field(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        if (c == '\n' || c == '\r' || c == '\t') r.push_back(' ');
        else if (c == '|') r.push_back('/');
        else r.push_back(c);
    }
    return r;
}

static std::string timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        return "0000-00-00 00:00:00";
    }
    return buf;
}


// ---------------- Writer ----------------
void log_event(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(lvl) < static_cast<int>(g_log_ctx.min_level)) return;

    // timestamp | level | user | ip | session | vault | event | outcome | message
    std::string line = timestamp_now();
    line += " | ";
    line += level_name(lvl);
    line += " | user=" + sanitize_field(g_log_ctx.user);
    line += " | ip=" + sanitize_field(g_log_ctx.ip);
    line += " | session=" + g_log_ctx.session;
    line += " | vault=" + sanitize_field(g_log_ctx.vault_dir);
    line += " | event=" + sanitize_field(event);
    line += " | outcome=" + sanitize_field(outcome);
    line += " | " + sanitize_field(entry);
    line += "\n";

    // no vault directory yet: never drop a file wherever we were started
    if (g_log_path.empty()) {
        std::fputs(line.c_str(), stderr);
        return;
    }
    const char* path = g_log_path.c_str();
    int fd = open(path, O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        std::fprintf(stderr, "[log-fail] %s", line.c_str());
        return;
    }
    if (fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        std::fprintf(stderr, "[log-warn] could not restrict %s: %s\n", path, strerror(errno));
    }

    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = write(fd, line.data() + off, line.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::fprintf(stderr, "[log-fail] %s", line.c_str() + off);
            break;
        }
        off += static_cast<size_t>(n);
    }
    if (fsync(fd) != 0) {
        std::fprintf(stderr, "[log-warn] fsync %s: %s\n", path, strerror(errno));
    }
    close(fd);
}
