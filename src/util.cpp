#include "util.hpp"

#include <array>


// ---------- SessionID ----------
std::string generate_session_id() {
    std::array<byte, 16> buf{};
    randombytes_buf(buf.data(), buf.size());

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(32);

    for (size_t i = 0; i < buf.size(); ++i) {
        out[2 * i] = hex[(buf[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[buf[i] & 0x0F];
    }
    return out;
}


// ---------- Status names ----------
const char* vault_status_str(VaultStatus st) {
    switch (st) {
    case VaultStatus::OK:                  return "OK";
    case VaultStatus::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
    case VaultStatus::DUPLICATE_ENTRY:     return "DUPLICATE_ENTRY";
    case VaultStatus::NOT_FOUND:           return "NOT_FOUND";
    case VaultStatus::INVALID_CREDENTIALS: return "INVALID_CREDENTIALS";
    case VaultStatus::UNINITIALIZED:       return "UNINITIALIZED";
    case VaultStatus::LOCKED:              return "LOCKED";
    case VaultStatus::STORAGE_ERROR:       return "STORAGE_ERROR";
    case VaultStatus::CRYPTO_ERROR:        return "CRYPTO_ERROR";
    case VaultStatus::IO_ERROR:            return "IO_ERROR";
    }
    return "UNKNOWN";
}


// ---------- Helpers: input validation ----------
bool contains_control_or_tab_or_null(const std::string& s) {
    for (unsigned char c : s) {
        if (c < 0x20 || c == 0x7f) return true; // tab, NUL, newlines and the rest
    }
    return false;
}

bool valid_title_or_username(const std::string& s) {
    if (s.empty()) return false;
    if (s.size() > MAX_TITLE_LEN) return false;
    if (contains_control_or_tab_or_null(s)) return false;

    // disallow whitespace-only
    if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); })) return false;
    return true;
}

bool valid_password(const std::string& s) {
    if (s.empty()) return false;
    if (s.size() > MAX_PASS_LEN) return false;
    return !contains_control_or_tab_or_null(s);
}

bool valid_url(const std::string& s) {
    if (s.size() > MAX_URL_LEN) return false;
    return !contains_control_or_tab_or_null(s);
}

size_t utf8_length(const byte* s, size_t len) {
    size_t n = 0;
    for (size_t i = 0; i < len; ++i) {
        if ((s[i] & 0xC0) != 0x80) ++n; // skip continuation bytes
    }
    return n;
}


// ---------- Secret hygiene ----------
void wipe_string(std::string& s) {
    if (!s.empty()) sodium_memzero(&s[0], s.size());
    s.clear();
}


// ---------- Input normalization ----------
void strip_cr(std::string& s) {
    if (!s.empty() && s.back() == '\r') s.pop_back();
}

void trim_spaces(std::string& s) {
    auto first = s.find_first_not_of(" \t");
    auto last = s.find_last_not_of(" \t");
    if (first == std::string::npos) { s.clear(); return; }
    s = s.substr(first, last - first + 1);
}

int parse_choice(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return -1;
    }
    if (s.size() > 4) return -1;
    return std::atoi(s.c_str());
}


// ---------- Menu ----------
void clear_screen() {
    // Clear visible screen and scrollback buffer
    std::cout << "\033[3J\033[2J\033[H";
}

void print_menu() {
    std::cout << "\n";
    std::cout << "keypass - Menu:\n";
    std::cout << "1) List titles\n";
    std::cout << "2) Show credentials for a title\n";
    std::cout << "3) Show one credential\n";
    std::cout << "4) Add credential\n";
    std::cout << "5) Update credential\n";
    std::cout << "6) Delete credential\n";
    std::cout << "7) Generate a password\n";
    std::cout << "8) Quit\n";
}
