#include "password_generator.hpp"
#include "logging.hpp"

const std::string& password_alphabet() {
    static const std::string alphabet = [] {
        std::string s;
        for (int c = 0x21; c < 0x7f; ++c) { // printable, no space
            if (c != '\\') s.push_back(static_cast<char>(c));
        }
        return s;
    }();
    return alphabet;
}

VaultStatus generate_password(std::string& out, int length) {
    out.clear();
    if (length <= 0 || static_cast<size_t>(length) > MAX_PASS_LEN) {
        log_event(LogLevel::WARN,
            "generate_password: invalid length " + std::to_string(length),
            "generator",
            "failure");
        return VaultStatus::INVALID_ARGUMENT;
    }

    const std::string& alphabet = password_alphabet();
    const uint32_t n = static_cast<uint32_t>(alphabet.size());

    out.resize(static_cast<size_t>(length));
    for (char& c : out) {
        c = alphabet[randombytes_uniform(n)]; // rejection-sampled, no modulo bias
    }
    return VaultStatus::OK;
}
