#pragma once
#include "keypass_common.hpp"

// ASCII letters, digits and punctuation without '\\'
const std::string& password_alphabet();

// Fills |out| with |length| characters drawn uniformly from password_alphabet()
// using libsodium's CSPRNG. INVALID_ARGUMENT for length <= 0 or > MAX_PASS_LEN.
VaultStatus generate_password(std::string& out, int length = DEFAULT_GENERATED_LEN);
