#pragma once
#include "dycrypt.hpp"
#include <array>
#include <string>
#include <vector>
#include <cstdint>

namespace dycrypt {
namespace kdf {

// scrypt cost parameters. Not stored in the container: changing any of these
// makes previously written containers undecryptable.
static constexpr uint64_t SCRYPT_N      = 1ull << 14;
static constexpr uint64_t SCRYPT_R      = 8;
static constexpr uint64_t SCRYPT_P      = 1;
static constexpr uint64_t SCRYPT_MAXMEM = 32ull * 1024 * 1024;

using Key = std::array<uint8_t, KEY_LEN>;

// scrypt: passphrase x salt(16 B) -> key(32 B).
// Deterministic. Throws KeyDerivationError if salt is not SALT_LEN bytes or
// if OpenSSL cannot complete the derivation.
Key derive(const std::string& passphrase, const std::vector<uint8_t>& salt);

// Overwrites key material in place.
void wipe(Key& key);

} // namespace kdf
} // namespace dycrypt
