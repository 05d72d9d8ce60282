#include "kdf.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/crypto.h>

namespace dycrypt {
namespace kdf {

static std::string last_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "scrypt failed";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

Key derive(const std::string& passphrase, const std::vector<uint8_t>& salt) {
    if (salt.size() != SALT_LEN)
        throw KeyDerivationError("salt must be " + std::to_string(SALT_LEN) +
                                 " bytes (got " + std::to_string(salt.size()) + ")");

    Key key{};
    if (EVP_PBE_scrypt(passphrase.data(), passphrase.size(),
                       salt.data(), salt.size(),
                       SCRYPT_N, SCRYPT_R, SCRYPT_P, SCRYPT_MAXMEM,
                       key.data(), key.size()) != 1) {
        wipe(key);
        throw KeyDerivationError(last_openssl_error());
    }
    return key;
}

void wipe(Key& key) {
    OPENSSL_cleanse(key.data(), key.size());
}

} // namespace kdf
} // namespace dycrypt
