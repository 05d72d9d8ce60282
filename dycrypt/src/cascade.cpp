#include "cascade.hpp"
#include "kdf.hpp"
#include <stdexcept>
#include <utility>

namespace dycrypt {

namespace {

// Derived key that is wiped when it goes out of scope, on every exit path.
struct ScopedKey {
    kdf::Key key;

    ScopedKey(const std::string& passphrase, const std::vector<uint8_t>& salt)
        : key(kdf::derive(passphrase, salt)) {}
    ~ScopedKey() { kdf::wipe(key); }

    ScopedKey(const ScopedKey&) = delete;
    ScopedKey& operator=(const ScopedKey&) = delete;
};

} // namespace

CascadeCipher::CascadeCipher()
    : CascadeCipher(make_aes256gcm_stage(), make_chacha20poly1305_stage()) {}

CascadeCipher::CascadeCipher(std::unique_ptr<CipherStage> inner,
                             std::unique_ptr<CipherStage> outer)
    : inner_(std::move(inner)), outer_(std::move(outer))
{
    if (!inner_ || !outer_)
        throw std::invalid_argument("CascadeCipher: both stages are required");
}

CascadeResult CascadeCipher::encrypt(const std::string& passphrase,
                                     const std::vector<uint8_t>& plaintext) const
{
    require_message_length(plaintext.size());

    CascadeResult out;

    // ── Layer 1 ───────────────────────────────────────────────────────────────
    out.salt1 = random_bytes(SALT_LEN);
    Sealed layer1;
    {
        ScopedKey key1(passphrase, out.salt1);
        out.iv1 = random_bytes(NONCE_LEN);
        layer1 = inner_->encrypt(key1.key, out.iv1, plaintext);
    }
    out.tag1 = std::move(layer1.tag);

    // ── Layer 2 ───────────────────────────────────────────────────────────────
    out.salt2 = random_bytes(SALT_LEN);
    {
        ScopedKey key2(passphrase, out.salt2);
        out.iv2 = random_bytes(NONCE_LEN);
        Sealed layer2 = outer_->encrypt(key2.key, out.iv2, layer1.ciphertext);
        out.tag2       = std::move(layer2.tag);
        out.ciphertext = std::move(layer2.ciphertext);
    }

    return out;
}

std::vector<uint8_t> CascadeCipher::decrypt(const std::string& passphrase,
                                            const CascadeResult& data) const
{
    require_length("salt1", data.salt1, SALT_LEN);
    require_length("salt2", data.salt2, SALT_LEN);
    require_length("iv1",   data.iv1,   NONCE_LEN);
    require_length("iv2",   data.iv2,   NONCE_LEN);
    require_length("tag1",  data.tag1,  TAG_LEN);
    require_length("tag2",  data.tag2,  TAG_LEN);
    require_message_length(data.ciphertext.size());

    // Both layers report through the same errors; any layer specific detail
    // is dropped here.
    try {
        std::vector<uint8_t> inner_ct;
        {
            ScopedKey key2(passphrase, data.salt2);
            inner_ct = outer_->decrypt(key2.key, data.iv2, data.ciphertext, data.tag2);
        }

        ScopedKey key1(passphrase, data.salt1);
        return inner_->decrypt(key1.key, data.iv1, inner_ct, data.tag1);
    } catch (const KeyDerivationError&) {
        throw;
    } catch (const AuthenticationError&) {
        throw AuthenticationError();
    } catch (const std::runtime_error&) {
        throw DecryptionError();
    }
}

} // namespace dycrypt
