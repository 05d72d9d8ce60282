#include "symmetric.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <string>

namespace dycrypt {

std::vector<uint8_t> random_bytes(size_t n) {
    std::vector<uint8_t> out(n);
    if (n > 0 && RAND_bytes(out.data(), static_cast<int>(n)) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return out;
}

namespace {

// Both AES-256-GCM and ChaCha20-Poly1305 are driven through the same EVP
// AEAD controls; only the cipher and its display name differ.
class EvpAeadStage : public CipherStage {
public:
    EvpAeadStage(const char* name, const EVP_CIPHER* (*cipher)())
        : name_(name), cipher_(cipher) {}

    const char* name() const override { return name_; }

    Sealed encrypt(const kdf::Key& key,
                   const std::vector<uint8_t>& nonce,
                   const std::vector<uint8_t>& plaintext) const override;

    std::vector<uint8_t> decrypt(const kdf::Key& key,
                                 const std::vector<uint8_t>& nonce,
                                 const std::vector<uint8_t>& ciphertext,
                                 const std::vector<uint8_t>& tag) const override;

private:
    std::runtime_error failure(const char* step) const {
        return std::runtime_error(std::string(name_) + " " + step + " failed");
    }

    const char* name_;
    const EVP_CIPHER* (*cipher_)();
};

Sealed EvpAeadStage::encrypt(const kdf::Key& key,
                             const std::vector<uint8_t>& nonce,
                             const std::vector<uint8_t>& plaintext) const
{
    require_length("nonce", nonce, NONCE_LEN);
    require_message_length(plaintext.size());

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_EncryptInit_ex(ctx, cipher_(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_LEN, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
        cleanup(); throw failure("encrypt init");
    }

    Sealed out;
    out.ciphertext.resize(plaintext.size());
    int len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, out.ciphertext.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            cleanup(); throw failure("EncryptUpdate");
        }
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx, out.ciphertext.data() + len, &final_len) != 1) {
        cleanup(); throw failure("EncryptFinal");
    }
    out.ciphertext.resize(static_cast<size_t>(len + final_len));

    out.tag.resize(TAG_LEN);
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, TAG_LEN, out.tag.data()) != 1) {
        cleanup(); throw failure("GET_TAG");
    }
    cleanup();
    return out;
}

std::vector<uint8_t> EvpAeadStage::decrypt(const kdf::Key& key,
                                           const std::vector<uint8_t>& nonce,
                                           const std::vector<uint8_t>& ciphertext,
                                           const std::vector<uint8_t>& tag) const
{
    require_length("nonce", nonce, NONCE_LEN);
    require_message_length(ciphertext.size());
    if (tag.size() != TAG_LEN)
        throw AuthenticationError();

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    auto cleanup = [&]{ EVP_CIPHER_CTX_free(ctx); };

    if (EVP_DecryptInit_ex(ctx, cipher_(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_LEN, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
        cleanup(); throw failure("decrypt init");
    }

    std::vector<uint8_t> plaintext(ciphertext.size());
    int len = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx, plaintext.data(), &len,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            cleanup(); throw failure("DecryptUpdate");
        }
    }

    // Expected tag must be set before finalising
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, TAG_LEN,
                            const_cast<uint8_t*>(tag.data())) != 1) {
        cleanup(); throw failure("SET_TAG");
    }

    int final_len = 0;
    int rc = EVP_DecryptFinal_ex(ctx, plaintext.data() + len, &final_len);
    cleanup();

    if (rc != 1) {
        // Unauthenticated bytes must not leave this function.
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw AuthenticationError();
    }

    plaintext.resize(static_cast<size_t>(len + final_len));
    return plaintext;
}

} // namespace

std::unique_ptr<CipherStage> make_aes256gcm_stage() {
    return std::unique_ptr<CipherStage>(new EvpAeadStage(AES_256_GCM_NAME, EVP_aes_256_gcm));
}

std::unique_ptr<CipherStage> make_chacha20poly1305_stage() {
    return std::unique_ptr<CipherStage>(new EvpAeadStage(CHACHA20_POLY1305_NAME, EVP_chacha20_poly1305));
}

} // namespace dycrypt
