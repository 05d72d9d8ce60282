#pragma once
#include "dycrypt.hpp"
#include "kdf.hpp"
#include <memory>
#include <vector>
#include <cstdint>

namespace dycrypt {

struct Sealed {
    std::vector<uint8_t> ciphertext;   // same length as the input
    std::vector<uint8_t> tag;          // TAG_LEN bytes
};

static constexpr char AES_256_GCM_NAME[]       = "AES-256-GCM";
static constexpr char CHACHA20_POLY1305_NAME[] = "ChaCha20-Poly1305";

// One AEAD layer of the cascade. Associated data is always empty.
// Implementations hold no per-call state and may be shared across threads.
class CipherStage {
public:
    virtual ~CipherStage() = default;

    virtual const char* name() const = 0;

    // nonce must be NONCE_LEN bytes; plaintext at most MAX_MESSAGE_LEN.
    virtual Sealed encrypt(const kdf::Key& key,
                           const std::vector<uint8_t>& nonce,
                           const std::vector<uint8_t>& plaintext) const = 0;

    // Throws AuthenticationError if the tag does not verify; no plaintext is
    // returned in that case.
    virtual std::vector<uint8_t> decrypt(const kdf::Key& key,
                                         const std::vector<uint8_t>& nonce,
                                         const std::vector<uint8_t>& ciphertext,
                                         const std::vector<uint8_t>& tag) const = 0;
};

std::unique_ptr<CipherStage> make_aes256gcm_stage();
std::unique_ptr<CipherStage> make_chacha20poly1305_stage();

// Fills a buffer of n bytes from the OpenSSL CSPRNG.
std::vector<uint8_t> random_bytes(size_t n);

} // namespace dycrypt
