#pragma once
#include "dycrypt.hpp"
#include "symmetric.hpp"
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace dycrypt {

// Two-layer cascade: the inner stage (layer 1) encrypts the plaintext, the
// outer stage (layer 2) encrypts the inner ciphertext. Each layer gets its
// own scrypt salt, key and nonce.
//
// The passphrase is a per-call argument; a CascadeCipher holds no secrets and
// its methods may be called concurrently.
class CascadeCipher {
public:
    // AES-256-GCM inside, ChaCha20-Poly1305 outside.
    CascadeCipher();
    CascadeCipher(std::unique_ptr<CipherStage> inner,
                  std::unique_ptr<CipherStage> outer);

    // Throws MessageTooLargeError past MAX_MESSAGE_LEN.
    CascadeResult encrypt(const std::string& passphrase,
                          const std::vector<uint8_t>& plaintext) const;

    // Reverses the outer layer first. Throws ValidationError on wrong field
    // sizes and AuthenticationError on any tag mismatch, without saying which
    // layer rejected it. Other stage failures surface as DecryptionError.
    std::vector<uint8_t> decrypt(const std::string& passphrase,
                                 const CascadeResult& data) const;

    const CipherStage& inner() const { return *inner_; }
    const CipherStage& outer() const { return *outer_; }

private:
    std::unique_ptr<CipherStage> inner_;
    std::unique_ptr<CipherStage> outer_;
};

} // namespace dycrypt
