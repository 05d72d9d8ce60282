#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <limits>

namespace dycrypt {

// Fixed sizes shared by both cascade layers.
static constexpr size_t SALT_LEN  = 16;   // scrypt salt, one per layer
static constexpr size_t KEY_LEN   = 32;   // 256-bit key for AES-256 and ChaCha20
static constexpr size_t NONCE_LEN = 12;   // 96-bit AEAD nonce
static constexpr size_t TAG_LEN   = 16;   // 128-bit AEAD tag

// Container header: salt1 | salt2 | iv1 | iv2 | tag1 | tag2
static constexpr size_t HEADER_LEN = 2 * SALT_LEN + 2 * NONCE_LEN + 2 * TAG_LEN;
static_assert(HEADER_LEN == 88, "container header layout mismatch");

// EVP update calls take an int length; larger messages are refused outright.
static constexpr size_t MAX_MESSAGE_LEN =
    static_cast<size_t>(std::numeric_limits<int>::max());

// Everything needed to reverse a cascade encryption.
// Layer 1 is the inner layer (applied first), layer 2 the outer one.
struct CascadeResult {
    std::vector<uint8_t> salt1;
    std::vector<uint8_t> salt2;
    std::vector<uint8_t> iv1;
    std::vector<uint8_t> iv2;
    std::vector<uint8_t> tag1;
    std::vector<uint8_t> tag2;
    std::vector<uint8_t> ciphertext;
};

// ── Errors ────────────────────────────────────────────────────────────────────

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A fixed-length field has the wrong size.
class ValidationError : public Error {
public:
    ValidationError(const std::string& field, size_t expected, size_t actual)
        : Error(field + " must be exactly " + std::to_string(expected) +
                " bytes (got " + std::to_string(actual) + ")"),
          field_(field), actual_(actual) {}

    const std::string& field() const { return field_; }
    size_t actual_length() const { return actual_; }

private:
    std::string field_;
    size_t      actual_;
};

// Input is too short to hold a container header.
class MalformedContainerError : public Error {
public:
    explicit MalformedContainerError(size_t actual)
        : Error("malformed container: minimum size " + std::to_string(HEADER_LEN) +
                " bytes (got " + std::to_string(actual) + ")"),
          actual_(actual) {}

    size_t actual_length() const { return actual_; }

private:
    size_t actual_;
};

// Tag verification failed. The message never says which layer rejected it.
class AuthenticationError : public Error {
public:
    AuthenticationError()
        : Error("authentication failed: wrong passphrase or corrupted data") {}
};

// Plaintext or ciphertext exceeds MAX_MESSAGE_LEN.
class MessageTooLargeError : public Error {
public:
    explicit MessageTooLargeError(size_t actual)
        : Error("message too large: limit " + std::to_string(MAX_MESSAGE_LEN) +
                " bytes (got " + std::to_string(actual) + ")"),
          actual_(actual) {}

    size_t actual_length() const { return actual_; }

private:
    size_t actual_;
};

// A cipher stage failed for a reason other than tag verification. Like
// AuthenticationError, the message does not name the layer.
class DecryptionError : public Error {
public:
    DecryptionError() : Error("decryption failed: cipher backend error") {}
};

class KeyDerivationError : public Error {
public:
    explicit KeyDerivationError(const std::string& what)
        : Error("key derivation failed: " + what) {}
};

// Throws ValidationError if data.size() != expected.
inline void require_length(const char* field,
                           const std::vector<uint8_t>& data,
                           size_t expected)
{
    if (data.size() != expected)
        throw ValidationError(field, expected, data.size());
}

// Throws MessageTooLargeError if data_len > MAX_MESSAGE_LEN.
inline void require_message_length(size_t data_len) {
    if (data_len > MAX_MESSAGE_LEN)
        throw MessageTooLargeError(data_len);
}

} // namespace dycrypt
