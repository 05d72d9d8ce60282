#pragma once
#include "dycrypt.hpp"
#include <vector>
#include <cstdint>
#include <string>

// Container format (binary, no magic, no version):
//
//   Offset  Size  Field
//   ------  ----  -----
//    0      16    salt1   scrypt salt, layer 1
//   16      16    salt2   scrypt salt, layer 2
//   32      12    iv1     AES-256-GCM nonce
//   44      12    iv2     ChaCha20-Poly1305 nonce
//   56      16    tag1    AES-256-GCM tag
//   72      16    tag2    ChaCha20-Poly1305 tag
//   88       N    payload (outer ciphertext, N >= 0)
//
// None of the header fields are secret.

namespace dycrypt {
namespace container {

// Throws ValidationError naming the first field with a wrong length.
std::vector<uint8_t> pack(const std::vector<uint8_t>& salt1,
                          const std::vector<uint8_t>& salt2,
                          const std::vector<uint8_t>& iv1,
                          const std::vector<uint8_t>& iv2,
                          const std::vector<uint8_t>& tag1,
                          const std::vector<uint8_t>& tag2,
                          const std::vector<uint8_t>& payload);

std::vector<uint8_t> pack(const CascadeResult& data);

// Structural split only; tags are checked by CascadeCipher::decrypt.
// Throws MalformedContainerError if data is shorter than HEADER_LEN.
CascadeResult unpack(const std::vector<uint8_t>& data);

void          pack_to_file(const CascadeResult& data, const std::string& path);
CascadeResult unpack_from_file(const std::string& path);

} // namespace container
} // namespace dycrypt
