#pragma once
#include "dycrypt.hpp"
#include <string>
#include <vector>
#include <cstdint>

// Text rendition of a CascadeResult:
//
//   ---
//   version: 1
//   type: dycrypt-envelope
//   salt1: <base64>
//   salt2: <base64>
//   iv1: <base64>
//   iv2: <base64>
//   authTag1: <base64>
//   authTag2: <base64>
//   ciphertext: <base64, literal block when longer than 64 chars>

namespace dycrypt {
namespace envelope {

static constexpr int  ENVELOPE_VERSION = 1;
static constexpr char ENVELOPE_TYPE[]  = "dycrypt-envelope";

std::string emit_yaml(const CascadeResult& data);

// Field lengths are not checked; CascadeCipher::decrypt and container::pack
// do that. Throws std::runtime_error on a malformed document.
CascadeResult parse_yaml(const std::string& text);

// True if bytes look like an emitted envelope rather than a binary container.
bool is_envelope(const std::vector<uint8_t>& bytes);

// Parses raw as an envelope or a binary container, whichever it is.
// Throws std::runtime_error or MalformedContainerError.
CascadeResult load(const std::vector<uint8_t>& raw);

// YAML report of the non-secret fields of raw, as printed by `dycrypt inspect`.
std::string describe(const std::string& file, const std::vector<uint8_t>& raw);

} // namespace envelope
} // namespace dycrypt
