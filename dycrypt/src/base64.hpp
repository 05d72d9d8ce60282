#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace dycrypt {

// Standard alphabet with '=' padding, no line breaks.
std::string base64_encode(const std::vector<uint8_t>& data);

// Ignores embedded whitespace and line breaks.
// Throws std::invalid_argument on malformed input.
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace dycrypt
