#include "base64.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace dycrypt {

std::string base64_encode(const std::vector<uint8_t>& data) {
    // EVP_EncodeBlock output: ceil(n/3)*4 bytes + null terminator
    std::vector<unsigned char> out((data.size() + 2) / 3 * 4 + 1);
    int len = EVP_EncodeBlock(out.data(), data.data(), static_cast<int>(data.size()));
    return std::string(reinterpret_cast<char*>(out.data()), static_cast<size_t>(len));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t')
            clean += c;
    }
    if (clean.empty()) return {};
    if (clean.size() % 4 != 0)
        throw std::invalid_argument("Invalid base64 length");

    // Padding is at most two '=' and only at the very end
    size_t pad = 0;
    while (pad < clean.size() && clean[clean.size() - 1 - pad] == '=') ++pad;
    if (pad > 2)
        throw std::invalid_argument("Invalid base64 padding");
    if (clean.find('=') < clean.size() - pad)
        throw std::invalid_argument("Invalid base64 padding");

    std::vector<uint8_t> out(clean.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(clean.data()),
                              static_cast<int>(clean.size()));
    if (len < 0 || static_cast<size_t>(len) < pad)
        throw std::invalid_argument("Invalid base64 character");

    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(len) - pad);
    return out;
}

} // namespace dycrypt
