#include "container.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace dycrypt {
namespace container {

// ── pack ──────────────────────────────────────────────────────────────────────

std::vector<uint8_t> pack(const std::vector<uint8_t>& salt1,
                          const std::vector<uint8_t>& salt2,
                          const std::vector<uint8_t>& iv1,
                          const std::vector<uint8_t>& iv2,
                          const std::vector<uint8_t>& tag1,
                          const std::vector<uint8_t>& tag2,
                          const std::vector<uint8_t>& payload)
{
    require_length("salt1", salt1, SALT_LEN);
    require_length("salt2", salt2, SALT_LEN);
    require_length("iv1",   iv1,   NONCE_LEN);
    require_length("iv2",   iv2,   NONCE_LEN);
    require_length("tag1",  tag1,  TAG_LEN);
    require_length("tag2",  tag2,  TAG_LEN);

    std::vector<uint8_t> out;
    out.reserve(HEADER_LEN + payload.size());
    out.insert(out.end(), salt1.begin(),   salt1.end());
    out.insert(out.end(), salt2.begin(),   salt2.end());
    out.insert(out.end(), iv1.begin(),     iv1.end());
    out.insert(out.end(), iv2.begin(),     iv2.end());
    out.insert(out.end(), tag1.begin(),    tag1.end());
    out.insert(out.end(), tag2.begin(),    tag2.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::vector<uint8_t> pack(const CascadeResult& data) {
    return pack(data.salt1, data.salt2, data.iv1, data.iv2,
                data.tag1, data.tag2, data.ciphertext);
}

// ── unpack ────────────────────────────────────────────────────────────────────

CascadeResult unpack(const std::vector<uint8_t>& data) {
    if (data.size() < HEADER_LEN)
        throw MalformedContainerError(data.size());

    auto p = data.begin();
    auto take = [&p](size_t n) {
        std::vector<uint8_t> field(p, p + static_cast<std::ptrdiff_t>(n));
        p += static_cast<std::ptrdiff_t>(n);
        return field;
    };

    CascadeResult out;
    out.salt1 = take(SALT_LEN);
    out.salt2 = take(SALT_LEN);
    out.iv1   = take(NONCE_LEN);
    out.iv2   = take(NONCE_LEN);
    out.tag1  = take(TAG_LEN);
    out.tag2  = take(TAG_LEN);
    out.ciphertext.assign(p, data.end());
    return out;
}

// ── file I/O ──────────────────────────────────────────────────────────────────

void pack_to_file(const CascadeResult& data, const std::string& path) {
    auto bytes = pack(data);
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("pack_to_file: cannot open " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("pack_to_file: write error on " + path);
}

CascadeResult unpack_from_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("unpack_from_file: cannot open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (!f && !f.eof())
        throw std::runtime_error("unpack_from_file: read error on " + path);
    return unpack(bytes);
}

} // namespace container
} // namespace dycrypt
