#include "container.hpp"
#include <iostream>
#include <cstdio>
#include <string>

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

static std::vector<uint8_t> filled(size_t n, uint8_t start) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>(start + i);
    return v;
}

static dycrypt::CascadeResult sample(size_t payload_len) {
    dycrypt::CascadeResult r;
    r.salt1      = filled(16, 0x00);
    r.salt2      = filled(16, 0x10);
    r.iv1        = filled(12, 0x20);
    r.iv2        = filled(12, 0x30);
    r.tag1       = filled(16, 0x40);
    r.tag2       = filled(16, 0x50);
    r.ciphertext = filled(payload_len, 0x80);
    return r;
}

static bool same_fields(const dycrypt::CascadeResult& a,
                        const dycrypt::CascadeResult& b,
                        const std::string& ctx)
{
    bool ok = true;
    ok &= check(a.salt1 == b.salt1,           ctx + ": salt1 mismatch");
    ok &= check(a.salt2 == b.salt2,           ctx + ": salt2 mismatch");
    ok &= check(a.iv1   == b.iv1,             ctx + ": iv1 mismatch");
    ok &= check(a.iv2   == b.iv2,             ctx + ": iv2 mismatch");
    ok &= check(a.tag1  == b.tag1,            ctx + ": tag1 mismatch");
    ok &= check(a.tag2  == b.tag2,            ctx + ": tag2 mismatch");
    ok &= check(a.ciphertext == b.ciphertext, ctx + ": payload mismatch");
    return ok;
}

static bool test_layout() {
    auto r = sample(5);
    auto packed = dycrypt::container::pack(r);

    bool ok = check(packed.size() == 88 + 5, "packed size should be 93");
    if (!ok) return false;

    // Offsets are fixed: salt1@0 salt2@16 iv1@32 iv2@44 tag1@56 tag2@72 payload@88
    ok &= check(packed[0]  == 0x00, "salt1 not at offset 0");
    ok &= check(packed[16] == 0x10, "salt2 not at offset 16");
    ok &= check(packed[32] == 0x20, "iv1 not at offset 32");
    ok &= check(packed[43] == 0x2B, "iv1 should end at offset 44");
    ok &= check(packed[44] == 0x30, "iv2 not at offset 44");
    ok &= check(packed[56] == 0x40, "tag1 not at offset 56");
    ok &= check(packed[72] == 0x50, "tag2 not at offset 72");
    ok &= check(packed[87] == 0x5F, "tag2 should end at offset 88");
    ok &= check(packed[88] == 0x80, "payload not at offset 88");
    ok &= check(packed[92] == 0x84, "payload tail mismatch");
    return ok;
}

static bool test_round_trip() {
    bool ok = true;
    for (size_t len : {size_t(0), size_t(1), size_t(14), size_t(4096)}) {
        auto r = sample(len);
        auto packed = dycrypt::container::pack(r.salt1, r.salt2, r.iv1, r.iv2,
                                               r.tag1, r.tag2, r.ciphertext);
        ok &= check(packed.size() == dycrypt::HEADER_LEN + len,
                    "size mismatch for payload " + std::to_string(len));
        try {
            auto u = dycrypt::container::unpack(packed);
            ok &= same_fields(r, u, "payload " + std::to_string(len));
        } catch (const std::exception& e) {
            ok = fail("unpack threw for payload " + std::to_string(len) + ": " + e.what());
        }
    }
    return ok;
}

static bool test_empty_payload_header_only() {
    auto r = sample(0);
    auto packed = dycrypt::container::pack(r);
    bool ok = check(packed.size() == 88, "header-only container should be 88 bytes");
    auto u = dycrypt::container::unpack(packed);
    ok &= check(u.ciphertext.empty(), "payload should be empty");
    return ok;
}

static bool expect_validation(dycrypt::CascadeResult r, const std::string& field,
                              size_t actual)
{
    try {
        dycrypt::container::pack(r);
    } catch (const dycrypt::ValidationError& e) {
        bool ok = true;
        ok &= check(e.field() == field, "expected field " + field + ", got " + e.field());
        ok &= check(e.actual_length() == actual,
                    field + ": wrong actual length reported");
        std::string msg = e.what();
        ok &= check(msg.find(field) != std::string::npos,
                    field + ": message should name the field");
        ok &= check(msg.find(std::to_string(actual)) != std::string::npos,
                    field + ": message should carry the actual length");
        return ok;
    } catch (const std::exception& e) {
        return fail(field + ": wrong exception type: " + e.what());
    }
    return fail(field + ": pack accepted a bad length");
}

static bool test_validation() {
    bool ok = true;
    { auto r = sample(3); r.salt1.resize(15); ok &= expect_validation(r, "salt1", 15); }
    { auto r = sample(3); r.salt2.resize(17); ok &= expect_validation(r, "salt2", 17); }
    { auto r = sample(3); r.iv1.resize(16);   ok &= expect_validation(r, "iv1",   16); }
    { auto r = sample(3); r.iv2.clear();      ok &= expect_validation(r, "iv2",   0);  }
    { auto r = sample(3); r.tag1.resize(12);  ok &= expect_validation(r, "tag1",  12); }
    { auto r = sample(3); r.tag2.resize(32);  ok &= expect_validation(r, "tag2",  32); }
    return ok;
}

static bool test_malformed() {
    bool ok = true;
    for (size_t len : {size_t(0), size_t(50), size_t(87)}) {
        try {
            dycrypt::container::unpack(std::vector<uint8_t>(len, 0x11));
            ok = fail("unpack accepted " + std::to_string(len) + " bytes");
        } catch (const dycrypt::MalformedContainerError& e) {
            ok &= check(e.actual_length() == len, "wrong length in MalformedContainerError");
        } catch (const std::exception& e) {
            ok = fail(std::string("wrong exception type: ") + e.what());
        }
    }
    return ok;
}

static bool test_file_io() {
    std::string path = "test_container_io.dy";
    auto r = sample(33);
    bool ok = true;
    try {
        dycrypt::container::pack_to_file(r, path);
        auto u = dycrypt::container::unpack_from_file(path);
        ok &= same_fields(r, u, "file round trip");
    } catch (const std::exception& e) {
        ok = fail(std::string("file round trip threw: ") + e.what());
    }
    std::remove(path.c_str());

    try {
        dycrypt::container::unpack_from_file("does/not/exist.dy");
        ok = fail("unpack_from_file accepted a missing file");
    } catch (const std::runtime_error&) {
    }
    return ok;
}

int main() {
    bool ok = true;
    ok &= test_layout();
    ok &= test_round_trip();
    ok &= test_empty_payload_header_only();
    ok &= test_validation();
    ok &= test_malformed();
    ok &= test_file_io();

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
