#include "password.hpp"
#include <iostream>
#include <sstream>
#include <string>

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

static bool test_read_hidden() {
    bool ok = true;
    std::string pw = "stale";

    // Closed input: no passphrase, and nothing left over from before
    std::istringstream empty("");
    ok &= check(!dycrypt::read_hidden("pw: ", pw, empty), "EOF should report failure");
    ok &= check(pw.empty(), "EOF should leave the passphrase empty");

    // Two prompts on one stream; the second hits EOF
    std::istringstream one_line("CorrectHorseBatteryStaple\n");
    std::string first, second;
    ok &= check(dycrypt::read_hidden("pw: ", first, one_line), "first line should read");
    ok &= check(first == "CorrectHorseBatteryStaple", "first line content");
    ok &= check(!dycrypt::read_hidden("confirm: ", second, one_line),
                "confirmation at EOF should report failure");

    // An explicit empty line is a real (empty) answer
    std::istringstream blank("\n");
    ok &= check(dycrypt::read_hidden("pw: ", pw, blank), "blank line should read");
    ok &= check(pw.empty(), "blank line gives an empty passphrase");

    // Last line without a trailing newline still counts
    std::istringstream unterminated("tail");
    ok &= check(dycrypt::read_hidden("pw: ", pw, unterminated), "unterminated line should read");
    ok &= check(pw == "tail", "unterminated line content");
    return ok;
}

static bool test_entropy_and_wipe() {
    bool ok = true;
    ok &= check(dycrypt::passphrase_entropy_bits("") == 0.0, "empty passphrase has no entropy");
    ok &= check(dycrypt::passphrase_entropy_bits("aaaaaaaa") == 0.0,
                "a single repeated character has no entropy");
    // 16 distinct characters: 4 bits each
    double bits = dycrypt::passphrase_entropy_bits("abcdefghijklmnop");
    ok &= check(bits > 63.99 && bits < 64.01, "16 distinct chars should give 64 bits");
    ok &= check(bits < dycrypt::PASSPHRASE_WARN_BITS, "64 bits is below the warning threshold");

    std::string pw = "secret";
    dycrypt::wipe_passphrase(pw);
    ok &= check(pw.empty(), "wipe_passphrase should clear the string");
    return ok;
}

int main() {
    bool ok = true;
    ok &= test_read_hidden();
    ok &= test_entropy_and_wipe();

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
