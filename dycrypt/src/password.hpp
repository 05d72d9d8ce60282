#pragma once
#include <string>
#include <unordered_map>
#include <cmath>
#include <iostream>
#include <istream>
#include <termios.h>
#include <unistd.h>
#include <openssl/crypto.h>

namespace dycrypt {

// Passphrases below this many bits (Shannon estimate) trigger a warning.
static const double PASSPHRASE_WARN_BITS = 80.0;

// Prompt for a passphrase with no echo (termios). Echo is only touched when
// reading std::cin from a terminal. Returns false if no line could be read
// (EOF or stream error); out is left empty in that case.
inline bool read_hidden(const std::string& prompt, std::string& out,
                        std::istream& in = std::cin)
{
    std::cerr << prompt << std::flush;

    struct termios old_term, new_term;
    bool tty = &in == &std::cin && tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (tty) {
        new_term = old_term;
        new_term.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    out.clear();
    bool got = static_cast<bool>(std::getline(in, out));
    if (!got) out.clear();

    if (tty) tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    std::cerr << "\n";
    return got;
}

// Total Shannon entropy of the passphrase in bits (per-char entropy x length).
inline double passphrase_entropy_bits(const std::string& pw) {
    if (pw.empty()) return 0.0;

    std::unordered_map<char, int> freq;
    for (char ch : pw) freq[ch]++;

    double entropy = 0.0;
    double len = static_cast<double>(pw.length());
    for (auto const& [ch, count] : freq) {
        double p = count / len;
        entropy -= p * std::log2(p);
    }
    return entropy * len;
}

inline void wipe_passphrase(std::string& pw) {
    if (!pw.empty()) OPENSSL_cleanse(&pw[0], pw.size());
    pw.clear();
}

} // namespace dycrypt
