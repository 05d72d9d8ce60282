#include "dycrypt.hpp"
#include "cascade.hpp"
#include "container.hpp"
#include "envelope_yaml.hpp"
#include "password.hpp"
#include <iostream>
#include <iomanip>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

// ── Exit codes ────────────────────────────────────────────────────────────────
static const int EXIT_OK      = 0;
static const int EXIT_USAGE   = 1;
static const int EXIT_CRYPTO  = 2;
static const int EXIT_IO      = 3;

// ── Usage ─────────────────────────────────────────────────────────────────────
static void print_usage(const char* prog) {
    std::cerr <<
        "Usage: " << prog << " <command> [options]\n"
        "\n"
        "Commands:\n"
        "  encrypt   Encrypt a file (scrypt + AES-256-GCM + ChaCha20-Poly1305)\n"
        "  decrypt   Decrypt a .dy container or a YAML envelope\n"
        "  inspect   Print the header of a container or envelope as YAML\n"
        "\n"
        "Options:\n"
        "  --in      <file>        Input plaintext, container or envelope\n"
        "  --out     <file>        Output file (default: stdout)\n"
        "  --format  <bin|yaml>    encrypt output format (default: bin)\n"
        "\n"
        "Examples:\n"
        "  " << prog << " encrypt --in notes.txt --out notes.dy       (prompts for passphrase)\n"
        "  " << prog << " encrypt --in notes.txt --format yaml --out notes.yaml\n"
        "  " << prog << " decrypt --in notes.dy --out notes.txt\n"
        "  " << prog << " inspect --in notes.dy\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto, 3=I/O\n";
}

// ── Argument parser ───────────────────────────────────────────────────────────
struct Args {
    std::string command;
    std::string in_file, out_file;
    bool        yaml = false;
};

static bool parse_args(int argc, char** argv, Args& args, const char* prog) {
    if (argc < 2) {
        print_usage(prog);
        return false;
    }
    args.command = argv[1];
    if (args.command == "--help" || args.command == "-h") {
        print_usage(prog);
        return false;
    }
    if (args.command != "encrypt" &&
        args.command != "decrypt" &&
        args.command != "inspect") {
        std::cerr << "Unknown command: " << args.command << "\n\n";
        print_usage(prog);
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string opt = argv[i];
        auto need_val = [&]() -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Option " << opt << " requires a value\n";
                return false;
            }
            return true;
        };

        if (opt == "--in") {
            if (!need_val()) return false;
            args.in_file = argv[++i];
        } else if (opt == "--out") {
            if (!need_val()) return false;
            args.out_file = argv[++i];
        } else if (opt == "--format") {
            if (!need_val()) return false;
            std::string fmt = argv[++i];
            if (fmt == "yaml") {
                args.yaml = true;
            } else if (fmt == "bin") {
                args.yaml = false;
            } else {
                std::cerr << "Invalid format: " << fmt << " (must be bin or yaml)\n";
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << opt << "\n\n";
            print_usage(prog);
            return false;
        }
    }

    if (args.in_file.empty()) {
        std::cerr << args.command << " requires --in\n";
        return false;
    }
    return true;
}

// ── File helpers ──────────────────────────────────────────────────────────────
static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("cannot open input file: " + path);
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)),
                              std::istreambuf_iterator<char>());
    if (!f && !f.eof())
        throw std::runtime_error("read error on " + path);
    return data;
}

static void write_output(const std::string& path, const std::vector<uint8_t>& data) {
    if (path.empty()) {
        std::cout.write(reinterpret_cast<const char*>(data.data()),
                        static_cast<std::streamsize>(data.size()));
        std::cout.flush();
        if (!std::cout) throw std::runtime_error("write error on stdout");
        return;
    }
    std::ofstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("cannot open output file: " + path);
    f.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
    if (!f)
        throw std::runtime_error("write error on " + path);
}

// ── Commands ──────────────────────────────────────────────────────────────────
static int cmd_encrypt(const Args& args) {
    std::vector<uint8_t> plaintext;
    try {
        plaintext = read_file(args.in_file);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    std::string passphrase, confirm;
    if (!dycrypt::read_hidden("Enter passphrase: ", passphrase) ||
        !dycrypt::read_hidden("Confirm passphrase: ", confirm)) {
        dycrypt::wipe_passphrase(passphrase);
        dycrypt::wipe_passphrase(confirm);
        std::cerr << "Error: no passphrase read (end of input)\n";
        return EXIT_USAGE;
    }
    bool same = passphrase == confirm;
    dycrypt::wipe_passphrase(confirm);
    if (!same) {
        dycrypt::wipe_passphrase(passphrase);
        std::cerr << "Error: passphrases do not match\n";
        return EXIT_USAGE;
    }

    double bits = dycrypt::passphrase_entropy_bits(passphrase);
    if (bits < dycrypt::PASSPHRASE_WARN_BITS) {
        std::cerr << std::fixed << std::setprecision(2)
                  << "Warning: low passphrase entropy (" << bits << " bits; "
                  << dycrypt::PASSPHRASE_WARN_BITS << " recommended)\n";
    }

    dycrypt::CascadeResult result;
    try {
        dycrypt::CascadeCipher cipher;
        result = cipher.encrypt(passphrase, plaintext);
    } catch (const std::exception& e) {
        dycrypt::wipe_passphrase(passphrase);
        std::cerr << "Crypto error: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }
    dycrypt::wipe_passphrase(passphrase);

    std::vector<uint8_t> out;
    try {
        if (args.yaml) {
            std::string text = dycrypt::envelope::emit_yaml(result);
            out.assign(text.begin(), text.end());
        } else {
            out = dycrypt::container::pack(result);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }

    try {
        write_output(args.out_file, out);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    if (!args.out_file.empty()) {
        std::cout << "Encrypted\n"
                  << "  Input:  " << args.in_file  << " (" << plaintext.size() << " bytes)\n"
                  << "  Output: " << args.out_file << " (" << out.size() << " bytes)\n";
    }
    return EXIT_OK;
}

static int cmd_decrypt(const Args& args) {
    std::vector<uint8_t> raw;
    try {
        raw = read_file(args.in_file);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    dycrypt::CascadeResult data;
    try {
        data = dycrypt::envelope::load(raw);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_IO;
    }

    std::string passphrase;
    if (!dycrypt::read_hidden("Enter passphrase: ", passphrase)) {
        std::cerr << "Error: no passphrase read (end of input)\n";
        return EXIT_USAGE;
    }

    std::vector<uint8_t> plaintext;
    try {
        dycrypt::CascadeCipher cipher;
        plaintext = cipher.decrypt(passphrase, data);
    } catch (const dycrypt::AuthenticationError& e) {
        dycrypt::wipe_passphrase(passphrase);
        std::cerr << "Error: " << e.what() << "\n"
                  << "Possible causes:\n"
                  << "  - wrong passphrase\n"
                  << "  - corrupted file\n"
                  << "  - file was modified\n";
        return EXIT_CRYPTO;
    } catch (const std::exception& e) {
        dycrypt::wipe_passphrase(passphrase);
        std::cerr << "Crypto error: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }
    dycrypt::wipe_passphrase(passphrase);

    try {
        write_output(args.out_file, plaintext);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    if (!args.out_file.empty()) {
        std::cout << "Decrypted\n"
                  << "  Input:  " << args.in_file  << "\n"
                  << "  Output: " << args.out_file << " (" << plaintext.size() << " bytes)\n";
    }
    return EXIT_OK;
}

static int cmd_inspect(const Args& args) {
    std::vector<uint8_t> raw;
    try {
        raw = read_file(args.in_file);
    } catch (const std::exception& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
        return EXIT_IO;
    }

    try {
        std::cout << dycrypt::envelope::describe(args.in_file, raw);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_IO;
    }
    return EXIT_OK;
}

// ── main ──────────────────────────────────────────────────────────────────────
int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args, argv[0]))
        return EXIT_USAGE;

    if (args.command == "encrypt") return cmd_encrypt(args);
    if (args.command == "decrypt") return cmd_decrypt(args);
    if (args.command == "inspect") return cmd_inspect(args);

    // Should be unreachable
    return EXIT_USAGE;
}
