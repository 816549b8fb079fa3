/**
 * @file cli.cpp
 * @brief nicephrase command line interface.
 *
 * Generates niceware passphrases and converts between hex bytes and
 * passphrases. Tokenizing and case folding of passphrase input happen
 * here, not in the library.
 */

#include <nicephrase/nicephrase.hpp>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace nicephrase;

static void print_version() {
    std::printf("nicephrase %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nniceware passphrases (v%s C++)\n", version());
    std::printf("==============================\n\n");
    std::printf("Each word encodes 16 bits: a 128-bit key is an 8-word passphrase.\n\n");
    std::printf("References:\n");
    std::printf("  niceware: https://github.com/diracdeltas/niceware\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] -g <num_words>\n", prog_name);
    std::printf("  %s [options] -e <hex>\n", prog_name);
    std::printf("  %s [options] -d <word> [<word> ...]\n\n", prog_name);
    std::printf("Commands:\n");
    std::printf("  -g             Generate a random passphrase (0-%zu words)\n",
                MAX_PASSPHRASE_WORDS);
    std::printf("  -e             Encode hex bytes (even number of bytes) as words\n");
    std::printf("  -d             Decode words to hex bytes\n\n");
    std::printf("Options:\n");
    std::printf("  -w <file>      Use wordlist file (one word per line) instead of the\n");
    std::printf("                 embedded dictionary\n");
    std::printf("  -i             Ignore case of words when decoding\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s -g 8                                 # 128-bit passphrase\n", prog_name);
    std::printf("  %s -e 0000ffff                          # encode\n", prog_name);
    std::printf("  %s -d \"bacca cavort west volley\"        # decode\n\n", prog_name);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

static bool parse_hex(const char* hex, std::vector<std::uint8_t>& bytes) {
    std::size_t len = std::strlen(hex);
    if ((len % 2) != 0) {
        return false;
    }

    bytes.clear();
    bytes.reserve(len / 2);
    for (std::size_t i = 0; i < len; i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return true;
}

static void print_passphrase(const Passphrase& words) {
    for (std::size_t i = 0; i < words.size(); ++i) {
        std::printf("%s%.*s", (i == 0) ? "" : " ", static_cast<int>(words[i].size()),
                    words[i].data());
    }
    std::printf("\n");
}

// Split every argument on ASCII whitespace so a quoted phrase works too
static std::vector<std::string> tokenize(char** args, int count, bool fold_case) {
    std::vector<std::string> tokens;
    for (int i = 0; i < count; ++i) {
        std::string current;
        for (const char* p = args[i]; *p != '\0'; ++p) {
            auto c = static_cast<unsigned char>(*p);
            if (std::isspace(c) != 0) {
                if (!current.empty()) {
                    tokens.push_back(std::move(current));
                    current.clear();
                }
                continue;
            }
            current.push_back(fold_case ? static_cast<char>(std::tolower(c)) : *p);
        }
        if (!current.empty()) {
            tokens.push_back(std::move(current));
        }
    }
    return tokens;
}

static int do_generate(const Wordlist& wordlist, const char* count_arg) {
    char* end = nullptr;
    long num_words = std::strtol(count_arg, &end, 10);
    if (end == count_arg || *end != '\0' || num_words < 0) {
        std::fprintf(stderr, "Error: Invalid word count: %s\n", count_arg);
        return 1;
    }

    Passphrase words;
    auto result = generate(wordlist, static_cast<std::size_t>(num_words), words);
    if (result == Error::TooManyWords) {
        std::fprintf(stderr, "Error: number of words %ld cannot be greater than %zu\n",
                     num_words, MAX_PASSPHRASE_WORDS);
        return 1;
    }
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    print_passphrase(words);
    return 0;
}

static int do_encode(const Wordlist& wordlist, const char* hex) {
    std::vector<std::uint8_t> bytes;
    if (!parse_hex(hex, bytes)) {
        std::fprintf(stderr, "Error: Invalid hex input: %s\n", hex);
        return 1;
    }

    Passphrase words;
    auto result = encode(wordlist, bytes, words);
    if (result == Error::OddLength) {
        std::fprintf(stderr, "Error: odd size not supported: %zu\n", bytes.size());
        return 1;
    }
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    print_passphrase(words);
    return 0;
}

static int do_decode(const Wordlist& wordlist, const std::vector<std::string>& tokens) {
    std::vector<std::uint8_t> bytes;
    std::size_t position = 0;

    auto result = decode(wordlist, tokens, bytes, &position);
    if (result == Error::InvalidWord) {
        std::fprintf(stderr, "Error: unknown word: %s at position %zu\n",
                     tokens[position].c_str(), position);
        return 1;
    }
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    for (std::uint8_t b : bytes) {
        std::printf("%02x", static_cast<unsigned>(b));
    }
    std::printf("\n");
    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    const char* wordlist_path = nullptr;
    bool fold_case = false;
    int arg = 1;

    // Options come before the command
    while (arg < argc) {
        if (std::strcmp(argv[arg], "-w") == 0) {
            if (arg + 1 >= argc) {
                std::fprintf(stderr, "Error: -w requires a file argument\n");
                return 1;
            }
            wordlist_path = argv[arg + 1];
            arg += 2;
        } else if (std::strcmp(argv[arg], "-i") == 0) {
            fold_case = true;
            ++arg;
        } else {
            break;
        }
    }

    if (arg >= argc) {
        std::fprintf(stderr, "Error: Missing command (-g, -e or -d)\n");
        std::fprintf(stderr, "Usage: %s [options] -g|-e|-d ...\n", argv[0]);
        return 1;
    }

    // Resolve the wordlist
    std::optional<Wordlist> loaded;
    const Wordlist* wordlist = nullptr;
    if (wordlist_path != nullptr) {
        Error result = Error::Ok;
        try {
            result = Wordlist::load(wordlist_path, loaded);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "Error: %s: %s\n", wordlist_path, e.what());
            return 1;
        }
        if (result == Error::ReadFailure) {
            std::fprintf(stderr, "Error: Cannot read wordlist file: %s\n", wordlist_path);
            return 1;
        }
        if (result != Error::Ok) {
            std::fprintf(stderr, "Error: %s: expected %zu unique words, one per line\n",
                         wordlist_path, WORDLIST_SIZE);
            return 1;
        }
        wordlist = &*loaded;
    } else {
        auto result = embedded_wordlist(wordlist);
        if (result != Error::Ok) {
            std::fprintf(stderr, "Error: Embedded wordlist: %s\n", error_string(result));
            return 1;
        }
    }

    const char* command = argv[arg];
    int remaining = argc - arg - 1;

    if (std::strcmp(command, "-g") == 0) {
        if (remaining != 1) {
            std::fprintf(stderr, "Error: Generate requires 1 argument after -g\n");
            std::fprintf(stderr, "Usage: %s [options] -g <num_words>\n", argv[0]);
            return 1;
        }
        return do_generate(*wordlist, argv[arg + 1]);
    }

    if (std::strcmp(command, "-e") == 0) {
        if (remaining != 1) {
            std::fprintf(stderr, "Error: Encode requires 1 argument after -e\n");
            std::fprintf(stderr, "Usage: %s [options] -e <hex>\n", argv[0]);
            return 1;
        }
        return do_encode(*wordlist, argv[arg + 1]);
    }

    if (std::strcmp(command, "-d") == 0) {
        if (remaining < 1) {
            std::fprintf(stderr, "Error: Decode requires at least 1 word after -d\n");
            std::fprintf(stderr, "Usage: %s [options] -d <word> [<word> ...]\n", argv[0]);
            return 1;
        }
        return do_decode(*wordlist, tokenize(&argv[arg + 1], remaining, fold_case));
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", command);
    return 1;
}
