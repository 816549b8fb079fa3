/**
 * @file nicephrase.hpp
 * @brief High-level nicephrase API.
 *
 * Convenience forms of encode(), decode() and generate() bound to the
 * embedded niceware dictionary. Using them requires linking the
 * nicephrase_wordlist library.
 *
 * @see https://github.com/diracdeltas/niceware Niceware
 */

#ifndef NICEPHRASE_HPP
#define NICEPHRASE_HPP

#include "codec.hpp"
#include "config.hpp"
#include "embedded.hpp"
#include "error.hpp"
#include "generate.hpp"
#include "wordlist.hpp"

namespace nicephrase {

/**
 * @brief Encode bytes with the embedded dictionary.
 *
 * @param data Input bytes
 * @param size Input size in bytes (must be even)
 * @param[out] words Passphrase, one word per 2 bytes
 * @return Error::Ok, Error::OddLength or Error::MalformedWordlist
 */
inline Error bytes_to_passphrase(const std::uint8_t* data, std::size_t size, Passphrase& words) {
    words.clear();
    const Wordlist* wordlist = nullptr;
    auto result = embedded_wordlist(wordlist);
    if (result != Error::Ok) {
        return result;
    }
    return encode(*wordlist, data, size, words);
}

/**
 * @brief Decode a passphrase with the embedded dictionary.
 *
 * @param words Passphrase words (exact, lowercase)
 * @param[out] bytes Decoded bytes
 * @param[out] error_position Position of the first unknown word (may be null)
 * @return Error::Ok, Error::InvalidWord or Error::MalformedWordlist
 */
template <typename Words>
Error passphrase_to_bytes(const Words& words, std::vector<std::uint8_t>& bytes,
                          std::size_t* error_position = nullptr) {
    bytes.clear();
    const Wordlist* wordlist = nullptr;
    auto result = embedded_wordlist(wordlist);
    if (result != Error::Ok) {
        return result;
    }
    return decode(*wordlist, words, bytes, error_position);
}

/**
 * @brief Generate a random passphrase from the embedded dictionary.
 *
 * @param num_words Number of words (0 to MAX_PASSPHRASE_WORDS)
 * @param[out] words Generated passphrase
 * @return Error::Ok, Error::TooManyWords, Error::EntropyFailure or
 *         Error::MalformedWordlist
 */
inline Error generate_passphrase(std::size_t num_words, Passphrase& words) {
    words.clear();
    const Wordlist* wordlist = nullptr;
    auto result = embedded_wordlist(wordlist);
    if (result != Error::Ok) {
        return result;
    }
    return generate(*wordlist, num_words, words);
}

#if !NICEPHRASE_NO_EXCEPTIONS

inline Passphrase bytes_to_passphrase(const std::uint8_t* data, std::size_t size) {
    return to_passphrase(embedded_wordlist(), data, size);
}

inline Passphrase bytes_to_passphrase(const std::vector<std::uint8_t>& bytes) {
    return to_passphrase(embedded_wordlist(), bytes);
}

template <typename Words>
std::vector<std::uint8_t> passphrase_to_bytes(const Words& words) {
    return to_bytes(embedded_wordlist(), words);
}

inline Passphrase generate_passphrase(std::size_t num_words) {
    return generate_passphrase(embedded_wordlist(), num_words);
}

#endif // !NICEPHRASE_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace nicephrase

#endif // NICEPHRASE_HPP
