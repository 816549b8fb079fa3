/**
 * @file codec.hpp
 * @brief Byte buffer <-> passphrase conversion.
 *
 * Base-65536 positional encoding, most significant byte first:
 * - encode: bytes (b0 b1)(b2 b3)... -> word_at(b0 * 256 + b1), ...
 * - decode: words w0 w1 ...          -> index(w0) / 256, index(w0) % 256, ...
 *
 * Both directions are all-or-nothing: on failure the output is left empty.
 */

#ifndef NICEPHRASE_CODEC_HPP
#define NICEPHRASE_CODEC_HPP

#include <iterator>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "wordlist.hpp"

namespace nicephrase {

/// Encoded passphrase; views point into the Wordlist that produced them.
using Passphrase = std::vector<std::string_view>;

/**
 * @brief Encode bytes as dictionary words.
 *
 * @param wordlist Dictionary to draw words from
 * @param data Input bytes (may be null when size is 0)
 * @param size Input size in bytes (must be even)
 * @param[out] words size / 2 words, in input order
 * @return Error::Ok, or Error::OddLength (no padding is applied)
 */
Error encode(const Wordlist& wordlist, const std::uint8_t* data, std::size_t size,
             Passphrase& words);

inline Error encode(const Wordlist& wordlist, const std::vector<std::uint8_t>& bytes,
                    Passphrase& words) {
    return encode(wordlist, bytes.data(), bytes.size(), words);
}

/**
 * @brief Decode dictionary words back into bytes.
 *
 * Matching is exact and case-sensitive; tokenizing and any normalization
 * are up to the caller.
 *
 * @tparam Words Sized range of string-like values
 * @param wordlist Dictionary the words were drawn from
 * @param words Passphrase words
 * @param[out] bytes 2 bytes per word, high byte first
 * @param[out] error_position Zero-based position of the first unknown word
 *             (written only on Error::InvalidWord, may be null)
 * @return Error::Ok, or Error::InvalidWord
 */
template <typename Words>
Error decode(const Wordlist& wordlist, const Words& words, std::vector<std::uint8_t>& bytes,
             std::size_t* error_position = nullptr) {
    bytes.clear();

    std::vector<std::uint8_t> output;
    output.reserve(std::size(words) * BYTES_PER_WORD);

    std::size_t position = 0;
    for (const auto& word : words) {
        auto index = wordlist.find(std::string_view(word));
        if (!index) [[unlikely]] {
            if (error_position != nullptr) {
                *error_position = position;
            }
            return Error::InvalidWord;
        }

        output.push_back(static_cast<std::uint8_t>(*index >> 8));
        output.push_back(static_cast<std::uint8_t>(*index & 0xFFU));
        ++position;
    }

    bytes = std::move(output);
    return Error::Ok;
}

#if !NICEPHRASE_NO_EXCEPTIONS

/**
 * @brief Throwing form of encode().
 * @throws OddLengthException
 */
Passphrase to_passphrase(const Wordlist& wordlist, const std::uint8_t* data, std::size_t size);

inline Passphrase to_passphrase(const Wordlist& wordlist, const std::vector<std::uint8_t>& bytes) {
    return to_passphrase(wordlist, bytes.data(), bytes.size());
}

/**
 * @brief Throwing form of decode().
 * @throws InvalidWordException carrying the first unknown word and its position
 */
template <typename Words>
std::vector<std::uint8_t> to_bytes(const Wordlist& wordlist, const Words& words) {
    std::vector<std::uint8_t> bytes;
    std::size_t position = 0;

    if (decode(wordlist, words, bytes, &position) != Error::Ok) {
        auto it = std::begin(words);
        std::advance(it, static_cast<std::ptrdiff_t>(position));
        throw InvalidWordException(position, std::string_view(*it));
    }

    return bytes;
}

#endif // !NICEPHRASE_NO_EXCEPTIONS

} // namespace nicephrase

#endif // NICEPHRASE_CODEC_HPP
