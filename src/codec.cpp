/**
 * @file codec.cpp
 * @brief Byte buffer -> passphrase encoding.
 *
 * Decoding is a template over the word range type and lives in codec.hpp.
 */

#include <nicephrase/codec.hpp>

namespace nicephrase {

Error encode(const Wordlist& wordlist, const std::uint8_t* data, std::size_t size,
             Passphrase& words) {
    words.clear();

    if ((size % BYTES_PER_WORD) != 0) {
        return Error::OddLength;
    }

    Passphrase output;
    output.reserve(size / BYTES_PER_WORD);

    for (std::size_t i = 0; i < size; i += BYTES_PER_WORD) {
        // Big-endian: first byte of the pair is the high byte
        auto index = static_cast<index_t>((static_cast<unsigned>(data[i]) << 8U) |
                                          static_cast<unsigned>(data[i + 1]));
        output.push_back(wordlist.word_at(index));
    }

    words = std::move(output);
    return Error::Ok;
}

#if !NICEPHRASE_NO_EXCEPTIONS

Passphrase to_passphrase(const Wordlist& wordlist, const std::uint8_t* data, std::size_t size) {
    Passphrase words;
    if (encode(wordlist, data, size, words) != Error::Ok) {
        throw OddLengthException(size);
    }
    return words;
}

#endif // !NICEPHRASE_NO_EXCEPTIONS

} // namespace nicephrase
