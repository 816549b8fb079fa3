/**
 * @file generate.cpp
 * @brief Random passphrase generation.
 */

#include <nicephrase/generate.hpp>
#include <nicephrase/random.hpp>

#include <vector>

namespace nicephrase {

Error generate(const Wordlist& wordlist, std::size_t num_words, Passphrase& words) {
    words.clear();

    if (num_words > MAX_PASSPHRASE_WORDS) {
        return Error::TooManyWords;
    }

    std::vector<std::uint8_t> bytes(num_words * BYTES_PER_WORD);
    auto result = detail::fill_random(bytes.data(), bytes.size());
    if (result != Error::Ok) {
        return result;
    }

    return encode(wordlist, bytes, words);
}

#if !NICEPHRASE_NO_EXCEPTIONS

Passphrase generate_passphrase(const Wordlist& wordlist, std::size_t num_words) {
    Passphrase words;
    switch (generate(wordlist, num_words, words)) {
    case Error::Ok:
        return words;
    case Error::TooManyWords:
        throw TooManyWordsException(num_words, MAX_PASSPHRASE_WORDS);
    default:
        throw EntropyException("failed to generate entropy for passphrase");
    }
}

#endif // !NICEPHRASE_NO_EXCEPTIONS

} // namespace nicephrase
