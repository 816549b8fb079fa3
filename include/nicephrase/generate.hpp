/**
 * @file generate.hpp
 * @brief Random passphrase generation.
 *
 * Each word carries 16 bits, so 8 words give a 128-bit passphrase.
 */

#ifndef NICEPHRASE_GENERATE_HPP
#define NICEPHRASE_GENERATE_HPP

#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "wordlist.hpp"

namespace nicephrase {

/**
 * @brief Generate a random passphrase.
 *
 * Draws 2 * num_words bytes from the operating system and encodes them.
 *
 * @param wordlist Dictionary to draw words from
 * @param num_words Number of words (0 to MAX_PASSPHRASE_WORDS)
 * @param[out] words Generated passphrase (empty on failure)
 * @return Error::Ok, Error::TooManyWords or Error::EntropyFailure
 */
Error generate(const Wordlist& wordlist, std::size_t num_words, Passphrase& words);

#if !NICEPHRASE_NO_EXCEPTIONS
/**
 * @brief Throwing form of generate().
 * @throws TooManyWordsException
 * @throws EntropyException
 */
Passphrase generate_passphrase(const Wordlist& wordlist, std::size_t num_words);
#endif

} // namespace nicephrase

#endif // NICEPHRASE_GENERATE_HPP
