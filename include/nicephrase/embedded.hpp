/**
 * @file embedded.hpp
 * @brief Canonical niceware dictionary compiled into the library.
 *
 * Provided by the nicephrase_wordlist library, which the build generates
 * from data/wordlist.txt. The word order is part of the format: previously
 * generated passphrases decode correctly only against the same order.
 */

#ifndef NICEPHRASE_EMBEDDED_HPP
#define NICEPHRASE_EMBEDDED_HPP

#include "config.hpp"
#include "error.hpp"
#include "wordlist.hpp"

namespace nicephrase {

/**
 * @brief Process-wide canonical wordlist.
 *
 * Built and integrity-checked on first use; later calls return the same
 * instance.
 *
 * @param[out] out Wordlist on success, null on failure
 * @return Error::Ok, or Error::MalformedWordlist if the embedded data is corrupt
 */
Error embedded_wordlist(const Wordlist*& out);

#if !NICEPHRASE_NO_EXCEPTIONS
/**
 * @brief Throwing form of embedded_wordlist().
 * @throws MalformedWordlistException
 */
const Wordlist& embedded_wordlist();
#endif

} // namespace nicephrase

#endif // NICEPHRASE_EMBEDDED_HPP
