/**
 * @file config.hpp
 * @brief nicephrase compile-time configuration.
 *
 * Niceware encoding: every word of a 65,536-entry dictionary stands for one
 * big-endian 16-bit unit, so 2n bytes map to exactly n words.
 *
 * @see https://github.com/diracdeltas/niceware Niceware
 */

#ifndef NICEPHRASE_CONFIG_HPP
#define NICEPHRASE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace nicephrase {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Number of bits carried by one word
inline constexpr std::size_t BITS_PER_WORD = 16U;

/// Number of bytes carried by one word
inline constexpr std::size_t BYTES_PER_WORD = BITS_PER_WORD / 8U;

/// Dictionary size (2^16, fixed by the format)
inline constexpr std::size_t WORDLIST_SIZE = std::size_t{1} << BITS_PER_WORD;

/// Upper bound on generated passphrase length in words
#ifndef NICEPHRASE_MAX_PASSPHRASE_WORDS
#define NICEPHRASE_MAX_PASSPHRASE_WORDS 512U
#endif

inline constexpr std::size_t MAX_PASSPHRASE_WORDS = NICEPHRASE_MAX_PASSPHRASE_WORDS;

/// Word index type (one dictionary position)
using index_t = std::uint16_t;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define NICEPHRASE_NO_EXCEPTIONS=1 to drop the throwing API for builds
 * using -fno-exceptions. The error-code API is always available.
 * @{
 */
#ifndef NICEPHRASE_NO_EXCEPTIONS
#define NICEPHRASE_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace nicephrase

#endif // NICEPHRASE_CONFIG_HPP
