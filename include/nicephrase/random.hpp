/**
 * @file random.hpp
 * @brief Operating system entropy source.
 */

#ifndef NICEPHRASE_RANDOM_HPP
#define NICEPHRASE_RANDOM_HPP

#include "config.hpp"
#include "error.hpp"

namespace nicephrase {
namespace detail {

/**
 * @brief Fill a buffer with cryptographically secure random bytes.
 *
 * Uses getrandom(2) on Linux, arc4random_buf on BSD/macOS and
 * /dev/urandom elsewhere.
 *
 * @param buf Destination buffer
 * @param len Number of bytes to fill
 * @return Error::Ok, or Error::EntropyFailure
 */
Error fill_random(std::uint8_t* buf, std::size_t len) noexcept;

} // namespace detail
} // namespace nicephrase

#endif // NICEPHRASE_RANDOM_HPP
