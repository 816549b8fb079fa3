/**
 * @file random.cpp
 * @brief Operating system entropy source.
 */

#include <nicephrase/random.hpp>

#if defined(__linux__)
#include <sys/random.h>

#include <cerrno>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
#include <stdlib.h> // arc4random_buf
#else
#include <cstdio>
#endif

namespace nicephrase {
namespace detail {

Error fill_random(std::uint8_t* buf, std::size_t len) noexcept {
    if (len == 0) {
        return Error::Ok;
    }

#if defined(__linux__)
    // getrandom() may return short reads or be interrupted by a signal
    std::size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error::EntropyFailure;
        }
        filled += static_cast<std::size_t>(ret);
    }
    return Error::Ok;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return Error::Ok;

#else
    std::FILE* urandom = std::fopen("/dev/urandom", "rb");
    if (urandom == nullptr) {
        return Error::EntropyFailure;
    }
    std::size_t got = std::fread(buf, 1, len, urandom);
    std::fclose(urandom);
    return (got == len) ? Error::Ok : Error::EntropyFailure;
#endif
}

} // namespace detail
} // namespace nicephrase
