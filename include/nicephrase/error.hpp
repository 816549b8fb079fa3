/**
 * @file error.hpp
 * @brief nicephrase error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for builds without exceptions (-fno-exceptions).
 */

#ifndef NICEPHRASE_ERROR_HPP
#define NICEPHRASE_ERROR_HPP

#include "config.hpp"

#if !NICEPHRASE_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#include <string_view>
#endif

namespace nicephrase {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                 ///< Success
    OddLength = -1,         ///< Byte buffer has an odd number of bytes
    InvalidWord = -2,       ///< Passphrase contains a word not in the dictionary
    UnknownWord = -3,       ///< Single dictionary lookup failed
    MalformedWordlist = -4, ///< Dictionary is not 65,536 unique entries
    TooManyWords = -5,      ///< Requested passphrase is too long
    EntropyFailure = -6,    ///< Operating system entropy source failed
    ReadFailure = -7        ///< Wordlist file could not be read
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::OddLength:
        return "Odd size not supported";
    case Error::InvalidWord:
        return "Invalid word in passphrase";
    case Error::UnknownWord:
        return "Unknown word";
    case Error::MalformedWordlist:
        return "Malformed wordlist";
    case Error::TooManyWords:
        return "Too many words";
    case Error::EntropyFailure:
        return "Failed to generate entropy";
    case Error::ReadFailure:
        return "Cannot read wordlist file";
    default:
        return "Unknown error";
    }
}

#if !NICEPHRASE_NO_EXCEPTIONS

/**
 * @brief Base exception for nicephrase errors.
 */
class NicephraseException : public std::runtime_error {
public:
    explicit NicephraseException(const std::string& message, Error code)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for byte buffers of odd length.
 */
class OddLengthException : public NicephraseException {
public:
    explicit OddLengthException(std::size_t size)
        : NicephraseException("odd size not supported: " + std::to_string(size),
                              Error::OddLength),
          size_(size) {}

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

private:
    std::size_t size_;
};

/**
 * @brief Exception for a passphrase word missing from the dictionary.
 *
 * Identifies the first offending word and its zero-based position.
 */
class InvalidWordException : public NicephraseException {
public:
    InvalidWordException(std::size_t position, std::string_view word)
        : NicephraseException("unknown word: " + std::string(word) + " at position " +
                                  std::to_string(position),
                              Error::InvalidWord),
          position_(position), word_(word) {}

    [[nodiscard]] std::size_t position() const noexcept {
        return position_;
    }

    [[nodiscard]] const std::string& word() const noexcept {
        return word_;
    }

private:
    std::size_t position_;
    std::string word_;
};

/**
 * @brief Exception for a dictionary that fails the integrity check.
 */
class MalformedWordlistException : public NicephraseException {
public:
    explicit MalformedWordlistException(const std::string& message)
        : NicephraseException(message, Error::MalformedWordlist) {}
};

/**
 * @brief Exception for passphrase requests above MAX_PASSPHRASE_WORDS.
 */
class TooManyWordsException : public NicephraseException {
public:
    TooManyWordsException(std::size_t num_words, std::size_t max_words)
        : NicephraseException("number of words " + std::to_string(num_words) +
                                  " cannot be greater than " + std::to_string(max_words),
                              Error::TooManyWords) {}
};

/**
 * @brief Exception for entropy source failures.
 */
class EntropyException : public NicephraseException {
public:
    explicit EntropyException(const std::string& message)
        : NicephraseException(message, Error::EntropyFailure) {}
};

#endif // !NICEPHRASE_NO_EXCEPTIONS

} // namespace nicephrase

#endif // NICEPHRASE_ERROR_HPP
