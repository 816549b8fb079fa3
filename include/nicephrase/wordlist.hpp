/**
 * @file wordlist.hpp
 * @brief Fixed 65,536-entry dictionary and its reverse index.
 *
 * A Wordlist is the encoding alphabet: position i holds the word that
 * stands for the 16-bit value i. The forward table and the reverse index
 * are filled from the same storage in one pass, and construction fails
 * unless the input holds exactly WORDLIST_SIZE unique entries.
 */

#ifndef NICEPHRASE_WORDLIST_HPP
#define NICEPHRASE_WORDLIST_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace nicephrase {

/**
 * @brief Immutable ordered dictionary with word -> index lookup.
 *
 * Read-only after construction, so one instance can be shared by any
 * number of threads without locking. Non-copyable: the reverse index
 * holds views into the word storage, which survive a move but not a copy.
 */
class Wordlist {
public:
    Wordlist(const Wordlist&) = delete;
    Wordlist& operator=(const Wordlist&) = delete;
    Wordlist(Wordlist&&) = default;
    Wordlist& operator=(Wordlist&&) = default;

    /**
     * @brief Build a wordlist from an ordered sequence of words.
     *
     * @param words Words in index order (exactly WORDLIST_SIZE, all distinct)
     * @param[out] out Receives the wordlist on success, reset on failure
     * @return Error::Ok, or Error::MalformedWordlist on a bad count or duplicate
     */
    static Error build(std::vector<std::string> words, std::optional<Wordlist>& out);

    /**
     * @brief Build a wordlist from text holding one word per line.
     *
     * Lines end in '\n'; a '\r' before it is dropped and the final line may
     * omit the newline.
     *
     * @param text Wordlist text
     * @param[out] out Receives the wordlist on success, reset on failure
     * @return Error::Ok, or Error::MalformedWordlist
     */
    static Error parse(std::string_view text, std::optional<Wordlist>& out);

    /**
     * @brief Build a wordlist from a file holding one word per line.
     *
     * Only regular, seekable files are read; anything else is rejected
     * before a buffer is sized from the file length.
     *
     * @param path Wordlist file
     * @param[out] out Receives the wordlist on success, reset on failure
     * @return Error::Ok, Error::ReadFailure or Error::MalformedWordlist
     */
    static Error load(const std::string& path, std::optional<Wordlist>& out);

#if !NICEPHRASE_NO_EXCEPTIONS
    /**
     * @brief Throwing form of build().
     * @throws MalformedWordlistException naming the count or first duplicate
     */
    static Wordlist from_words(std::vector<std::string> words);

    /**
     * @brief Throwing form of parse().
     * @throws MalformedWordlistException naming the count or first duplicate
     */
    static Wordlist from_text(std::string_view text);
#endif

    /**
     * @brief Word at a dictionary position.
     *
     * Total: every 16-bit value is a valid position.
     */
    [[nodiscard]] std::string_view word_at(index_t index) const noexcept {
        return words_[index];
    }

    /**
     * @brief Position of a word, if present.
     *
     * Exact, case-sensitive match.
     */
    [[nodiscard]] std::optional<index_t> find(std::string_view word) const noexcept;

    /**
     * @brief Position of a word.
     *
     * @param word Word to look up
     * @param[out] index Position of the word (untouched on failure)
     * @return Error::Ok, or Error::UnknownWord
     */
    Error index_of(std::string_view word, index_t& index) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept {
        return words_.size();
    }

    /**
     * @brief Length of the longest entry.
     *
     * Tokens longer than this are rejected without a hash lookup.
     */
    [[nodiscard]] std::size_t max_word_length() const noexcept {
        return max_word_length_;
    }

private:
    Wordlist() = default;

    static Error assemble(std::vector<std::string>&& words, Wordlist& list,
                          std::string* message);

    std::vector<std::string> words_;
    std::unordered_map<std::string_view, index_t> index_;
    std::size_t max_word_length_ = 0;
};

} // namespace nicephrase

#endif // NICEPHRASE_WORDLIST_HPP
