/**
 * @file wordlist.cpp
 * @brief Wordlist construction and lookup.
 */

#include <nicephrase/wordlist.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace nicephrase {

namespace {

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    lines.reserve(WORDLIST_SIZE);

    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);

        start = end + 1;
    }

    return lines;
}

} // namespace

Error Wordlist::assemble(std::vector<std::string>&& words, Wordlist& list,
                         std::string* message) {
    if (words.size() != WORDLIST_SIZE) {
        if (message != nullptr) {
            *message = "expected " + std::to_string(WORDLIST_SIZE) + " words, found " +
                       std::to_string(words.size());
        }
        return Error::MalformedWordlist;
    }

    // The index keys are views into words_, so words_ must not be touched
    // after this point.
    list.words_ = std::move(words);
    list.index_.clear();
    list.index_.reserve(WORDLIST_SIZE);
    list.max_word_length_ = 0;

    for (std::size_t i = 0; i < WORDLIST_SIZE; ++i) {
        std::string_view word = list.words_[i];
        auto [it, inserted] = list.index_.emplace(word, static_cast<index_t>(i));
        if (!inserted) [[unlikely]] {
            if (message != nullptr) {
                *message = "duplicate word '" + std::string(word) + "' at positions " +
                           std::to_string(it->second) + " and " + std::to_string(i);
            }
            return Error::MalformedWordlist;
        }
        list.max_word_length_ = std::max(list.max_word_length_, word.size());
    }

    return Error::Ok;
}

Error Wordlist::build(std::vector<std::string> words, std::optional<Wordlist>& out) {
    out.reset();

    Wordlist list;
    auto result = assemble(std::move(words), list, nullptr);
    if (result != Error::Ok) {
        return result;
    }

    out = std::move(list);
    return Error::Ok;
}

Error Wordlist::parse(std::string_view text, std::optional<Wordlist>& out) {
    return build(split_lines(text), out);
}

Error Wordlist::load(const std::string& path, std::optional<Wordlist>& out) {
    out.reset();

    // Directories can open and report a bogus size on some filesystems
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::ReadFailure;
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error::ReadFailure;
    }

    // tellg() is -1 for unseekable streams
    std::streamsize size = file.tellg();
    if (size < 0) {
        return Error::ReadFailure;
    }
    file.seekg(0, std::ios::beg);

    std::string text(static_cast<std::size_t>(size), '\0');
    if (!file.read(text.data(), size)) {
        return Error::ReadFailure;
    }

    return parse(text, out);
}

#if !NICEPHRASE_NO_EXCEPTIONS

Wordlist Wordlist::from_words(std::vector<std::string> words) {
    Wordlist list;
    std::string message;
    if (assemble(std::move(words), list, &message) != Error::Ok) {
        throw MalformedWordlistException(message);
    }
    return list;
}

Wordlist Wordlist::from_text(std::string_view text) {
    return from_words(split_lines(text));
}

#endif // !NICEPHRASE_NO_EXCEPTIONS

std::optional<index_t> Wordlist::find(std::string_view word) const noexcept {
    if (word.size() > max_word_length_) {
        return std::nullopt;
    }

    auto it = index_.find(word);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Error Wordlist::index_of(std::string_view word, index_t& index) const noexcept {
    auto found = find(word);
    if (!found) {
        return Error::UnknownWord;
    }
    index = *found;
    return Error::Ok;
}

} // namespace nicephrase
