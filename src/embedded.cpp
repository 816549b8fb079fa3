/**
 * @file embedded.cpp
 * @brief Canonical wordlist accessor.
 *
 * The word data itself is the generated wordlist_data.cpp (see
 * cmake/wordlist_data.cpp.in).
 */

#include <nicephrase/embedded.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nicephrase {

namespace detail {
extern const char* const EMBEDDED_WORDS[];
extern const std::size_t EMBEDDED_WORD_COUNT;
} // namespace detail

namespace {

struct EmbeddedState {
    std::optional<Wordlist> wordlist;
    Error status = Error::Ok;
};

const EmbeddedState& embedded_state() {
    static const EmbeddedState state = [] {
        EmbeddedState s;
        std::vector<std::string> words(detail::EMBEDDED_WORDS,
                                       detail::EMBEDDED_WORDS + detail::EMBEDDED_WORD_COUNT);
        s.status = Wordlist::build(std::move(words), s.wordlist);
        return s;
    }();
    return state;
}

} // namespace

Error embedded_wordlist(const Wordlist*& out) {
    const auto& state = embedded_state();
    if (state.status != Error::Ok) {
        out = nullptr;
        return state.status;
    }
    out = &*state.wordlist;
    return Error::Ok;
}

#if !NICEPHRASE_NO_EXCEPTIONS

const Wordlist& embedded_wordlist() {
    const Wordlist* wordlist = nullptr;
    if (embedded_wordlist(wordlist) != Error::Ok) {
        throw MalformedWordlistException("embedded wordlist failed integrity check");
    }
    return *wordlist;
}

#endif // !NICEPHRASE_NO_EXCEPTIONS

} // namespace nicephrase
