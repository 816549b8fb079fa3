/**
 * @file test_codec.cpp
 * @brief Unit tests for encode/decode.
 */

#include <catch2/catch_test_macros.hpp>
#include <nicephrase/codec.hpp>

#include "wordlist_fixture.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

using namespace nicephrase;
using namespace nicephrase::test;

TEST_CASE("Encode empty input", "[codec][encode]") {
    const auto& wordlist = synthetic_wordlist();

    SECTION("empty vector") {
        Passphrase words = {"stale"};
        REQUIRE(encode(wordlist, std::vector<std::uint8_t>{}, words) == Error::Ok);
        REQUIRE(words.empty());
    }

    SECTION("null pointer with zero size") {
        Passphrase words;
        REQUIRE(encode(wordlist, nullptr, 0, words) == Error::Ok);
        REQUIRE(words.empty());
    }
}

TEST_CASE("Encode rejects odd length", "[codec][encode]") {
    const auto& wordlist = synthetic_wordlist();

    SECTION("single byte") {
        Passphrase words = {"stale"};
        std::vector<std::uint8_t> bytes = {0x01};
        REQUIRE(encode(wordlist, bytes, words) == Error::OddLength);
        REQUIRE(words.empty());
    }

    SECTION("no padding for longer input") {
        Passphrase words;
        std::vector<std::uint8_t> bytes = {0x00, 0x01, 0x02};
        REQUIRE(encode(wordlist, bytes, words) == Error::OddLength);
        REQUIRE(words.empty());
    }

    SECTION("throwing form") {
        std::vector<std::uint8_t> bytes = {0x01};
        try {
            to_passphrase(wordlist, bytes);
            FAIL("expected OddLengthException");
        } catch (const OddLengthException& e) {
            REQUIRE(e.size() == 1);
            REQUIRE(e.code() == Error::OddLength);
            REQUIRE(std::string(e.what()) == "odd size not supported: 1");
        }
    }
}

TEST_CASE("Encode is big-endian", "[codec][encode]") {
    const auto& wordlist = synthetic_wordlist();
    Passphrase words;

    SECTION("low byte") {
        std::vector<std::uint8_t> bytes = {0x00, 0x01};
        REQUIRE(encode(wordlist, bytes, words) == Error::Ok);
        REQUIRE(words == Passphrase{"aaab"});
    }

    SECTION("high byte") {
        std::vector<std::uint8_t> bytes = {0x01, 0x00};
        REQUIRE(encode(wordlist, bytes, words) == Error::Ok);
        REQUIRE(words.size() == 1);
        REQUIRE(words[0] == synthetic_word(256));
    }

    SECTION("extremes and order") {
        std::vector<std::uint8_t> bytes = {0x00, 0x00, 0xFF, 0xFF, 0x12, 0x34};
        REQUIRE(encode(wordlist, bytes, words) == Error::Ok);
        REQUIRE(words.size() == 3);
        REQUIRE(words[0] == "aaaa");
        REQUIRE(words[1] == synthetic_word(0xFFFF));
        REQUIRE(words[2] == synthetic_word(0x1234));
    }
}

TEST_CASE("Encode output length", "[codec][encode]") {
    const auto& wordlist = synthetic_wordlist();
    std::vector<std::uint8_t> bytes(64, 0xA5);

    auto words = to_passphrase(wordlist, bytes);
    REQUIRE(words.size() == bytes.size() / 2);
    for (auto word : words) {
        REQUIRE(word == synthetic_word(0xA5A5));
    }
}

TEST_CASE("Decode known words", "[codec][decode]") {
    const auto& wordlist = synthetic_wordlist();
    std::vector<std::uint8_t> bytes;

    SECTION("single word") {
        std::vector<std::string> words = {"aaab"};
        REQUIRE(decode(wordlist, words, bytes) == Error::Ok);
        REQUIRE(bytes == std::vector<std::uint8_t>{0x00, 0x01});
    }

    SECTION("high byte first") {
        std::vector<std::string> words = {synthetic_word(0x1234), synthetic_word(0xFFFF)};
        REQUIRE(decode(wordlist, words, bytes) == Error::Ok);
        REQUIRE(bytes == std::vector<std::uint8_t>{0x12, 0x34, 0xFF, 0xFF});
    }

    SECTION("empty input") {
        bytes = {0xDE, 0xAD};
        REQUIRE(decode(wordlist, std::vector<std::string>{}, bytes) == Error::Ok);
        REQUIRE(bytes.empty());
    }

    SECTION("error position untouched on success") {
        std::size_t position = 99;
        std::vector<std::string_view> words = {"aaaa"};
        REQUIRE(decode(wordlist, words, bytes, &position) == Error::Ok);
        REQUIRE(position == 99);
    }
}

TEST_CASE("Decode accepts string-like ranges", "[codec][decode]") {
    const auto& wordlist = synthetic_wordlist();
    const std::vector<std::uint8_t> expected = {0x00, 0x00, 0x00, 0x1A};
    std::vector<std::uint8_t> bytes;

    SECTION("std::string") {
        std::vector<std::string> words = {"aaaa", "aaba"};
        REQUIRE(decode(wordlist, words, bytes) == Error::Ok);
        REQUIRE(bytes == expected);
    }

    SECTION("std::string_view") {
        std::vector<std::string_view> words = {"aaaa", "aaba"};
        REQUIRE(decode(wordlist, words, bytes) == Error::Ok);
        REQUIRE(bytes == expected);
    }

    SECTION("const char* array") {
        std::array<const char*, 2> words = {"aaaa", "aaba"};
        REQUIRE(decode(wordlist, words, bytes) == Error::Ok);
        REQUIRE(bytes == expected);
    }
}

TEST_CASE("Decode rejects unknown words", "[codec][decode]") {
    const auto& wordlist = synthetic_wordlist();
    std::vector<std::uint8_t> bytes = {0xAA};
    std::size_t position = 0;

    SECTION("reports position of offending word") {
        std::vector<std::string> words = {"aaaa", "aaab", "not-a-real-word"};
        REQUIRE(decode(wordlist, words, bytes, &position) == Error::InvalidWord);
        REQUIRE(position == 2);
        REQUIRE(bytes.empty());
    }

    SECTION("reports first of several") {
        std::vector<std::string> words = {"aaaa", "bad", "aaab", "worse"};
        REQUIRE(decode(wordlist, words, bytes, &position) == Error::InvalidWord);
        REQUIRE(position == 1);
    }

    SECTION("matching is case-sensitive") {
        std::vector<std::string> words = {"AAAA"};
        REQUIRE(decode(wordlist, words, bytes, &position) == Error::InvalidWord);
        REQUIRE(position == 0);
    }

    SECTION("no normalization of whitespace") {
        std::vector<std::string> words = {"aaaa", " aaab"};
        REQUIRE(decode(wordlist, words, bytes, &position) == Error::InvalidWord);
        REQUIRE(position == 1);
    }

    SECTION("null error position") {
        std::vector<std::string> words = {"nope"};
        REQUIRE(decode(wordlist, words, bytes) == Error::InvalidWord);
        REQUIRE(bytes.empty());
    }

    SECTION("throwing form") {
        std::vector<std::string> words = {"aaaa", "aaab", "not-a-real-word"};
        try {
            to_bytes(wordlist, words);
            FAIL("expected InvalidWordException");
        } catch (const InvalidWordException& e) {
            REQUIRE(e.position() == 2);
            REQUIRE(e.word() == "not-a-real-word");
            REQUIRE(e.code() == Error::InvalidWord);
            REQUIRE(std::string(e.what()) == "unknown word: not-a-real-word at position 2");
        }
    }
}

TEST_CASE("Round-trip bytes -> words -> bytes", "[codec][roundtrip]") {
    const auto& wordlist = synthetic_wordlist();

    // Every 16-bit value once, in order
    std::vector<std::uint8_t> input;
    input.reserve(WORDLIST_SIZE * 2);
    for (std::size_t i = 0; i < WORDLIST_SIZE; ++i) {
        input.push_back(static_cast<std::uint8_t>(i >> 8));
        input.push_back(static_cast<std::uint8_t>(i & 0xFFU));
    }

    Passphrase words;
    REQUIRE(encode(wordlist, input, words) == Error::Ok);
    REQUIRE(words.size() == WORDLIST_SIZE);

    std::vector<std::uint8_t> output;
    REQUIRE(decode(wordlist, words, output) == Error::Ok);
    REQUIRE(output == input);
}

TEST_CASE("Round-trip words -> bytes -> words", "[codec][roundtrip]") {
    const auto& wordlist = synthetic_wordlist();
    std::vector<std::string> words = {"dsyp", "aaaa", "abcd", "cafe", "beef", "aaaa"};

    auto bytes = to_bytes(wordlist, words);
    REQUIRE(bytes.size() == words.size() * 2);

    auto again = to_passphrase(wordlist, bytes);
    REQUIRE(again.size() == words.size());
    for (std::size_t i = 0; i < words.size(); ++i) {
        REQUIRE(again[i] == words[i]);
    }
}

TEST_CASE("Codec is deterministic", "[codec]") {
    const auto& wordlist = synthetic_wordlist();
    std::vector<std::uint8_t> bytes = {0x8B, 0x21, 0x00, 0x7F, 0xC4, 0x09};

    auto first = to_passphrase(wordlist, bytes);
    auto second = to_passphrase(wordlist, bytes);
    REQUIRE(first == second);

    REQUIRE(to_bytes(wordlist, first) == to_bytes(wordlist, second));
}

TEST_CASE("Error strings", "[error]") {
    REQUIRE(std::string(error_string(Error::Ok)) == "Success");
    REQUIRE(std::string(error_string(Error::OddLength)) == "Odd size not supported");
    REQUIRE(std::string(error_string(Error::InvalidWord)) == "Invalid word in passphrase");
    REQUIRE(std::string(error_string(Error::MalformedWordlist)) == "Malformed wordlist");
    REQUIRE(std::string(error_string(Error::ReadFailure)) == "Cannot read wordlist file");
}
