/**
 * @file bench.cpp
 * @brief Performance benchmarks for nicephrase encoding and decoding.
 *
 * Measures throughput against the embedded dictionary for regression
 * testing during development.
 *
 * Usage:
 *   ./build/nicephrase_bench          # Run with default 100 iterations
 *   ./build/nicephrase_bench 1000     # Run with custom iteration count
 */

#include <nicephrase/nicephrase.hpp>
#include <nicephrase/random.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace nicephrase;

static constexpr int DEFAULT_ITERATIONS = 100;

static void report(const char* name, std::chrono::high_resolution_clock::time_point start,
                   std::chrono::high_resolution_clock::time_point end, std::size_t num_bytes,
                   std::size_t num_words, int iterations) {
    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_word_ns = (per_iter_us * 1000.0) / static_cast<double>(num_words);
    double throughput_mbps = static_cast<double>(num_bytes) / per_iter_us;

    std::printf("%-20s %10.2f us/iter  %6.2f ns/word  %8.1f MB/s  (%zu words)\n", name,
                per_iter_us, per_word_ns, throughput_mbps, num_words);
}

static void bench_encode(const char* name, const Wordlist& wordlist,
                         const std::vector<std::uint8_t>& input, int iterations) {
    Passphrase words;

    // Warmup run
    if (encode(wordlist, input, words) != Error::Ok) {
        std::printf("%-20s FAIL (encode)\n", name);
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        encode(wordlist, input, words);
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, start, end, input.size(), words.size(), iterations);
}

static void bench_decode(const char* name, const Wordlist& wordlist,
                         const std::vector<std::uint8_t>& input, int iterations) {
    // First encode the data
    Passphrase words;
    if (encode(wordlist, input, words) != Error::Ok) {
        std::printf("%-20s FAIL (encode)\n", name);
        return;
    }

    std::vector<std::uint8_t> output;

    // Warmup run
    if (decode(wordlist, words, output) != Error::Ok || output != input) {
        std::printf("%-20s FAIL (decode)\n", name);
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        decode(wordlist, words, output);
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, start, end, input.size(), words.size(), iterations);
}

static std::vector<std::uint8_t> make_input(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    if (detail::fill_random(data.data(), data.size()) != Error::Ok) {
        // Deterministic fallback so the benchmark still runs
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::uint8_t>((i * 131U + 7U) & 0xFFU);
        }
    }
    return data;
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    const Wordlist* wordlist = nullptr;
    auto result = embedded_wordlist(wordlist);
    if (result != Error::Ok) {
        std::printf("Embedded wordlist unavailable: %s\n", error_string(result));
        return 1;
    }

    std::printf("nicephrase Benchmarks (C++ Implementation)\n");
    std::printf("==========================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Dictionary: %zu words, longest %zu chars\n\n", wordlist->size(),
                wordlist->max_word_length());

    std::printf("%-20s %15s  %13s  %11s  %s\n", "Test", "Time", "Per-Word", "Throughput",
                "Words");
    std::printf("%-20s %15s  %13s  %11s  %s\n", "----", "----", "--------", "----------",
                "-----");

    auto key = make_input(16);
    auto block = make_input(4096);
    auto bulk = make_input(1U << 20U);

    std::printf("\nEncode:\n");
    bench_encode("128-bit key", *wordlist, key, iterations);
    bench_encode("4 KiB", *wordlist, block, iterations);
    bench_encode("1 MiB", *wordlist, bulk, iterations);

    std::printf("\nDecode:\n");
    bench_decode("128-bit key", *wordlist, key, iterations);
    bench_decode("4 KiB", *wordlist, block, iterations);
    bench_decode("1 MiB", *wordlist, bulk, iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
