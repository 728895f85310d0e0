/**
 * @file bench.cpp
 * @brief Performance benchmarks for BitCursor reads.
 *
 * Measures read throughput over an in-memory buffer for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/bitcursor_bench            # Run with default 100 iterations
 *   ./build/bitcursor_bench 1000       # Run with custom iteration count
 */

#include <bitcursor/bitcursor.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

using namespace bitcursor;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t BUFFER_BYTES = 64 * 1024;

// Keeps the optimizer from discarding the reads
static volatile std::uint64_t sink;

template <typename ReadLoop>
static void bench_reads(const char* name, const std::vector<std::uint8_t>& data,
                        int iterations, ReadLoop read_loop) {
    std::uint64_t acc = 0;

    // Warmup run
    {
        BitCursor cursor(data.data(), data.size());
        acc ^= read_loop(cursor);
    }

    std::size_t bits_read = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        BitCursor cursor(data.data(), data.size());
        acc ^= read_loop(cursor);
        bits_read += cursor.position();
        if (cursor.check() != Error::Ok) {
            std::printf("%-20s FAIL (%s)\n", name, error_string(cursor.check()));
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    sink = acc;

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(bits_read) / total_us;

    std::printf("%-20s %8.2f µs/iter  %10.1f Mbit/s\n", name, per_iter_us, throughput_mbps);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::vector<std::uint8_t> data(BUFFER_BYTES);
    std::mt19937 rng(42);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(rng() & 0xFFU);
    }
    const std::size_t total_bits = data.size() * 8;

    std::printf("bitcursor %s Benchmarks\n", version());
    std::printf("========================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Buffer size: %zu bytes\n\n", data.size());

    std::printf("%-20s %14s  %15s\n", "Test", "Time", "Throughput");
    std::printf("%-20s %14s  %15s\n", "----", "----", "----------");

    bench_reads("single bits", data, iterations, [&](BitCursor& cursor) {
        std::uint64_t acc = 0;
        while (cursor.remaining_bits() > 0) {
            acc += cursor.read_bit() ? 1U : 0U;
        }
        return acc;
    });

    bench_reads("mixed widths", data, iterations, [&](BitCursor& cursor) {
        static constexpr std::size_t widths[] = {3, 13, 1, 7, 32, 5, 19, 24};
        std::uint64_t acc = 0;
        std::size_t i = 0;
        while (cursor.remaining_bits() >= 32) {
            acc += cursor.read_u32(widths[i++ & 7]);
        }
        return acc;
    });

    bench_reads("signed 12-bit", data, iterations, [&](BitCursor& cursor) {
        std::uint64_t acc = 0;
        while (cursor.remaining_bits() >= 12) {
            acc += static_cast<std::uint64_t>(cursor.read_s16(12));
        }
        return acc;
    });

    bench_reads("clock reference", data, iterations, [&](BitCursor& cursor) {
        std::uint64_t acc = 0;
        while (cursor.remaining_bits() >= 48) {
            acc += cursor.read_u64(33);
            cursor.skip(6);
            acc += cursor.read_u16(9);
        }
        return acc;
    });

    bench_reads("le64 words", data, iterations, [&](BitCursor& cursor) {
        std::uint64_t acc = 0;
        for (std::size_t n = total_bits / 64; n > 0; --n) {
            acc ^= cursor.read_le64();
        }
        return acc;
    });

    std::printf("\nNote: results depend on compiler and CPU.\n");
    std::printf("Use these results for relative comparisons only.\n");

    return 0;
}
