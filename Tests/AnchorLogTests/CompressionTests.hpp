#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>
#include <random>

namespace compression_tests {

using namespace anchorlog;

void test_round_trip_sizes() {
    std::cout << "  test_round_trip_sizes..." << std::flush;

    std::vector<uint8_t> empty;
    assert(decompress(compress(empty, compression_level::balanced)).empty());

    std::vector<uint8_t> one{0x7f};
    assert(decompress(compress(one, compression_level::balanced)) == one);

    std::vector<uint8_t> repeating(10000, 0xab);
    auto packed = compress(repeating, compression_level::balanced);
    assert(packed.size() < repeating.size() / 10);
    assert(decompress(packed) == repeating);

    std::mt19937 rng(1234);
    std::vector<uint8_t> noise(100000);
    for (auto& b : noise) b = static_cast<uint8_t>(rng() & 0xff);
    assert(decompress(compress(noise, compression_level::balanced)) == noise);

    std::cout << " OK" << std::endl;
}

void test_none_is_identity() {
    std::cout << "  test_none_is_identity..." << std::flush;

    std::vector<uint8_t> data{1, 2, 3, 4, 5};
    assert(compress(data, compression_level::none) == data);
    assert(compress({}, compression_level::none).empty());

    std::cout << " OK" << std::endl;
}

void test_output_buffer_grows() {
    std::cout << "  test_output_buffer_grows..." << std::flush;

    // Ratio far above the initial 4x guess forces several growth steps.
    std::vector<uint8_t> zeros(4 * 1024 * 1024, 0);
    auto packed = compress(zeros, compression_level::balanced);
    assert(packed.size() * 100 < zeros.size());
    assert(decompress(packed) == zeros);

    std::cout << " OK" << std::endl;
}

void test_decompression_failures() {
    std::cout << "  test_decompression_failures..." << std::flush;

    std::vector<uint8_t> garbage{0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
    auto code = test_support::expect_storage_error([&] { decompress(garbage); });
    assert(code == storage_errc::decompression_failed);

    std::vector<uint8_t> data(5000, 0x42);
    auto packed = compress(data, compression_level::balanced);
    packed.resize(packed.size() / 2);
    code = test_support::expect_storage_error([&] { decompress(packed); });
    assert(code == storage_errc::decompression_failed);

    // Growth exhausted: fail instead of truncating.
    auto full = compress(data, compression_level::balanced);
    code = test_support::expect_storage_error([&] { decompress(full, 1024); });
    assert(code == storage_errc::decompression_failed);

    std::cout << " OK" << std::endl;
}

void test_output_at_exact_cap() {
    std::cout << "  test_output_at_exact_cap..." << std::flush;

    // Below the initial buffer guess, exactly at it, and past several doublings.
    for (size_t n : {size_t(100), size_t(1024), size_t(70000)}) {
        std::vector<uint8_t> data(n, 0x5a);
        auto packed = compress(data, compression_level::balanced);
        assert(decompress(packed, n) == data);

        auto code = test_support::expect_storage_error([&] { decompress(packed, n - 1); });
        assert(code == storage_errc::decompression_failed);
    }

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing compression..." << std::endl;
    test_round_trip_sizes();
    test_none_is_identity();
    test_output_buffer_grows();
    test_decompression_failures();
    test_output_at_exact_cap();
}

} // namespace compression_tests
