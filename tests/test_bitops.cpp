/**
 * @file test_bitops.cpp
 * @brief Unit tests for byte swapping and sign extension.
 */

#include <catch2/catch_test_macros.hpp>
#include <bitcursor/bitops.hpp>

#include <limits>

using namespace bitcursor;

TEST_CASE("byteswap16", "[bitops]") {
    REQUIRE(byteswap16(0x1234) == 0x3412);
    REQUIRE(byteswap16(0x00FF) == 0xFF00);
    REQUIRE(byteswap16(0x0000) == 0x0000);
}

TEST_CASE("byteswap32", "[bitops]") {
    REQUIRE(byteswap32(0x12345678U) == 0x78563412U);
    REQUIRE(byteswap32(0xDEADBEEFU) == 0xEFBEADDEU);
    REQUIRE(byteswap32(0x000000FFU) == 0xFF000000U);
}

TEST_CASE("byteswap64", "[bitops]") {
    REQUIRE(byteswap64(0x0123456789ABCDEFULL) == 0xEFCDAB8967452301ULL);
    REQUIRE(byteswap64(0x00000000000000FFULL) == 0xFF00000000000000ULL);

    SECTION("swapping twice is identity") {
        const std::uint64_t value = 0xA5A5F00D1234BEEFULL;
        REQUIRE(byteswap64(byteswap64(value)) == value);
    }
}

TEST_CASE("byteswap is usable at compile time", "[bitops]") {
    static_assert(byteswap16(0xAABB) == 0xBBAA);
    static_assert(byteswap32(0x11223344U) == 0x44332211U);
    static_assert(byteswap64(0x1122334455667788ULL) == 0x8877665544332211ULL);
    SUCCEED();
}

TEST_CASE("sign_extend", "[bitops]") {
    SECTION("positive values are unchanged") {
        REQUIRE(sign_extend(0x0, 1) == 0);
        REQUIRE(sign_extend(0x7, 4) == 7);
        REQUIRE(sign_extend(0x7FFFFFFFFFFFFFFFULL, 64) ==
                std::numeric_limits<std::int64_t>::max());
    }

    SECTION("top bit set gives negative value") {
        REQUIRE(sign_extend(0x1, 1) == -1);
        REQUIRE(sign_extend(0xF, 4) == -1);
        REQUIRE(sign_extend(0x8, 4) == -8);
        REQUIRE(sign_extend(0x5, 3) == -3);
        REQUIRE(sign_extend(0x1FFFFFFFFULL, 33) == -1);
        REQUIRE(sign_extend(0x100000000ULL, 33) == -4294967296LL);
    }

    SECTION("full width") {
        REQUIRE(sign_extend(0xFFFFFFFFFFFFFFFFULL, 64) == -1);
        REQUIRE(sign_extend(0x8000000000000000ULL, 64) ==
                std::numeric_limits<std::int64_t>::min());
    }
}

TEST_CASE("load_be64", "[bitops]") {
    const std::uint8_t data[] = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF, 0x55};

    REQUIRE(load_be64(data) == 0x0123456789ABCDEFULL);
    REQUIRE(load_be64(data + 1) == 0x23456789ABCDEF55ULL);
}
