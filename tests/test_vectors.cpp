/**
 * @file test_vectors.cpp
 * @brief Field layouts taken from real packed headers.
 *
 * Each vector is a hand-checked byte sequence plus the field values it
 * encodes, read back the way a protocol parser would.
 */

#include <catch2/catch_test_macros.hpp>
#include <bitcursor/bitcursor.hpp>

#include "bit_packer.hpp"

#include <cstring>

using namespace bitcursor;
using bitcursor::test::BitPacker;

namespace {

// 33-bit base, 6 reserved bits, 9-bit extension (MPEG-TS PCR layout)
struct ClockReference {
    std::uint64_t base;
    std::uint16_t extension;
};

ClockReference read_clock_reference(BitCursor& cursor) {
    ClockReference pcr{};
    pcr.base = cursor.read_u64(33);
    cursor.skip(6);
    pcr.extension = cursor.read_u16(9);
    return pcr;
}

} // namespace

TEST_CASE("clock reference fields", "[vectors]") {
    SECTION("hand-packed bytes") {
        const std::uint8_t data[] = {0x91, 0xA2, 0xB3, 0xC4, 0xFF, 0x55};
        BitCursor cursor(data, sizeof(data));

        auto pcr = read_clock_reference(cursor);
        REQUIRE(pcr.base == 0x123456789ULL);
        REQUIRE(pcr.extension == 0x155);
        REQUIRE(cursor.remaining_bits() == 0);
        REQUIRE(cursor.check() == Error::Ok);
    }

    SECTION("maximum base and extension") {
        const std::uint8_t data[] = {0xFF, 0xFF, 0xFF, 0xFF, 0x81, 0xFF};
        BitCursor cursor(data, sizeof(data));

        auto pcr = read_clock_reference(cursor);
        REQUIRE(pcr.base == 0x1FFFFFFFFULL);
        REQUIRE(pcr.extension == 0x1FF);
        REQUIRE(cursor.check() == Error::Ok);
    }

    SECTION("packed fixture inside a longer record") {
        BitPacker packer;
        packer.put(0x47, 8).put(0x5, 3);
        packer.put(0x0ABCDEF01ULL, 33).put(0x3F, 6).put(0x0C8, 9);
        packer.put(0xFFFF, 16);

        const auto& bytes = packer.bytes();
        BitCursor cursor(bytes.data(), bytes.size());
        REQUIRE(cursor.read_byte() == 0x47);
        REQUIRE(cursor.read_u8(3) == 0x5);

        auto pcr = read_clock_reference(cursor);
        REQUIRE(pcr.base == 0x0ABCDEF01ULL);
        REQUIRE(pcr.extension == 0x0C8);
        REQUIRE(cursor.read_be16() == 0xFFFF);
        REQUIRE(cursor.check() == Error::Ok);
    }

    SECTION("truncated record is caught once at the end") {
        const std::uint8_t data[] = {0x91, 0xA2, 0xB3, 0xC4, 0xFF};
        BitCursor cursor(data, sizeof(data));

        auto pcr = read_clock_reference(cursor);
        REQUIRE(pcr.base == 0x123456789ULL);
        // last data bit, then eight padding zeros
        REQUIRE(pcr.extension == 0x100);
        REQUIRE(cursor.check() == Error::Overflow);
    }
}

TEST_CASE("little-endian header fields", "[vectors]") {
    // 16-bit tag, 32-bit length, 64-bit timestamp, all little-endian
    const std::uint8_t data[] = {0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0x08, 0x07,
                                 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    BitCursor cursor(data, sizeof(data));

    REQUIRE(cursor.read_le16() == 0x1234);
    REQUIRE(cursor.read_le32() == 0x12345678U);

    auto tail = cursor.remaining_bytes();
    REQUIRE(tail.size() == 8);
    REQUIRE(std::memcmp(tail.data(), data + 6, 8) == 0);

    REQUIRE(cursor.read_le64() == 0x0102030405060708ULL);
    REQUIRE(cursor.remaining_bits() == 0);
    REQUIRE(cursor.check() == Error::Ok);
}

TEST_CASE("signed sensor samples", "[vectors]") {
    // Three 12-bit two's complement samples: -1, 2047, -2048
    const std::uint8_t data[] = {0xFF, 0xF7, 0xFF, 0x80, 0x00};
    BitCursor cursor(data, sizeof(data));

    REQUIRE(cursor.read_s16(12) == -1);
    REQUIRE(cursor.read_s16(12) == 2047);
    REQUIRE(cursor.read_s16(12) == -2048);
    REQUIRE(cursor.remaining_bits() == 4);
    REQUIRE(cursor.check() == Error::Ok);
}

TEST_CASE("library version", "[vectors]") {
    REQUIRE(std::strcmp(version(), "1.0.0") == 0);
    REQUIRE(VERSION_MAJOR == 1);
}
