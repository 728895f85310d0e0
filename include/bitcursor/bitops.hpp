/**
 * @file bitops.hpp
 * @brief Byte-order and sign-extension helpers.
 *
 * Wider byte swaps are composed from narrower ones so that the swap logic
 * lives in exactly one place (the 16-bit primitive).
 */

#ifndef BITCURSOR_BITOPS_HPP
#define BITCURSOR_BITOPS_HPP

#include "config.hpp"

namespace bitcursor {

/**
 * @brief Swap the two bytes of a 16-bit value.
 */
constexpr std::uint16_t byteswap16(std::uint16_t value) noexcept {
    return static_cast<std::uint16_t>((value >> 8) | (value << 8));
}

/**
 * @brief Reverse the byte order of a 32-bit value.
 *
 * Each half is swapped with byteswap16() and the halves exchanged.
 */
constexpr std::uint32_t byteswap32(std::uint32_t value) noexcept {
    return static_cast<std::uint32_t>(byteswap16(static_cast<std::uint16_t>(value >> 16))) |
           (static_cast<std::uint32_t>(byteswap16(static_cast<std::uint16_t>(value & 0xFFFFU)))
            << 16);
}

/**
 * @brief Reverse the byte order of a 64-bit value.
 */
constexpr std::uint64_t byteswap64(std::uint64_t value) noexcept {
    return static_cast<std::uint64_t>(byteswap32(static_cast<std::uint32_t>(value >> 32))) |
           (static_cast<std::uint64_t>(
                byteswap32(static_cast<std::uint32_t>(value & 0xFFFFFFFFU)))
            << 32);
}

/**
 * @brief Sign-extend the low @p bits of @p value to 64 bits.
 *
 * Uses the xor/subtract identity: with m = ~0 << (bits - 1), the result is
 * (value ^ m) - m. Bits above @p bits in @p value must be zero.
 *
 * @param value Two's complement value right-justified in a 64-bit word
 * @param bits Width of the value (1-64)
 * @return Sign-extended value
 */
constexpr std::int64_t sign_extend(std::uint64_t value, std::size_t bits) noexcept {
    const std::uint64_t mask = ~std::uint64_t{0} << (bits - 1);
    return static_cast<std::int64_t>((value ^ mask) - mask);
}

/**
 * @brief Load 8 bytes as a big-endian 64-bit word.
 *
 * @param bytes Source bytes, at least WORD_BYTES readable
 */
inline std::uint64_t load_be64(const std::uint8_t* bytes) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < WORD_BYTES; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

} // namespace bitcursor

#endif // BITCURSOR_BITOPS_HPP
