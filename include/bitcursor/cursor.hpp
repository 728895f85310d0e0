/**
 * @file cursor.hpp
 * @brief Bit-granular extraction from a fixed byte buffer.
 *
 * The cursor reads big-endian (MSB-first) integers of any width from 1 to
 * 64 bits at any bit position, without per-bit loops: each read is one
 * 64-bit word load plus two shifts (two loads for widths above 32).
 *
 * @par Bounds
 * Word loads start at a 4-byte aligned offset clamped to
 * SourceBuffer::safe_skip_limit(), and short buffers are padded to one word,
 * so no read ever touches memory outside the source. Reads do not check the
 * logical end of the buffer; instead the position keeps advancing past it
 * and check() reports the overflow once, after a batch of reads:
 *
 * @code
 * BitCursor cursor(data, size);
 * std::uint64_t base = cursor.read_u64(33);
 * cursor.skip(6);
 * std::uint16_t extension = cursor.read_u16(9);
 * if (cursor.check() != Error::Ok) {
 *     // record was truncated
 * }
 * @endcode
 *
 * A cursor is a single-owner sequential object. Use peek() to get an
 * independent copy for look-ahead or for use on another thread.
 */

#ifndef BITCURSOR_CURSOR_HPP
#define BITCURSOR_CURSOR_HPP

#include "config.hpp"
#include "bitops.hpp"
#include "error.hpp"
#include "source_buffer.hpp"
#include <algorithm>
#include <span>

#if !BITCURSOR_NO_EXCEPTIONS
#include <string>
#endif

namespace bitcursor {

/**
 * @brief Sequential bit reader over an immutable byte buffer.
 */
class BitCursor {
public:
    /**
     * @brief Construct a cursor over @p size bytes at @p data.
     *
     * Never fails. Buffers of WORD_BYTES or more are borrowed and must
     * outlive the cursor; shorter ones (including empty) are copied and
     * zero-padded.
     *
     * @param data Source bytes (may be null when @p size is 0)
     * @param size Number of meaningful bytes
     */
    BitCursor(const std::uint8_t* data, std::size_t size) noexcept
        : buffer_(data, size), bit_pos_(0) {}

    // ------------------------------------------------------------------
    // General-width reads
    // ------------------------------------------------------------------

    /**
     * @brief Read up to 32 bits as an unsigned big-endian value.
     *
     * This is the primitive every other numeric read is built on.
     *
     * @param bits Number of bits to read (1-32)
     * @return Value right-justified, upper bits zero
     */
    std::uint32_t read_u32(std::size_t bits) noexcept {
        const std::uint64_t word = aligned_word();
        bit_pos_ += bits;
        // Split shift keeps bits == 0 well defined
        return static_cast<std::uint32_t>((word >> 1) >> (WORD_BITS - 1 - bits));
    }

    /**
     * @brief Read up to 32 bits as a signed big-endian value.
     *
     * The arithmetic right shift of the loaded word performs the sign
     * extension.
     *
     * @param bits Number of bits to read (1-32)
     * @return Two's complement value
     */
    std::int32_t read_s32(std::size_t bits) noexcept {
        const auto word = static_cast<std::int64_t>(aligned_word());
        bit_pos_ += bits;
        return static_cast<std::int32_t>((word >> 1) >> (WORD_BITS - 1 - bits));
    }

    /**
     * @brief Read up to 64 bits as an unsigned big-endian value.
     *
     * @param bits Number of bits to read (1-64)
     */
    std::uint64_t read_u64(std::size_t bits) noexcept {
        std::uint64_t high = 0;
        if (bits > MAX_PRIMITIVE_BITS) {
            high = static_cast<std::uint64_t>(read_u32(bits - MAX_PRIMITIVE_BITS))
                   << MAX_PRIMITIVE_BITS;
            bits = MAX_PRIMITIVE_BITS;
        }
        return high | read_u32(bits);
    }

    /**
     * @brief Read up to 64 bits as a signed big-endian value.
     *
     * @param bits Number of bits to read (1-64)
     */
    std::int64_t read_s64(std::size_t bits) noexcept {
        return sign_extend(read_u64(bits), bits);
    }

    /// Read up to 8 bits (1-8)
    std::uint8_t read_u8(std::size_t bits) noexcept {
        return static_cast<std::uint8_t>(read_u32(bits));
    }

    /// Read up to 8 signed bits (1-8)
    std::int8_t read_s8(std::size_t bits) noexcept {
        return static_cast<std::int8_t>(read_s32(bits));
    }

    /// Read up to 16 bits (1-16)
    std::uint16_t read_u16(std::size_t bits) noexcept {
        return static_cast<std::uint16_t>(read_u32(bits));
    }

    /// Read up to 16 signed bits (1-16)
    std::int16_t read_s16(std::size_t bits) noexcept {
        return static_cast<std::int16_t>(read_s32(bits));
    }

    // ------------------------------------------------------------------
    // Fixed-width reads
    // ------------------------------------------------------------------

    std::uint8_t read_byte() noexcept { return read_u8(8); }
    std::uint16_t read_be16() noexcept { return read_u16(16); }
    std::uint32_t read_be32() noexcept { return read_u32(32); }
    std::uint64_t read_be64() noexcept { return read_u64(64); }

    std::uint16_t read_le16() noexcept { return byteswap16(read_be16()); }
    std::uint32_t read_le32() noexcept { return byteswap32(read_be32()); }
    std::uint64_t read_le64() noexcept { return byteswap64(read_be64()); }

    /**
     * @brief Read a single bit.
     *
     * Past the physical end the result is false.
     */
    bool read_bit() noexcept {
        const std::size_t last = buffer_.physical_size() - 1;
        const std::size_t skip = std::min(bit_pos_ >> 3, last);
        const std::size_t shift = bit_pos_ - (skip << 3);
        const unsigned bit = (shift < 8) ? (buffer_[skip] >> (7 - shift)) & 1U : 0U;
        ++bit_pos_;
        return bit != 0;
    }

    // ------------------------------------------------------------------
    // Checked reads
    // ------------------------------------------------------------------

    /**
     * @brief Read @p bits only if they lie within the logical buffer.
     *
     * @param bits Number of bits to read (1-64)
     * @param[out] value Unsigned value, untouched on error
     * @return Error::Ok, Error::InvalidArg for a bad width, or
     *         Error::Overflow (position unchanged) if too few bits remain
     */
    Error try_read_u64(std::size_t bits, std::uint64_t& value) noexcept {
        if (bits == 0 || bits > MAX_READ_BITS) {
            return Error::InvalidArg;
        }
        if (bits > remaining_bits()) {
            return Error::Overflow;
        }
        value = read_u64(bits);
        return Error::Ok;
    }

    /**
     * @brief Signed counterpart of try_read_u64().
     */
    Error try_read_s64(std::size_t bits, std::int64_t& value) noexcept {
        std::uint64_t raw = 0;
        auto result = try_read_u64(bits, raw);
        if (result != Error::Ok) {
            return result;
        }
        value = sign_extend(raw, bits);
        return Error::Ok;
    }

    // ------------------------------------------------------------------
    // Positioning
    // ------------------------------------------------------------------

    /// Advance @p bits without reading
    void skip(std::size_t bits) noexcept { bit_pos_ += bits; }

    /**
     * @brief Skip to next byte boundary.
     *
     * No-op when already aligned.
     */
    void align_byte() noexcept {
        std::size_t bit_offset = bit_pos_ & 7;
        if (bit_offset != 0) {
            bit_pos_ += (8 - bit_offset);
        }
    }

    /// Rewind to the first bit; buffer and limits are kept
    void reset() noexcept { bit_pos_ = 0; }

    /**
     * @brief Independent copy of the cursor at its current position.
     *
     * The copy shares the caller's bytes (or carries its own padding word)
     * and advancing it leaves this cursor untouched.
     */
    [[nodiscard]] BitCursor peek() const noexcept { return *this; }

    // ------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------

    /// Absolute bit offset from the start of the buffer
    [[nodiscard]] std::size_t position() const noexcept { return bit_pos_; }

    /// Logical size in bytes
    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }

    /**
     * @brief Number of logical bits left to read.
     *
     * Zero, never negative, once the cursor has overrun the buffer.
     */
    [[nodiscard]] std::size_t remaining_bits() const noexcept {
        const std::size_t total = buffer_.size() << 3;
        return total - std::min(bit_pos_, total);
    }

    /**
     * @brief Unread bytes, starting at the byte containing the position.
     *
     * The view is byte aligned even when the cursor is not, and empty once
     * the position reaches the logical end.
     */
    [[nodiscard]] std::span<const std::uint8_t> remaining_bytes() const noexcept {
        const std::size_t skip = bit_pos_ >> 3;
        if (skip >= buffer_.size()) {
            return {};
        }
        return {buffer_.data() + skip, buffer_.size() - skip};
    }

    /**
     * @brief Report whether any read went past the logical end.
     *
     * @return Error::Overflow if position() > size() * 8, else Error::Ok
     */
    [[nodiscard]] Error check() const noexcept {
        return (bit_pos_ > (buffer_.size() << 3)) ? Error::Overflow : Error::Ok;
    }

#if !BITCURSOR_NO_EXCEPTIONS
    /**
     * @brief Throwing form of check().
     *
     * @throws OverflowException if the cursor has read past the logical end
     */
    void ensure() const {
        if (check() != Error::Ok) {
            throw OverflowException("bit position " + std::to_string(bit_pos_) +
                                    " past end of " + std::to_string(buffer_.size()) +
                                    "-byte buffer");
        }
    }
#endif

    /// Underlying source bytes
    [[nodiscard]] const SourceBuffer& buffer() const noexcept { return buffer_; }

private:
    SourceBuffer buffer_;
    std::size_t bit_pos_;

    /**
     * @brief Load the word holding the position, consumed bits shifted out.
     *
     * The load offset is the 4-byte boundary below the position, clamped so
     * the 8-byte load stays inside the physical buffer. Any read of up to
     * 32 bits that ends inside the physical buffer is fully covered by this
     * word. Far past the end the shift can reach 64 and the word is zero.
     */
    [[nodiscard]] std::uint64_t aligned_word() const noexcept {
        const std::size_t skip = std::min((bit_pos_ >> 5) << 2, buffer_.safe_skip_limit());
        const std::size_t shift = bit_pos_ - (skip << 3);
        const std::uint64_t word = buffer_.word_at(skip);
        return (shift < WORD_BITS) ? word << shift : 0;
    }
};

} // namespace bitcursor

#endif // BITCURSOR_CURSOR_HPP
