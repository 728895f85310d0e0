/**
 * @file source_buffer.hpp
 * @brief Byte buffer handle guaranteeing a minimum physical length.
 *
 * Every extraction loads a full 64-bit word, so the bytes behind a cursor
 * must always span at least WORD_BYTES. Buffers that already do are
 * borrowed as-is; shorter ones are copied into an inline zero-padded word.
 *
 * @par Ownership
 * A borrowed buffer is not copied and must outlive every handle (and every
 * cursor) referring to it. A padded buffer lives inside the handle, so no
 * heap allocation ever takes place.
 */

#ifndef BITCURSOR_SOURCE_BUFFER_HPP
#define BITCURSOR_SOURCE_BUFFER_HPP

#include "config.hpp"
#include "bitops.hpp"
#include <array>
#include <cstring>

namespace bitcursor {

/**
 * @brief Immutable source bytes, borrowed or padded.
 *
 * Invariants:
 * - physical_size() >= WORD_BYTES
 * - safe_skip_limit() + WORD_BYTES <= physical_size()
 * - size() <= physical_size()
 */
class SourceBuffer {
public:
    /**
     * @brief Wrap @p size bytes at @p data.
     *
     * @param data Source bytes (may be null when @p size is 0)
     * @param size Number of meaningful bytes
     */
    SourceBuffer(const std::uint8_t* data, std::size_t size) noexcept
        : padding_{}, data_(data), physical_size_(size), size_(size) {
        if (size < WORD_BYTES) {
            if (size > 0) {
                std::memcpy(padding_.data(), data, size);
            }
            data_ = padding_.data();
            physical_size_ = WORD_BYTES;
        }
    }

    SourceBuffer(const SourceBuffer& other) noexcept
        : padding_(other.padding_), data_(other.data_),
          physical_size_(other.physical_size_), size_(other.size_) {
        rebind(other);
    }

    SourceBuffer& operator=(const SourceBuffer& other) noexcept {
        if (this != &other) {
            padding_ = other.padding_;
            data_ = other.data_;
            physical_size_ = other.physical_size_;
            size_ = other.size_;
            rebind(other);
        }
        return *this;
    }

    /// Logical size in bytes, as passed at construction
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /// Physical size in bytes, never less than WORD_BYTES
    [[nodiscard]] std::size_t physical_size() const noexcept { return physical_size_; }

    /// Largest byte offset at which a full word load stays in bounds
    [[nodiscard]] std::size_t safe_skip_limit() const noexcept {
        return physical_size_ - WORD_BYTES;
    }

    /// True when the bytes were copied into the inline padding word
    [[nodiscard]] bool owned() const noexcept { return data_ == padding_.data(); }

    [[nodiscard]] const std::uint8_t* data() const noexcept { return data_; }

    [[nodiscard]] std::uint8_t operator[](std::size_t index) const noexcept {
        return data_[index];
    }

    /**
     * @brief Load the big-endian word starting at @p offset.
     *
     * @param offset Byte offset, at most safe_skip_limit()
     */
    [[nodiscard]] std::uint64_t word_at(std::size_t offset) const noexcept {
        return load_be64(data_ + offset);
    }

private:
    std::array<std::uint8_t, WORD_BYTES> padding_;
    const std::uint8_t* data_;
    std::size_t physical_size_;
    std::size_t size_;

    // A copied padding word must be read from our own storage.
    void rebind(const SourceBuffer& other) noexcept {
        if (other.owned()) {
            data_ = padding_.data();
        }
    }
};

} // namespace bitcursor

#endif // BITCURSOR_SOURCE_BUFFER_HPP
