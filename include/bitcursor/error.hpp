/**
 * @file error.hpp
 * @brief bitcursor error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef BITCURSOR_ERROR_HPP
#define BITCURSOR_ERROR_HPP

#include "config.hpp"

#if !BITCURSOR_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bitcursor {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * Overflow is the only condition a cursor itself can reach; InvalidArg is
 * reported by the checked read helpers for out-of-range widths.
 */
enum class Error {
    Ok = 0,          ///< Success
    InvalidArg = -1, ///< Invalid argument
    Overflow = -2    ///< Read past the logical end of the buffer
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Read past end of buffer";
    default:
        return "Unknown error";
    }
}

#if !BITCURSOR_NO_EXCEPTIONS

/**
 * @brief Base exception for bitcursor errors.
 */
class BitCursorException : public std::runtime_error {
public:
    explicit BitCursorException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for reads past the logical end of the buffer.
 */
class OverflowException : public BitCursorException {
public:
    explicit OverflowException(const std::string& message)
        : BitCursorException(message, Error::Overflow) {}
};

#endif // !BITCURSOR_NO_EXCEPTIONS

} // namespace bitcursor

#endif // BITCURSOR_ERROR_HPP
