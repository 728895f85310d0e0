/**
 * @file bitcursor.hpp
 * @brief bitcursor umbrella header.
 *
 * Pulls in the complete public API: BitCursor, its source buffer handle,
 * the byte-order helpers and the error types.
 */

#ifndef BITCURSOR_HPP
#define BITCURSOR_HPP

#include "bitops.hpp"
#include "config.hpp"
#include "cursor.hpp"
#include "error.hpp"
#include "source_buffer.hpp"

namespace bitcursor {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bitcursor

#endif // BITCURSOR_HPP
