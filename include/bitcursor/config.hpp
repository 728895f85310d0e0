/**
 * @file config.hpp
 * @brief bitcursor compile-time configuration.
 *
 * All tuning happens at compile time: the cursor is a pure in-memory
 * primitive and has nothing to configure at run time.
 */

#ifndef BITCURSOR_CONFIG_HPP
#define BITCURSOR_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace bitcursor {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Width of the word loaded by every extraction (bytes)
inline constexpr std::size_t WORD_BYTES = 8U;
inline constexpr std::size_t WORD_BITS = WORD_BYTES * 8U;

/// Widest value a single primitive load can return
inline constexpr std::size_t MAX_PRIMITIVE_BITS = 32U;

/// Widest value any read can return (two primitive loads)
inline constexpr std::size_t MAX_READ_BITS = 64U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITCURSOR_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef BITCURSOR_NO_EXCEPTIONS
#define BITCURSOR_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bitcursor

#endif // BITCURSOR_CONFIG_HPP
