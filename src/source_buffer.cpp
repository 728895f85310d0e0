/**
 * @file source_buffer.cpp
 * @brief SourceBuffer compilation unit.
 *
 * @see include/bitcursor/source_buffer.hpp for the full implementation
 */

#include <bitcursor/source_buffer.hpp>

// All implementation is in the header (inline functions)
