/**
 * @file cursor.cpp
 * @brief BitCursor compilation unit.
 *
 * BitCursor is implemented entirely in cursor.hpp so that every read can be
 * inlined into the caller's parsing loop. This unit compiles the header in
 * isolation and gives the static library its object.
 *
 * @see include/bitcursor/cursor.hpp for the full implementation
 */

#include <bitcursor/cursor.hpp>

// All implementation is in the header (inline functions)
