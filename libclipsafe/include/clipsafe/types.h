/**
 * @file types.h
 * @brief Core type definitions for clipsafe
 */

#ifndef CLIPSAFE_TYPES_H
#define CLIPSAFE_TYPES_H

#include "platform.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clipsafe {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Default maximum payload size (10 MiB)
constexpr size_t DEFAULT_MAX_DATA_SIZE = 10 * 1024 * 1024;

// ============================================================================
// Text Helpers
// ============================================================================

/**
 * @brief Check that a string is well-formed UTF-8
 *
 * Rejects overlong encodings, surrogate code points and values above
 * U+10FFFF.
 */
CLIPSAFE_API bool is_valid_utf8(const std::string &text);

/**
 * @brief Remove leading and trailing ASCII whitespace
 */
CLIPSAFE_API std::string trim_whitespace(const std::string &text);

} // namespace clipsafe

#endif // CLIPSAFE_TYPES_H
