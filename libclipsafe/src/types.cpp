/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "clipsafe/types.h"

namespace clipsafe {

// ============================================================================
// Text Helpers
// ============================================================================

bool is_valid_utf8(const std::string &text) {
  const auto *bytes = reinterpret_cast<const unsigned char *>(text.data());
  size_t size = text.size();
  size_t i = 0;

  while (i < size) {
    unsigned char lead = bytes[i];
    size_t extra = 0;
    uint32_t code_point = 0;

    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      code_point = lead & 0x07;
    } else {
      return false;
    }

    // Truncated sequence
    if (i + extra >= size) {
      return false;
    }

    for (size_t k = 1; k <= extra; ++k) {
      unsigned char next = bytes[i + k];
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }

    // Overlong forms
    if ((extra == 1 && code_point < 0x80) ||
        (extra == 2 && code_point < 0x800) ||
        (extra == 3 && code_point < 0x10000)) {
      return false;
    }

    if (code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }

    i += extra + 1;
  }

  return true;
}

std::string trim_whitespace(const std::string &text) {
  static const char *WHITESPACE = " \t\n\r\f\v";

  auto first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }

  auto last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

} // namespace clipsafe
