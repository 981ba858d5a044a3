#pragma once

#include "types.hpp"

namespace typecase {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

// Unicode code point type
using CodePoint = char32_t;

// Invalid code point marker
constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

// Check if code point is valid
[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

// UTF-8 decoding
struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
};

/// Decode one code point. Malformed input yields REPLACEMENT_CHARACTER and
/// consumes at least one byte whenever length > 0.
[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);

} // namespace unicode

} // namespace typecase
