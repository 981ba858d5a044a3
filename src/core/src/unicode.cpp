#include "typecase/core/unicode.hpp"

namespace typecase::unicode {

// ============================================================================
// UTF-8 implementation
// ============================================================================

Utf8DecodeResult utf8_decode(const char* data, usize length) {
    if (length == 0 || data == nullptr) {
        return {INVALID_CODE_POINT, 0};
    }

    auto byte = static_cast<u8>(data[0]);

    // Single byte (ASCII)
    if ((byte & 0x80) == 0) {
        return {static_cast<CodePoint>(byte), 1};
    }

    // Determine sequence length
    usize seq_len;
    CodePoint cp;

    if ((byte & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = byte & 0x07;
    } else {
        // Invalid leading byte
        return {REPLACEMENT_CHARACTER, 1};
    }

    if (length < seq_len) {
        return {REPLACEMENT_CHARACTER, length};
    }

    // Decode continuation bytes
    for (usize i = 1; i < seq_len; ++i) {
        byte = static_cast<u8>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, i};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    if (!is_valid(cp)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    // Overlong encodings
    if ((seq_len == 2 && cp < 0x80) ||
        (seq_len == 3 && cp < 0x800) ||
        (seq_len == 4 && cp < 0x10000)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    return {cp, seq_len};
}

} // namespace typecase::unicode
