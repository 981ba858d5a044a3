#pragma once

#include "typecase/core/types.hpp"
#include "typecase/core/unicode.hpp"
#include <string_view>
#include <vector>

namespace typecase::text {

// ============================================================================
// Grapheme Cluster Break Property (UAX #29, simplified tables)
// ============================================================================

enum class GraphemeBreakProperty {
    Other,
    CR,
    LF,
    Control,
    Extend,
    ZWJ,
    RegionalIndicator,
    SpacingMark,
    Prepend,
    L,    // Hangul leading jamo
    V,    // Hangul vowel jamo
    T,    // Hangul trailing jamo
    LV,   // Hangul LV syllable
    LVT,  // Hangul LVT syllable
    ExtendedPictographic,
};

[[nodiscard]] GraphemeBreakProperty get_grapheme_break_property(unicode::CodePoint cp);

// ============================================================================
// Grapheme segmentation
// ============================================================================

/// Byte offsets at which extended grapheme clusters start, in order. Empty
/// for empty text; the first entry is always 0 otherwise.
[[nodiscard]] std::vector<usize> grapheme_offsets(std::string_view text);

/// Number of extended grapheme clusters in text
[[nodiscard]] usize grapheme_count(std::string_view text);

} // namespace typecase::text
