/**
 * Extended grapheme cluster segmentation
 */

#include "typecase/text/grapheme.hpp"

namespace typecase::text {

namespace {

struct PropertyRange {
    u32 start;
    u32 end;
    GraphemeBreakProperty property;
};

// clang-format off
static const std::vector<PropertyRange> g_property_ranges = {
    // Controls and format characters
    {0x0000, 0x0009, GraphemeBreakProperty::Control},
    {0x000B, 0x000C, GraphemeBreakProperty::Control},
    {0x000E, 0x001F, GraphemeBreakProperty::Control},
    {0x007F, 0x009F, GraphemeBreakProperty::Control},
    {0x00AD, 0x00AD, GraphemeBreakProperty::Control},
    {0x200B, 0x200B, GraphemeBreakProperty::Control},
    {0x200E, 0x200F, GraphemeBreakProperty::Control},
    {0x2028, 0x202E, GraphemeBreakProperty::Control},
    {0x2060, 0x206F, GraphemeBreakProperty::Control},
    {0xFEFF, 0xFEFF, GraphemeBreakProperty::Control},

    // Combining marks
    {0x0300, 0x036F, GraphemeBreakProperty::Extend},
    {0x0483, 0x0489, GraphemeBreakProperty::Extend},
    {0x0591, 0x05BD, GraphemeBreakProperty::Extend},
    {0x05BF, 0x05BF, GraphemeBreakProperty::Extend},
    {0x05C1, 0x05C2, GraphemeBreakProperty::Extend},
    {0x05C4, 0x05C5, GraphemeBreakProperty::Extend},
    {0x05C7, 0x05C7, GraphemeBreakProperty::Extend},
    {0x0610, 0x061A, GraphemeBreakProperty::Extend},
    {0x064B, 0x065F, GraphemeBreakProperty::Extend},
    {0x0670, 0x0670, GraphemeBreakProperty::Extend},
    {0x06D6, 0x06DC, GraphemeBreakProperty::Extend},
    {0x06DF, 0x06E4, GraphemeBreakProperty::Extend},
    {0x06E7, 0x06E8, GraphemeBreakProperty::Extend},
    {0x06EA, 0x06ED, GraphemeBreakProperty::Extend},

    // Devanagari
    {0x0900, 0x0902, GraphemeBreakProperty::Extend},
    {0x0903, 0x0903, GraphemeBreakProperty::SpacingMark},
    {0x093A, 0x093A, GraphemeBreakProperty::Extend},
    {0x093B, 0x093B, GraphemeBreakProperty::SpacingMark},
    {0x093C, 0x093C, GraphemeBreakProperty::Extend},
    {0x093E, 0x0940, GraphemeBreakProperty::SpacingMark},
    {0x0941, 0x0948, GraphemeBreakProperty::Extend},
    {0x0949, 0x094C, GraphemeBreakProperty::SpacingMark},
    {0x094D, 0x094D, GraphemeBreakProperty::Extend},
    {0x094E, 0x094F, GraphemeBreakProperty::SpacingMark},
    {0x0951, 0x0957, GraphemeBreakProperty::Extend},
    {0x0962, 0x0963, GraphemeBreakProperty::Extend},

    // Thai
    {0x0E31, 0x0E31, GraphemeBreakProperty::Extend},
    {0x0E33, 0x0E33, GraphemeBreakProperty::SpacingMark},
    {0x0E34, 0x0E3A, GraphemeBreakProperty::Extend},
    {0x0E47, 0x0E4E, GraphemeBreakProperty::Extend},

    // Hangul jamo
    {0x1100, 0x115F, GraphemeBreakProperty::L},
    {0x1160, 0x11A7, GraphemeBreakProperty::V},
    {0x11A8, 0x11FF, GraphemeBreakProperty::T},
    {0xA960, 0xA97C, GraphemeBreakProperty::L},
    {0xD7B0, 0xD7C6, GraphemeBreakProperty::V},
    {0xD7CB, 0xD7FB, GraphemeBreakProperty::T},

    // More combining marks
    {0x1AB0, 0x1AFF, GraphemeBreakProperty::Extend},
    {0x1DC0, 0x1DFF, GraphemeBreakProperty::Extend},
    {0x200C, 0x200C, GraphemeBreakProperty::Extend},
    {0x200D, 0x200D, GraphemeBreakProperty::ZWJ},
    {0x20D0, 0x20F0, GraphemeBreakProperty::Extend},
    {0x302A, 0x302F, GraphemeBreakProperty::Extend},
    {0x3099, 0x309A, GraphemeBreakProperty::Extend},
    {0xFE00, 0xFE0F, GraphemeBreakProperty::Extend},
    {0xFE20, 0xFE2F, GraphemeBreakProperty::Extend},
    {0xFF9E, 0xFF9F, GraphemeBreakProperty::Extend},
    {0x1F3FB, 0x1F3FF, GraphemeBreakProperty::Extend},   // Emoji modifiers
    {0xE0020, 0xE007F, GraphemeBreakProperty::Extend},   // Tags
    {0xE0100, 0xE01EF, GraphemeBreakProperty::Extend},   // Variation selectors supplement

    // Prepend
    {0x0600, 0x0605, GraphemeBreakProperty::Prepend},
    {0x06DD, 0x06DD, GraphemeBreakProperty::Prepend},
    {0x110BD, 0x110BD, GraphemeBreakProperty::Prepend},

    // Regional indicators
    {0x1F1E6, 0x1F1FF, GraphemeBreakProperty::RegionalIndicator},

    // Pictographs
    {0x00A9, 0x00A9, GraphemeBreakProperty::ExtendedPictographic},
    {0x00AE, 0x00AE, GraphemeBreakProperty::ExtendedPictographic},
    {0x203C, 0x203C, GraphemeBreakProperty::ExtendedPictographic},
    {0x2049, 0x2049, GraphemeBreakProperty::ExtendedPictographic},
    {0x2122, 0x2122, GraphemeBreakProperty::ExtendedPictographic},
    {0x2139, 0x2139, GraphemeBreakProperty::ExtendedPictographic},
    {0x2194, 0x21AA, GraphemeBreakProperty::ExtendedPictographic},
    {0x231A, 0x23FF, GraphemeBreakProperty::ExtendedPictographic},
    {0x25AA, 0x25FE, GraphemeBreakProperty::ExtendedPictographic},
    {0x2600, 0x27BF, GraphemeBreakProperty::ExtendedPictographic},
    {0x2934, 0x2935, GraphemeBreakProperty::ExtendedPictographic},
    {0x2B05, 0x2B55, GraphemeBreakProperty::ExtendedPictographic},
    {0x3030, 0x3030, GraphemeBreakProperty::ExtendedPictographic},
    {0x303D, 0x303D, GraphemeBreakProperty::ExtendedPictographic},
    {0x3297, 0x3299, GraphemeBreakProperty::ExtendedPictographic},
    {0x1F000, 0x1F1E5, GraphemeBreakProperty::ExtendedPictographic},
    {0x1F200, 0x1F3FA, GraphemeBreakProperty::ExtendedPictographic},
    {0x1F400, 0x1FAFF, GraphemeBreakProperty::ExtendedPictographic},
};
// clang-format on

constexpr u32 kHangulSyllableBase = 0xAC00;
constexpr u32 kHangulSyllableLast = 0xD7A3;
constexpr u32 kHangulTCount = 28;

struct Segmenter {
    GraphemeBreakProperty prev{GraphemeBreakProperty::Other};
    // Inside ExtPict Extend*, or ExtPict Extend* ZWJ when prev is ZWJ
    bool in_pictographic_sequence{false};
    usize regional_indicator_run{0};

    // Whether a cluster boundary falls between prev and next (GB3-GB999)
    [[nodiscard]] bool is_boundary(GraphemeBreakProperty next) const {
        using P = GraphemeBreakProperty;

        if (prev == P::CR && next == P::LF) return false;                          // GB3
        if (prev == P::CR || prev == P::LF || prev == P::Control) return true;      // GB4
        if (next == P::CR || next == P::LF || next == P::Control) return true;      // GB5

        if (prev == P::L &&
            (next == P::L || next == P::V || next == P::LV || next == P::LVT)) {    // GB6
            return false;
        }
        if ((prev == P::LV || prev == P::V) && (next == P::V || next == P::T)) {  // GB7
            return false;
        }
        if ((prev == P::LVT || prev == P::T) && next == P::T) return false;       // GB8

        if (next == P::Extend || next == P::ZWJ) return false;                    // GB9
        if (next == P::SpacingMark) return false;                                 // GB9a
        if (prev == P::Prepend) return false;                                     // GB9b

        if (prev == P::ZWJ && next == P::ExtendedPictographic &&
            in_pictographic_sequence) {                                           // GB11
            return false;
        }

        if (prev == P::RegionalIndicator && next == P::RegionalIndicator &&
            regional_indicator_run % 2 == 1) {                                    // GB12, GB13
            return false;
        }

        return true;                                                              // GB999
    }

    void advance(GraphemeBreakProperty next) {
        using P = GraphemeBreakProperty;

        if (next == P::ExtendedPictographic) {
            in_pictographic_sequence = true;
        } else if (next == P::Extend) {
            // Extend continues a pictographic sequence
        } else if (next == P::ZWJ) {
            // keep state; GB11 checks prev == ZWJ
        } else {
            in_pictographic_sequence = false;
        }
        if (prev == P::ZWJ && next == P::Extend) {
            in_pictographic_sequence = false;
        }

        if (next == P::RegionalIndicator) {
            ++regional_indicator_run;
        } else {
            regional_indicator_run = 0;
        }

        prev = next;
    }
};

} // anonymous namespace

GraphemeBreakProperty get_grapheme_break_property(unicode::CodePoint cp) {
    if (cp == '\r') return GraphemeBreakProperty::CR;
    if (cp == '\n') return GraphemeBreakProperty::LF;

    if (cp >= kHangulSyllableBase && cp <= kHangulSyllableLast) {
        return (cp - kHangulSyllableBase) % kHangulTCount == 0
            ? GraphemeBreakProperty::LV
            : GraphemeBreakProperty::LVT;
    }

    // Linear search is fine for the table size
    for (const auto& range : g_property_ranges) {
        if (cp >= range.start && cp <= range.end) {
            return range.property;
        }
    }

    return GraphemeBreakProperty::Other;
}

std::vector<usize> grapheme_offsets(std::string_view text) {
    std::vector<usize> offsets;
    Segmenter segmenter;

    usize pos = 0;
    while (pos < text.size()) {
        auto decoded = unicode::utf8_decode(text.data() + pos, text.size() - pos);
        auto property = get_grapheme_break_property(decoded.code_point);

        if (pos == 0 || segmenter.is_boundary(property)) {
            offsets.push_back(pos);
        }
        segmenter.advance(property);
        pos += decoded.bytes_consumed;
    }

    return offsets;
}

usize grapheme_count(std::string_view text) {
    return grapheme_offsets(text).size();
}

} // namespace typecase::text
