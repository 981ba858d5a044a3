#include <gtest/gtest.h>
#include "typecase/text/grapheme.hpp"

using namespace typecase;
using namespace typecase::text;

// ============================================================================
// Break properties
// ============================================================================

TEST(GraphemePropertyTest, Basic) {
    EXPECT_EQ(get_grapheme_break_property('a'), GraphemeBreakProperty::Other);
    EXPECT_EQ(get_grapheme_break_property('\r'), GraphemeBreakProperty::CR);
    EXPECT_EQ(get_grapheme_break_property('\n'), GraphemeBreakProperty::LF);
    EXPECT_EQ(get_grapheme_break_property('\t'), GraphemeBreakProperty::Control);
    EXPECT_EQ(get_grapheme_break_property(0x0301), GraphemeBreakProperty::Extend);
    EXPECT_EQ(get_grapheme_break_property(0x200D), GraphemeBreakProperty::ZWJ);
    EXPECT_EQ(get_grapheme_break_property(0x1F1FA), GraphemeBreakProperty::RegionalIndicator);
    EXPECT_EQ(get_grapheme_break_property(0x1F600), GraphemeBreakProperty::ExtendedPictographic);
    EXPECT_EQ(get_grapheme_break_property(0x1F3FD), GraphemeBreakProperty::Extend);
}

TEST(GraphemePropertyTest, Hangul) {
    EXPECT_EQ(get_grapheme_break_property(0x1100), GraphemeBreakProperty::L);
    EXPECT_EQ(get_grapheme_break_property(0x1161), GraphemeBreakProperty::V);
    EXPECT_EQ(get_grapheme_break_property(0x11AB), GraphemeBreakProperty::T);
    EXPECT_EQ(get_grapheme_break_property(0xAC00), GraphemeBreakProperty::LV);   // 가
    EXPECT_EQ(get_grapheme_break_property(0xD55C), GraphemeBreakProperty::LVT);  // 한
}

// ============================================================================
// Segmentation
// ============================================================================

TEST(GraphemeSegmentationTest, Empty) {
    EXPECT_TRUE(grapheme_offsets("").empty());
    EXPECT_EQ(grapheme_count(""), 0u);
}

TEST(GraphemeSegmentationTest, Ascii) {
    auto offsets = grapheme_offsets("piet");

    ASSERT_EQ(offsets.size(), 4u);
    EXPECT_EQ(offsets[0], 0u);
    EXPECT_EQ(offsets[3], 3u);
}

TEST(GraphemeSegmentationTest, CrLfIsOneCluster) {
    auto offsets = grapheme_offsets("a\r\nb");

    ASSERT_EQ(offsets.size(), 3u);
    EXPECT_EQ(offsets[1], 1u);
    EXPECT_EQ(offsets[2], 3u);
}

TEST(GraphemeSegmentationTest, CombiningMark) {
    // e + COMBINING ACUTE ACCENT, then x
    auto offsets = grapheme_offsets("e\xCC\x81x");

    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], 3u);
}

TEST(GraphemeSegmentationTest, MultiByteCodePoints) {
    // é 中 😀
    auto offsets = grapheme_offsets("\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");

    ASSERT_EQ(offsets.size(), 3u);
    EXPECT_EQ(offsets[1], 2u);
    EXPECT_EQ(offsets[2], 5u);
}

TEST(GraphemeSegmentationTest, RegionalIndicatorPairs) {
    // US flag, FR flag, then a lone indicator
    const char* text =
        "\xF0\x9F\x87\xBA\xF0\x9F\x87\xB8"
        "\xF0\x9F\x87\xAB\xF0\x9F\x87\xB7"
        "\xF0\x9F\x87\xA9";
    auto offsets = grapheme_offsets(text);

    ASSERT_EQ(offsets.size(), 3u);
    EXPECT_EQ(offsets[1], 8u);
    EXPECT_EQ(offsets[2], 16u);
}

TEST(GraphemeSegmentationTest, EmojiZwjSequence) {
    // MAN ZWJ WOMAN ZWJ GIRL, then a
    const char* text =
        "\xF0\x9F\x91\xA8\xE2\x80\x8D"
        "\xF0\x9F\x91\xA9\xE2\x80\x8D"
        "\xF0\x9F\x91\xA7"
        "a";

    EXPECT_EQ(grapheme_count(text), 2u);
}

TEST(GraphemeSegmentationTest, EmojiModifier) {
    // WAVING HAND + medium skin tone
    EXPECT_EQ(grapheme_count("\xF0\x9F\x91\x8B\xF0\x9F\x8F\xBD"), 1u);
}

TEST(GraphemeSegmentationTest, ZwjWithoutPictographBreaks) {
    // a ZWJ b: ZWJ joins a, but b starts a new cluster
    auto offsets = grapheme_offsets("a\xE2\x80\x8D" "b");

    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], 4u);
}

TEST(GraphemeSegmentationTest, HangulJamoSequence) {
    // L V T conjoining jamo, then precomposed 한
    const char* text = "\xE1\x84\x92\xE1\x85\xA1\xE1\x86\xAB\xED\x95\x9C";
    auto offsets = grapheme_offsets(text);

    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], 9u);
}

TEST(GraphemeSegmentationTest, ControlAlwaysBreaks) {
    // Combining mark after a tab does not attach to it
    EXPECT_EQ(grapheme_count("\t\xCC\x81"), 2u);
}

TEST(GraphemeSegmentationTest, MalformedUtf8AdvancesByByte) {
    EXPECT_EQ(grapheme_count("\xFF\xFE"), 2u);
}
