#include <gtest/gtest.h>
#include "typecase/text/hit_test.hpp"
#include "typecase/fonts/freetype_engine.hpp"
#include "typecase/fonts/memory_font_collection.hpp"
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <vector>

using namespace typecase;
using namespace typecase::text;

namespace {

// Every byte is 10 units wide
class FixedWidthMeasure : public TextMeasure {
public:
    std::optional<f64> x_for_offset(std::string_view text, usize byte_offset) const override {
        if (byte_offset > text.size()) {
            return std::nullopt;
        }
        return static_cast<f64>(byte_offset) * 10.0;
    }
};

} // anonymous namespace

// ============================================================================
// Grapheme boundaries
// ============================================================================

TEST(GraphemeBoundariesTest, AsciiPositions) {
    FixedWidthMeasure measure;

    auto last = get_grapheme_boundaries(measure, "piet", 3);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->curr_idx, 3u);
    EXPECT_EQ(last->next_idx, 4u);
    EXPECT_DOUBLE_EQ(last->leading, 30.0);
    EXPECT_DOUBLE_EQ(last->trailing, 40.0);

    auto first = get_grapheme_boundaries(measure, "piet", 0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, (GraphemeBoundaries{0, 1, 0.0, 10.0}));
}

TEST(GraphemeBoundariesTest, PastEndIsNone) {
    FixedWidthMeasure measure;

    EXPECT_FALSE(get_grapheme_boundaries(measure, "piet", 4).has_value());
    EXPECT_FALSE(get_grapheme_boundaries(measure, "", 0).has_value());
}

TEST(GraphemeBoundariesTest, MultiByteCluster) {
    FixedWidthMeasure measure;
    // a, e + combining acute, b
    auto cluster = get_grapheme_boundaries(measure, "ae\xCC\x81" "b", 1);

    ASSERT_TRUE(cluster.has_value());
    EXPECT_EQ(cluster->curr_idx, 1u);
    EXPECT_EQ(cluster->next_idx, 4u);
    EXPECT_DOUBLE_EQ(cluster->leading, 10.0);
    EXPECT_DOUBLE_EQ(cluster->trailing, 40.0);
}

// ============================================================================
// Point in grapheme
// ============================================================================

TEST(PointInGraphemeTest, RoundsToNearestEdge) {
    GraphemeBoundaries bounds{2, 4, 10.0, 14.0};

    EXPECT_EQ(point_x_in_grapheme(10.0, bounds), (HitTestPoint{2, true}));
    EXPECT_EQ(point_x_in_grapheme(11.0, bounds), (HitTestPoint{2, true}));
    EXPECT_EQ(point_x_in_grapheme(12.0, bounds), (HitTestPoint{4, true}));
    EXPECT_EQ(point_x_in_grapheme(13.0, bounds), (HitTestPoint{4, true}));
    EXPECT_EQ(point_x_in_grapheme(14.0, bounds), (HitTestPoint{4, true}));
}

TEST(PointInGraphemeTest, OutsideIsNone) {
    GraphemeBoundaries bounds{2, 4, 10.0, 14.0};

    EXPECT_FALSE(point_x_in_grapheme(9.99, bounds).has_value());
    EXPECT_FALSE(point_x_in_grapheme(14.01, bounds).has_value());
}

TEST(PointInGraphemeTest, ZeroWidthCluster) {
    GraphemeBoundaries bounds{5, 6, 20.0, 20.0};

    EXPECT_EQ(point_x_in_grapheme(20.0, bounds), (HitTestPoint{6, true}));
}

// ============================================================================
// FaceTextMeasure
// ============================================================================

TEST(FaceTextMeasureTest, MeasuresWithLoadedFace) {
    const char* path = std::getenv("TYPECASE_TEST_FONT");
    std::ifstream in(path ? path : "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
                     std::ios::binary);
    if (!in) {
        GTEST_SKIP() << "no TrueType font available; set TYPECASE_TEST_FONT";
    }
    std::vector<u8> bytes((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());

    auto store = std::make_shared<fonts::BufferStore>();
    store->register_font(std::move(bytes));
    auto loader = make_ref<fonts::MemoryFontCollectionLoader>(store);

    fonts::freetype::FreeTypeFontEngine engine;
    auto faces = engine.load_collection(*loader);
    ASSERT_TRUE(faces.is_ok());
    ASSERT_EQ(faces.value().size(), 1u);

    FaceTextMeasure measure(*faces.value()[0]);

    auto start = measure.x_for_offset("piet", 0);
    ASSERT_TRUE(start.has_value());
    EXPECT_DOUBLE_EQ(*start, 0.0);
    EXPECT_FALSE(measure.x_for_offset("piet", 5).has_value());

    auto bounds = get_grapheme_boundaries(measure, "piet", 3);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(bounds->curr_idx, 3u);
    EXPECT_EQ(bounds->next_idx, 4u);
    EXPECT_GT(bounds->trailing, bounds->leading);

    auto hit = point_x_in_grapheme(bounds->trailing, *bounds);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->idx, 4u);
}
