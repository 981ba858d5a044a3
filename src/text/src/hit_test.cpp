#include "typecase/text/hit_test.hpp"
#include "typecase/text/grapheme.hpp"
#include "typecase/fonts/freetype_engine.hpp"

namespace typecase::text {

std::optional<f64> FaceTextMeasure::x_for_offset(std::string_view text, usize byte_offset) const {
    if (byte_offset > text.size()) {
        return std::nullopt;
    }
    return static_cast<f64>(m_face.measure_text(text.substr(0, byte_offset)));
}

std::optional<GraphemeBoundaries> get_grapheme_boundaries(
    const TextMeasure& measure,
    std::string_view text,
    usize grapheme_position) {

    auto offsets = grapheme_offsets(text);
    if (grapheme_position >= offsets.size()) {
        return std::nullopt;
    }

    const usize curr_idx = offsets[grapheme_position];
    const usize next_idx = grapheme_position + 1 < offsets.size()
        ? offsets[grapheme_position + 1]
        : text.size();

    auto leading = measure.x_for_offset(text, curr_idx);
    auto trailing = measure.x_for_offset(text, next_idx);
    if (!leading || !trailing) {
        return std::nullopt;
    }

    return GraphemeBoundaries{curr_idx, next_idx, *leading, *trailing};
}

std::optional<HitTestPoint> point_x_in_grapheme(
    f64 point_x,
    const GraphemeBoundaries& boundaries) {

    const f64 leading = boundaries.leading;
    const f64 trailing = boundaries.trailing;

    if (point_x < leading || point_x > trailing) {
        return std::nullopt;
    }

    const f64 midpoint = leading + (trailing - leading) / 2.0;
    const usize idx = point_x >= midpoint ? boundaries.next_idx : boundaries.curr_idx;
    return HitTestPoint{idx, true};
}

} // namespace typecase::text
