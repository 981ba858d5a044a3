#pragma once

#include "typecase/core/types.hpp"
#include <optional>
#include <string_view>

namespace typecase::fonts::freetype {
class FreeTypeFace;
} // namespace typecase::fonts::freetype

namespace typecase::text {

// ============================================================================
// Text Measure
// ============================================================================

/// Horizontal positions within a single line of text
class TextMeasure {
public:
    virtual ~TextMeasure() = default;

    /// x of the caret before byte_offset; nullopt past the end of text
    [[nodiscard]] virtual std::optional<f64> x_for_offset(std::string_view text,
                                                          usize byte_offset) const = 0;
};

/// Measures with a FreeType face at its configured pixel size
class FaceTextMeasure : public TextMeasure {
public:
    explicit FaceTextMeasure(const fonts::freetype::FreeTypeFace& face) : m_face(face) {}

    [[nodiscard]] std::optional<f64> x_for_offset(std::string_view text,
                                                  usize byte_offset) const override;

private:
    const fonts::freetype::FreeTypeFace& m_face;
};

// ============================================================================
// Grapheme hit testing
// ============================================================================

struct GraphemeBoundaries {
    usize curr_idx{0};   // Byte offset of the cluster
    usize next_idx{0};   // Byte offset of the following cluster (or text length)
    f64 leading{0};      // x of curr_idx
    f64 trailing{0};     // x of next_idx, the leading edge of the next cluster

    [[nodiscard]] bool operator==(const GraphemeBoundaries& other) const {
        return curr_idx == other.curr_idx && next_idx == other.next_idx &&
               leading == other.leading && trailing == other.trailing;
    }
};

struct HitTestPoint {
    usize idx{0};
    bool is_inside{false};

    [[nodiscard]] bool operator==(const HitTestPoint& other) const {
        return idx == other.idx && is_inside == other.is_inside;
    }
};

/// Boundaries of the grapheme_position-th cluster of a single line of text;
/// nullopt when there is no such cluster.
[[nodiscard]] std::optional<GraphemeBoundaries> get_grapheme_boundaries(
    const TextMeasure& measure,
    std::string_view text,
    usize grapheme_position);

/// Nearest cluster edge to point_x when it lies within [leading, trailing].
/// The midpoint and everything after it resolve to the trailing edge.
[[nodiscard]] std::optional<HitTestPoint> point_x_in_grapheme(
    f64 point_x,
    const GraphemeBoundaries& boundaries);

} // namespace typecase::text
