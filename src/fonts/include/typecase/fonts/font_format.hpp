#pragma once

#include "typecase/core/types.hpp"
#include "typecase/core/memory.hpp"

namespace typecase::fonts {

// ============================================================================
// Font container format
// ============================================================================

enum class FontFileType : u8 {
    Unknown,
    TrueType,   ///< 'true' or 0x00010000 sfnt
    Cff,        ///< 'OTTO' OpenType with CFF outlines
};

enum class FontFaceType : u8 {
    Unknown,
    TrueType,
    Cff,
};

[[nodiscard]] const char* font_file_type_name(FontFileType type);
[[nodiscard]] const char* font_face_type_name(FontFaceType type);

struct FontFileAnalysis {
    bool supported{false};
    FontFileType file_type{FontFileType::Unknown};
    FontFaceType face_type{FontFaceType::Unknown};
    u32 face_count{0};
};

// sfnt version tags, read big-endian from the first four bytes
constexpr u32 kSfntTagTrue = 0x74727565;      // 'true'
constexpr u32 kSfntVersion1 = 0x00010000;
constexpr u32 kSfntTagOtto = 0x4F54544F;      // 'OTTO'

/// Identify the container format from the sfnt header tag. Buffers shorter
/// than the tag are reported unsupported. Every supported file is reported as
/// holding exactly one face; collections ('ttcf') are not recognized.
[[nodiscard]] FontFileAnalysis sniff_font_format(ByteSpanConst bytes);

} // namespace typecase::fonts
