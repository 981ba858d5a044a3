#include "typecase/fonts/font_format.hpp"

namespace typecase::fonts {

const char* font_file_type_name(FontFileType type) {
    switch (type) {
        case FontFileType::Unknown: return "Unknown";
        case FontFileType::TrueType: return "TrueType";
        case FontFileType::Cff: return "CFF";
    }
    return "Unknown";
}

const char* font_face_type_name(FontFaceType type) {
    switch (type) {
        case FontFaceType::Unknown: return "Unknown";
        case FontFaceType::TrueType: return "TrueType";
        case FontFaceType::Cff: return "CFF";
    }
    return "Unknown";
}

FontFileAnalysis sniff_font_format(ByteSpanConst bytes) {
    FontFileAnalysis analysis;

    if (bytes.size() < 4) {
        return analysis;
    }

    const u32 tag = (static_cast<u32>(bytes[0]) << 24) |
                    (static_cast<u32>(bytes[1]) << 16) |
                    (static_cast<u32>(bytes[2]) << 8) |
                    static_cast<u32>(bytes[3]);

    switch (tag) {
        case kSfntTagTrue:
        case kSfntVersion1:
            analysis.file_type = FontFileType::TrueType;
            analysis.face_type = FontFaceType::TrueType;
            break;
        case kSfntTagOtto:
            analysis.file_type = FontFileType::Cff;
            analysis.face_type = FontFaceType::Cff;
            break;
        default:
            return analysis;
    }

    analysis.supported = true;
    analysis.face_count = 1;
    return analysis;
}

} // namespace typecase::fonts
