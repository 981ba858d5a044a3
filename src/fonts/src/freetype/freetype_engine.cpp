/**
 * FreeType font engine driving the font loading protocol
 */

#include "typecase/fonts/freetype_engine.hpp"
#include "typecase/core/logger.hpp"
#include <cstring>
#include <limits>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace typecase::fonts::freetype {

namespace {

Logger& log() {
    return logging::get("fonts");
}

std::string freetype_error_message(FT_Error error) {
    const char* text = FT_Error_String(error);
    if (text) {
        return text;
    }
    return "FreeType error " + std::to_string(error);
}

// FT_Stream callback. count == 0 is a seek and returns 0 on success;
// otherwise it returns the number of bytes copied.
unsigned long stream_read(FT_Stream stream,
                          unsigned long offset,
                          unsigned char* buffer,
                          unsigned long count) {
    auto* source = static_cast<IFontFileStream*>(stream->descriptor.pointer);

    if (count == 0) {
        return offset <= stream->size ? 0 : 1;
    }

    if (offset >= stream->size) {
        return 0;
    }

    const u64 available = static_cast<u64>(stream->size) - offset;
    const u64 length = count < available ? count : available;

    auto fragment = source->read_fragment(offset, length);
    if (!fragment) {
        return 0;
    }

    std::memcpy(buffer, fragment.value().bytes.data(), fragment.value().bytes.size());
    source->release_fragment(fragment.value().context);
    return static_cast<unsigned long>(length);
}

void stream_close(FT_Stream stream) {
    (void)stream;
}

} // anonymous namespace

const char* engine_error_name(EngineError::Code code) {
    switch (code) {
        case EngineError::Code::NotInitialized: return "NotInitialized";
        case EngineError::Code::LoaderFailure: return "LoaderFailure";
        case EngineError::Code::UnsupportedFile: return "UnsupportedFile";
        case EngineError::Code::FreeTypeFailure: return "FreeTypeFailure";
    }
    return "Unknown";
}

// ============================================================================
// Library and face state
// ============================================================================

struct detail::FreeTypeLibrary {
    FT_Library library{nullptr};

    FreeTypeLibrary() = default;
    FreeTypeLibrary(const FreeTypeLibrary&) = delete;
    FreeTypeLibrary& operator=(const FreeTypeLibrary&) = delete;

    ~FreeTypeLibrary() {
        if (library) {
            FT_Done_FreeType(library);
        }
    }
};

struct FreeTypeFace::FaceData {
    // Faces share the library so they may outlive the engine
    std::shared_ptr<detail::FreeTypeLibrary> library;
    RefPtr<IFontFileStream> stream;
    FT_StreamRec stream_rec{};
    FT_Face face{nullptr};

    ReferenceKey key;
    FontFileAnalysis analysis;
    std::string family_name;
    std::string style_name;
    f32 pixel_size{0};
    FaceMetrics metrics;

    FaceData() = default;
    FaceData(const FaceData&) = delete;
    FaceData& operator=(const FaceData&) = delete;

    ~FaceData() {
        if (face) {
            FT_Done_Face(face);
        }
    }
};

// ============================================================================
// FreeTypeFace
// ============================================================================

FreeTypeFace::FreeTypeFace(std::unique_ptr<FaceData> data)
    : m_data(std::move(data))
{
}

FreeTypeFace::~FreeTypeFace() = default;

const std::string& FreeTypeFace::family_name() const noexcept {
    return m_data->family_name;
}

const std::string& FreeTypeFace::style_name() const noexcept {
    return m_data->style_name;
}

i64 FreeTypeFace::glyph_count() const noexcept {
    return m_data->face->num_glyphs;
}

f32 FreeTypeFace::pixel_size() const noexcept {
    return m_data->pixel_size;
}

const FaceMetrics& FreeTypeFace::metrics() const noexcept {
    return m_data->metrics;
}

const FontFileAnalysis& FreeTypeFace::analysis() const noexcept {
    return m_data->analysis;
}

ReferenceKey FreeTypeFace::reference_key() const noexcept {
    return m_data->key;
}

bool FreeTypeFace::has_glyph(unicode::CodePoint cp) const {
    return FT_Get_Char_Index(m_data->face, cp) != 0;
}

f32 FreeTypeFace::advance(unicode::CodePoint cp) const {
    FT_Face face = m_data->face;
    FT_UInt glyph_index = FT_Get_Char_Index(face, cp);

    if (FT_Load_Glyph(face, glyph_index, FT_LOAD_DEFAULT)) {
        return 0;
    }
    return face->glyph->advance.x / 64.0f;
}

f32 FreeTypeFace::kerning(unicode::CodePoint left, unicode::CodePoint right) const {
    FT_Face face = m_data->face;
    if (!FT_HAS_KERNING(face)) return 0;

    FT_UInt left_index = FT_Get_Char_Index(face, left);
    FT_UInt right_index = FT_Get_Char_Index(face, right);

    FT_Vector delta;
    if (FT_Get_Kerning(face, left_index, right_index, FT_KERNING_DEFAULT, &delta)) {
        return 0;
    }
    return delta.x / 64.0f;
}

f32 FreeTypeFace::measure_text(std::string_view text) const {
    f32 width = 0;
    unicode::CodePoint prev = 0;
    bool has_prev = false;

    usize pos = 0;
    while (pos < text.size()) {
        auto decoded = unicode::utf8_decode(text.data() + pos, text.size() - pos);
        pos += decoded.bytes_consumed;

        width += advance(decoded.code_point);
        if (has_prev) {
            width += kerning(prev, decoded.code_point);
        }
        prev = decoded.code_point;
        has_prev = true;
    }
    return width;
}

// ============================================================================
// FreeTypeFontEngine
// ============================================================================

FreeTypeFontEngine::FreeTypeFontEngine(FontEngineConfig config)
    : m_config(config)
    , m_library(std::make_shared<detail::FreeTypeLibrary>())
{
    FT_Error error = FT_Init_FreeType(&m_library->library);
    if (error) {
        log().error("failed to initialize FreeType: " + freetype_error_message(error));
        m_library->library = nullptr;
    }
}

FreeTypeFontEngine::~FreeTypeFontEngine() = default;

bool FreeTypeFontEngine::is_initialized() const noexcept {
    return m_library->library != nullptr;
}

Result<FaceList, EngineError> FreeTypeFontEngine::load_collection(
    IFontCollectionLoader& loader,
    ByteSpanConst collection_key) {

    if (!is_initialized()) {
        return make_error(EngineError{EngineError::Code::NotInitialized, "FreeType is not initialized"});
    }

    auto enumerator = loader.create_enumerator(collection_key);
    if (!enumerator) {
        return make_error(EngineError{EngineError::Code::LoaderFailure,
            std::string("create_enumerator failed: ") +
            std::string(loader_error_name(enumerator.error()))});
    }

    FaceList faces;
    usize index = 0;

    while (enumerator.value()->move_next()) {
        auto file = enumerator.value()->get_current_font_file();
        if (!file) {
            return make_error(EngineError{EngineError::Code::LoaderFailure,
                std::string("get_current_font_file failed: ") +
                std::string(loader_error_name(file.error()))});
        }

        auto face = load_file(*file.value());
        if (face) {
            faces.push_back(std::move(face).value());
        } else if (m_config.skip_unsupported &&
                   face.error().code != EngineError::Code::LoaderFailure) {
            log().warn("skipping font file " + std::to_string(index) + ": " + face.error().message);
        } else {
            return make_error(std::move(face).error());
        }
        ++index;
    }

    log().debug("loaded " + std::to_string(faces.size()) + " of " +
                std::to_string(index) + " font files");
    return faces;
}

Result<std::unique_ptr<FreeTypeFace>, EngineError> FreeTypeFontEngine::load_file(IFontFile& file) {
    if (!is_initialized()) {
        return make_error(EngineError{EngineError::Code::NotInitialized, "FreeType is not initialized"});
    }

    FontFileAnalysis analysis = file.analyze();
    if (!analysis.supported) {
        return make_error(EngineError{EngineError::Code::UnsupportedFile,
                                      "unrecognized font container"});
    }

    ReferenceKey key = file.reference_key();
    auto stream = file.loader()->open_stream(key);
    if (!stream) {
        return make_error(EngineError{EngineError::Code::LoaderFailure,
            std::string("open_stream failed: ") + std::string(loader_error_name(stream.error()))});
    }

    // FT_Stream sizes are unsigned long and FreeType seeks with FT_Long offsets
    const u64 file_size = stream.value()->file_size();
    if (file_size > static_cast<u64>(std::numeric_limits<FT_Long>::max())) {
        log().error("font file of " + std::to_string(file_size) +
                    " bytes is too large for a FreeType stream");
        return make_error(EngineError{EngineError::Code::LoaderFailure,
                                      "font file too large for a FreeType stream"});
    }

    auto data = std::make_unique<FreeTypeFace::FaceData>();
    data->library = m_library;
    data->stream = std::move(stream).value();
    data->key = key;
    data->analysis = analysis;
    data->pixel_size = m_config.pixel_size;

    FT_StreamRec& rec = data->stream_rec;
    rec.base = nullptr;
    rec.size = static_cast<unsigned long>(file_size);
    rec.pos = 0;
    rec.descriptor.pointer = data->stream.get();
    rec.read = stream_read;
    rec.close = stream_close;

    FT_Open_Args args{};
    args.flags = FT_OPEN_STREAM;
    args.stream = &rec;

    FT_Error error = FT_Open_Face(m_library->library, &args, 0, &data->face);
    if (error) {
        data->face = nullptr;
        return make_error(EngineError{EngineError::Code::FreeTypeFailure,
                                      "FT_Open_Face failed: " + freetype_error_message(error)});
    }

    FT_Face face = data->face;
    error = FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(m_config.pixel_size));
    if (error) {
        return make_error(EngineError{EngineError::Code::FreeTypeFailure,
                                      "FT_Set_Pixel_Sizes failed: " + freetype_error_message(error)});
    }

    data->family_name = face->family_name ? face->family_name : "";
    data->style_name = face->style_name ? face->style_name : "";

    data->metrics.ascender = face->size->metrics.ascender / 64.0f;
    data->metrics.descender = face->size->metrics.descender / 64.0f;
    data->metrics.line_gap = (face->size->metrics.height / 64.0f) -
                             (data->metrics.ascender - data->metrics.descender);
    data->metrics.units_per_em = static_cast<f32>(face->units_per_EM);

    log().debug("opened face '" + data->family_name + " " + data->style_name + "' (" +
                font_file_type_name(analysis.file_type) + ", " +
                std::to_string(face->num_glyphs) + " glyphs)");

    return std::unique_ptr<FreeTypeFace>(new FreeTypeFace(std::move(data)));
}

} // namespace typecase::fonts::freetype
