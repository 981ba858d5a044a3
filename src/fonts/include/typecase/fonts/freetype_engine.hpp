#pragma once

#include "typecase/core/types.hpp"
#include "typecase/core/unicode.hpp"
#include "typecase/fonts/engine_config.hpp"
#include "typecase/fonts/font_loading.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace typecase::fonts::freetype {

namespace detail {
struct FreeTypeLibrary;
} // namespace detail

// ============================================================================
// Engine errors
// ============================================================================

struct EngineError {
    enum class Code {
        NotInitialized,   ///< FreeType library could not be created
        LoaderFailure,    ///< A protocol call returned an error
        UnsupportedFile,  ///< analyze() rejected the file
        FreeTypeFailure,  ///< FreeType could not open the face
    };

    Code code;
    std::string message;
};

[[nodiscard]] const char* engine_error_name(EngineError::Code code);

// ============================================================================
// Face metrics
// ============================================================================

struct FaceMetrics {
    f32 ascender{0};       // Distance from baseline to top, pixels
    f32 descender{0};      // Distance from baseline to bottom (negative)
    f32 line_gap{0};       // Extra spacing between lines
    f32 units_per_em{0};   // Font units per em

    [[nodiscard]] f32 line_height() const { return ascender - descender + line_gap; }
};

// ============================================================================
// FreeType Face
// ============================================================================

/// A face opened through the font loading protocol. FreeType pulls every
/// byte through the file stream; the face keeps the stream alive.
class FreeTypeFace {
public:
    ~FreeTypeFace();

    FreeTypeFace(const FreeTypeFace&) = delete;
    FreeTypeFace& operator=(const FreeTypeFace&) = delete;

    [[nodiscard]] const std::string& family_name() const noexcept;
    [[nodiscard]] const std::string& style_name() const noexcept;
    [[nodiscard]] i64 glyph_count() const noexcept;
    [[nodiscard]] f32 pixel_size() const noexcept;
    [[nodiscard]] const FaceMetrics& metrics() const noexcept;
    [[nodiscard]] const FontFileAnalysis& analysis() const noexcept;
    [[nodiscard]] ReferenceKey reference_key() const noexcept;

    [[nodiscard]] bool has_glyph(unicode::CodePoint cp) const;

    /// Horizontal advance in pixels; missing glyphs use the .notdef advance
    [[nodiscard]] f32 advance(unicode::CodePoint cp) const;
    [[nodiscard]] f32 kerning(unicode::CodePoint left, unicode::CodePoint right) const;

    /// Width of a UTF-8 run including kerning
    [[nodiscard]] f32 measure_text(std::string_view text) const;

private:
    friend class FreeTypeFontEngine;

    struct FaceData;
    explicit FreeTypeFace(std::unique_ptr<FaceData> data);

    std::unique_ptr<FaceData> m_data;
};

using FaceList = std::vector<std::unique_ptr<FreeTypeFace>>;

// ============================================================================
// FreeType Font Engine
// ============================================================================

/// Drives a font collection loader the way a platform text engine does and
/// turns each supported file into a FreeType face.
class FreeTypeFontEngine {
public:
    explicit FreeTypeFontEngine(FontEngineConfig config = {});
    ~FreeTypeFontEngine();

    FreeTypeFontEngine(const FreeTypeFontEngine&) = delete;
    FreeTypeFontEngine& operator=(const FreeTypeFontEngine&) = delete;

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] const FontEngineConfig& config() const noexcept { return m_config; }

    /// Enumerate every file of the collection and open a face for each
    [[nodiscard]] Result<FaceList, EngineError> load_collection(
        IFontCollectionLoader& loader,
        ByteSpanConst collection_key = {});

    /// Open a face for one file
    [[nodiscard]] Result<std::unique_ptr<FreeTypeFace>, EngineError> load_file(IFontFile& file);

private:
    FontEngineConfig m_config;
    std::shared_ptr<detail::FreeTypeLibrary> m_library;
};

} // namespace typecase::fonts::freetype
