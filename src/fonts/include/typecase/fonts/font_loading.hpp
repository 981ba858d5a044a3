#pragma once

#include "typecase/core/types.hpp"
#include "typecase/core/memory.hpp"
#include "typecase/fonts/error.hpp"
#include "typecase/fonts/font_format.hpp"

namespace typecase::fonts {

// Forward declarations
class IFontFileEnumerator;
class IFontFile;
class IFontFileLoader;
class IFontFileStream;

// ============================================================================
// Protocol values
// ============================================================================

/// Opaque identity token for a font file. Callers use it to deduplicate and
/// cache font objects; it names an allocation, not its contents.
struct ReferenceKey {
    const void* data{nullptr};
    usize size{0};

    [[nodiscard]] bool operator==(const ReferenceKey& other) const {
        return data == other.data && size == other.size;
    }

    [[nodiscard]] bool operator!=(const ReferenceKey& other) const {
        return !(*this == other);
    }
};

/// Borrowed view of a byte range, valid until release_fragment(context).
struct FileFragment {
    ByteSpanConst bytes;
    void* context{nullptr};
};

// ============================================================================
// Font loading protocol
// ============================================================================
//
// The text engine drives these objects: it asks a collection loader for an
// enumerator, walks it, analyzes each font file, and pulls byte ranges through
// a loader and stream while shaping. Every object is a reference counted
// handle and is used by one caller at a time.

/// Entry point of a custom font collection
class IFontCollectionLoader : public RefCounted {
public:
    /// Create an enumerator over the files of the collection named by key
    [[nodiscard]] virtual LoaderResult<RefPtr<IFontFileEnumerator>> create_enumerator(
        ByteSpanConst collection_key) = 0;

protected:
    IFontCollectionLoader() = default;
};

/// Forward-only cursor over the files of one collection
class IFontFileEnumerator : public RefCounted {
public:
    /// Advance to the next file; false once the end has been passed
    [[nodiscard]] virtual bool move_next() = 0;

    /// The file at the cursor. InvalidState unless the last move_next() returned true
    [[nodiscard]] virtual LoaderResult<RefPtr<IFontFile>> get_current_font_file() = 0;

protected:
    IFontFileEnumerator() = default;
};

/// One font file: identity, format, and access to its loader
class IFontFile : public RefCounted {
public:
    [[nodiscard]] virtual ReferenceKey reference_key() const = 0;
    [[nodiscard]] virtual RefPtr<IFontFileLoader> loader() const = 0;
    [[nodiscard]] virtual FontFileAnalysis analyze() const = 0;

protected:
    IFontFile() = default;
};

/// Keyed factory producing streams
class IFontFileLoader : public RefCounted {
public:
    [[nodiscard]] virtual LoaderResult<RefPtr<IFontFileStream>> open_stream(
        const void* key,
        usize key_size) = 0;

    [[nodiscard]] LoaderResult<RefPtr<IFontFileStream>> open_stream(const ReferenceKey& key) {
        return open_stream(key.data, key.size);
    }

protected:
    IFontFileLoader() = default;
};

/// Random-access reader over a font file. Reads are independent; there is no cursor.
class IFontFileStream : public RefCounted {
public:
    [[nodiscard]] virtual LoaderResult<FileFragment> read_fragment(u64 offset, u64 length) = 0;
    virtual void release_fragment(void* context) = 0;
    [[nodiscard]] virtual u64 file_size() const = 0;
    [[nodiscard]] virtual u64 last_write_time() const = 0;

protected:
    IFontFileStream() = default;
};

} // namespace typecase::fonts
