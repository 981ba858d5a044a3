#pragma once

#include "typecase/fonts/font_loading.hpp"
#include "typecase/fonts/font_buffer.hpp"
#include <memory>
#include <optional>

namespace typecase::fonts {

/// In-memory fonts have no filesystem metadata; a fixed nonzero stand-in.
constexpr u64 kInMemoryLastWriteTime = 10;

// ============================================================================
// Memory Font Collection Loader
// ============================================================================

/// Exposes the buffers of a BufferStore as a font collection. One loader
/// serves exactly one logical collection: the key passed to
/// create_enumerator() is accepted and ignored.
class MemoryFontCollectionLoader : public IFontCollectionLoader {
public:
    explicit MemoryFontCollectionLoader(std::shared_ptr<const BufferStore> store);

    [[nodiscard]] LoaderResult<RefPtr<IFontFileEnumerator>> create_enumerator(
        ByteSpanConst collection_key) override;

    [[nodiscard]] const BufferStore& store() const noexcept { return *m_store; }

private:
    std::shared_ptr<const BufferStore> m_store;
};

// ============================================================================
// Memory Font File Enumerator
// ============================================================================

class MemoryFontFileEnumerator : public IFontFileEnumerator {
public:
    explicit MemoryFontFileEnumerator(BufferSnapshot files);

    [[nodiscard]] bool move_next() override;
    [[nodiscard]] LoaderResult<RefPtr<IFontFile>> get_current_font_file() override;

    [[nodiscard]] usize file_count() const noexcept { return m_files->size(); }

private:
    BufferSnapshot m_files;
    // nullopt before the first move_next(); file_count() once exhausted
    std::optional<usize> m_index;
};

// ============================================================================
// Memory Font File
// ============================================================================

class MemoryFontFile : public IFontFile {
public:
    explicit MemoryFontFile(BufferHandle buffer);

    /// The buffer address and length. Distinct allocations with identical
    /// bytes have distinct keys; contents are never compared.
    [[nodiscard]] ReferenceKey reference_key() const override;
    [[nodiscard]] RefPtr<IFontFileLoader> loader() const override;
    [[nodiscard]] FontFileAnalysis analyze() const override;

private:
    BufferHandle m_buffer;
};

// ============================================================================
// Memory Font File Loader
// ============================================================================

class MemoryFontFileLoader : public IFontFileLoader {
public:
    explicit MemoryFontFileLoader(BufferHandle buffer);

    using IFontFileLoader::open_stream;

    /// Only the key length is checked against the buffer length. This is an
    /// identity heuristic: the key bytes are not compared.
    [[nodiscard]] LoaderResult<RefPtr<IFontFileStream>> open_stream(
        const void* key,
        usize key_size) override;

private:
    BufferHandle m_buffer;
};

// ============================================================================
// Memory Font File Stream
// ============================================================================

class MemoryFontFileStream : public IFontFileStream {
public:
    explicit MemoryFontFileStream(BufferHandle buffer);

    /// Borrowed view into the buffer. OutOfRange unless
    /// offset + length <= file_size(), checked without overflow.
    [[nodiscard]] LoaderResult<FileFragment> read_fragment(u64 offset, u64 length) override;

    /// No-op; fragments are not pinned or cached.
    void release_fragment(void* context) override;

    [[nodiscard]] u64 file_size() const override;
    [[nodiscard]] u64 last_write_time() const override;

private:
    BufferHandle m_buffer;
};

} // namespace typecase::fonts
