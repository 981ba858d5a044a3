/**
 * In-memory font file, file loader and file stream
 */

#include "typecase/fonts/memory_font_collection.hpp"
#include "typecase/core/logger.hpp"
#include <string>

namespace typecase::fonts {

namespace {

Logger& log() {
    return logging::get("fonts");
}

} // anonymous namespace

// ============================================================================
// MemoryFontFile
// ============================================================================

MemoryFontFile::MemoryFontFile(BufferHandle buffer)
    : m_buffer(std::move(buffer))
{
}

ReferenceKey MemoryFontFile::reference_key() const {
    return {m_buffer->data(), m_buffer->size()};
}

RefPtr<IFontFileLoader> MemoryFontFile::loader() const {
    return RefPtr<IFontFileLoader>(make_ref<MemoryFontFileLoader>(m_buffer));
}

FontFileAnalysis MemoryFontFile::analyze() const {
    return sniff_font_format(m_buffer->bytes());
}

// ============================================================================
// MemoryFontFileLoader
// ============================================================================

MemoryFontFileLoader::MemoryFontFileLoader(BufferHandle buffer)
    : m_buffer(std::move(buffer))
{
}

LoaderResult<RefPtr<IFontFileStream>> MemoryFontFileLoader::open_stream(
    const void* key,
    usize key_size) {

    (void)key;

    if (key_size != m_buffer->size()) {
        log().warn("open_stream key size " + std::to_string(key_size) +
                   " does not match buffer size " + std::to_string(m_buffer->size()));
        return make_error(LoaderError::InvalidArgument);
    }

    return RefPtr<IFontFileStream>(make_ref<MemoryFontFileStream>(m_buffer));
}

// ============================================================================
// MemoryFontFileStream
// ============================================================================

MemoryFontFileStream::MemoryFontFileStream(BufferHandle buffer)
    : m_buffer(std::move(buffer))
{
}

LoaderResult<FileFragment> MemoryFontFileStream::read_fragment(u64 offset, u64 length) {
    const u64 size = m_buffer->size();

    // offset + length may wrap; compare against the remaining room instead
    if (offset > size || length > size - offset) {
        log().warn("read_fragment [" + std::to_string(offset) + ", +" +
                   std::to_string(length) + ") outside buffer of " +
                   std::to_string(size) + " bytes");
        return make_error(LoaderError::OutOfRange);
    }

    FileFragment fragment;
    fragment.bytes = m_buffer->bytes().subspan(static_cast<usize>(offset),
                                               static_cast<usize>(length));
    fragment.context = nullptr;
    return fragment;
}

void MemoryFontFileStream::release_fragment(void* context) {
    (void)context;
}

u64 MemoryFontFileStream::file_size() const {
    return m_buffer->size();
}

u64 MemoryFontFileStream::last_write_time() const {
    return kInMemoryLastWriteTime;
}

} // namespace typecase::fonts
