/**
 * In-memory font collection: loader and file enumerator
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
// MemoryFontCollectionLoader
// ============================================================================

MemoryFontCollectionLoader::MemoryFontCollectionLoader(std::shared_ptr<const BufferStore> store)
    : m_store(std::move(store))
{
}

LoaderResult<RefPtr<IFontFileEnumerator>> MemoryFontCollectionLoader::create_enumerator(
    ByteSpanConst collection_key) {

    (void)collection_key;

    auto enumerator = make_ref<MemoryFontFileEnumerator>(m_store->snapshot());
    log().debug("created font file enumerator over " +
                std::to_string(enumerator->file_count()) + " files");
    return RefPtr<IFontFileEnumerator>(enumerator);
}

// ============================================================================
// MemoryFontFileEnumerator
// ============================================================================

MemoryFontFileEnumerator::MemoryFontFileEnumerator(BufferSnapshot files)
    : m_files(std::move(files))
{
}

bool MemoryFontFileEnumerator::move_next() {
    const usize count = m_files->size();

    if (!m_index) {
        m_index = 0;
    } else if (*m_index < count) {
        ++*m_index;
    }

    return *m_index < count;
}

LoaderResult<RefPtr<IFontFile>> MemoryFontFileEnumerator::get_current_font_file() {
    if (!m_index || *m_index >= m_files->size()) {
        log().warn("get_current_font_file called without a current file");
        return make_error(LoaderError::InvalidState);
    }

    return RefPtr<IFontFile>(make_ref<MemoryFontFile>((*m_files)[*m_index]));
}

} // namespace typecase::fonts
