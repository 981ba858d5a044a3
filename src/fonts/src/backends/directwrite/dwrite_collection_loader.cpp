/**
 * DirectWrite adapter for custom font collections
 */

#include "dwrite_collection_loader.hpp"
#include "typecase/core/logger.hpp"
#include <cstdio>
#include <limits>
#include <string>

namespace typecase::fonts::directwrite {

namespace {

Logger& log() {
    return logging::get("fonts");
}

std::string hresult_string(HRESULT hr) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08lX", static_cast<unsigned long>(hr));
    return buffer;
}

DWRITE_FONT_FILE_TYPE to_dwrite(FontFileType type) {
    switch (type) {
        case FontFileType::Unknown: return DWRITE_FONT_FILE_TYPE_UNKNOWN;
        case FontFileType::TrueType: return DWRITE_FONT_FILE_TYPE_TRUETYPE;
        case FontFileType::Cff: return DWRITE_FONT_FILE_TYPE_CFF;
    }
    return DWRITE_FONT_FILE_TYPE_UNKNOWN;
}

DWRITE_FONT_FACE_TYPE to_dwrite(FontFaceType type) {
    switch (type) {
        case FontFaceType::Unknown: return DWRITE_FONT_FACE_TYPE_UNKNOWN;
        case FontFaceType::TrueType: return DWRITE_FONT_FACE_TYPE_TRUETYPE;
        case FontFaceType::Cff: return DWRITE_FONT_FACE_TYPE_CFF;
    }
    return DWRITE_FONT_FACE_TYPE_UNKNOWN;
}

} // anonymous namespace

HRESULT to_hresult(LoaderError error) noexcept {
    switch (error) {
        case LoaderError::InvalidState: return E_ILLEGAL_METHOD_CALL;
        case LoaderError::InvalidArgument: return E_INVALIDARG;
        case LoaderError::OutOfRange: return E_INVALIDARG;
    }
    return E_FAIL;
}

// ============================================================================
// DWriteFontCollectionLoader
// ============================================================================

DWriteFontCollectionLoader::DWriteFontCollectionLoader(RefPtr<IFontCollectionLoader> loader)
    : m_loader(std::move(loader))
{
}

HRESULT DWriteFontCollectionLoader::CreateEnumeratorFromKey(
    IDWriteFactory* factory,
    void const* collection_key,
    UINT32 collection_key_size,
    IDWriteFontFileEnumerator** enumerator) {

    (void)factory;
    if (!enumerator) return E_POINTER;
    *enumerator = nullptr;

    ByteSpanConst key(static_cast<const u8*>(collection_key),
                      collection_key ? collection_key_size : 0);
    auto result = m_loader->create_enumerator(key);
    if (!result) {
        return to_hresult(result.error());
    }

    *enumerator = new DWriteFontFileEnumerator(std::move(result).value());
    return S_OK;
}

// ============================================================================
// DWriteFontFileEnumerator
// ============================================================================

DWriteFontFileEnumerator::DWriteFontFileEnumerator(RefPtr<IFontFileEnumerator> enumerator)
    : m_enumerator(std::move(enumerator))
{
}

HRESULT DWriteFontFileEnumerator::MoveNext(BOOL* has_current_file) {
    if (!has_current_file) return E_POINTER;
    *has_current_file = m_enumerator->move_next() ? TRUE : FALSE;
    return S_OK;
}

HRESULT DWriteFontFileEnumerator::GetCurrentFontFile(IDWriteFontFile** font_file) {
    if (!font_file) return E_POINTER;
    *font_file = nullptr;

    auto result = m_enumerator->get_current_font_file();
    if (!result) {
        return to_hresult(result.error());
    }

    *font_file = new DWriteFontFile(std::move(result).value());
    return S_OK;
}

// ============================================================================
// DWriteFontFile
// ============================================================================

DWriteFontFile::DWriteFontFile(RefPtr<IFontFile> file)
    : m_file(std::move(file))
{
}

HRESULT DWriteFontFile::GetReferenceKey(void const** key, UINT32* key_size) {
    if (!key || !key_size) return E_POINTER;

    ReferenceKey ref = m_file->reference_key();
    if (ref.size > std::numeric_limits<UINT32>::max()) {
        log().error("font buffer of " + std::to_string(ref.size) +
                    " bytes is too large for a DirectWrite key");
        return E_FAIL;
    }

    *key = ref.data;
    *key_size = static_cast<UINT32>(ref.size);
    return S_OK;
}

HRESULT DWriteFontFile::GetLoader(IDWriteFontFileLoader** loader) {
    if (!loader) return E_POINTER;
    *loader = new DWriteFontFileLoader(m_file->loader());
    return S_OK;
}

HRESULT DWriteFontFile::Analyze(
    BOOL* is_supported_font_type,
    DWRITE_FONT_FILE_TYPE* file_type,
    DWRITE_FONT_FACE_TYPE* face_type,
    UINT32* number_of_faces) {

    if (!is_supported_font_type || !file_type || !number_of_faces) return E_POINTER;

    FontFileAnalysis analysis = m_file->analyze();
    *is_supported_font_type = analysis.supported ? TRUE : FALSE;
    *file_type = to_dwrite(analysis.file_type);
    // face_type is optional in the DirectWrite contract
    if (face_type) {
        *face_type = to_dwrite(analysis.face_type);
    }
    *number_of_faces = analysis.face_count;
    return S_OK;
}

// ============================================================================
// DWriteFontFileLoader
// ============================================================================

DWriteFontFileLoader::DWriteFontFileLoader(RefPtr<IFontFileLoader> loader)
    : m_loader(std::move(loader))
{
}

HRESULT DWriteFontFileLoader::CreateStreamFromKey(
    void const* key,
    UINT32 key_size,
    IDWriteFontFileStream** stream) {

    if (!stream) return E_POINTER;
    *stream = nullptr;

    auto result = m_loader->open_stream(key, key_size);
    if (!result) {
        return to_hresult(result.error());
    }

    *stream = new DWriteFontFileStream(std::move(result).value());
    return S_OK;
}

// ============================================================================
// DWriteFontFileStream
// ============================================================================

DWriteFontFileStream::DWriteFontFileStream(RefPtr<IFontFileStream> stream)
    : m_stream(std::move(stream))
{
}

HRESULT DWriteFontFileStream::ReadFileFragment(
    void const** fragment_start,
    UINT64 file_offset,
    UINT64 fragment_size,
    void** fragment_context) {

    if (!fragment_start || !fragment_context) return E_POINTER;
    *fragment_start = nullptr;
    *fragment_context = nullptr;

    auto result = m_stream->read_fragment(file_offset, fragment_size);
    if (!result) {
        return to_hresult(result.error());
    }

    *fragment_start = result.value().bytes.data();
    *fragment_context = result.value().context;
    return S_OK;
}

void DWriteFontFileStream::ReleaseFileFragment(void* fragment_context) {
    m_stream->release_fragment(fragment_context);
}

HRESULT DWriteFontFileStream::GetFileSize(UINT64* file_size) {
    if (!file_size) return E_POINTER;
    *file_size = m_stream->file_size();
    return S_OK;
}

HRESULT DWriteFontFileStream::GetLastWriteTime(UINT64* last_write_time) {
    if (!last_write_time) return E_POINTER;
    *last_write_time = m_stream->last_write_time();
    return S_OK;
}

// ============================================================================
// Collection creation
// ============================================================================

Result<ComPtr<IDWriteFontCollection>, HRESULT> create_font_collection(
    IDWriteFactory* factory,
    RefPtr<IFontCollectionLoader> loader) {

    if (!factory || !loader) {
        return make_error(E_INVALIDARG);
    }

    ComPtr<IDWriteFontCollectionLoader> com_loader;
    com_loader.Attach(new DWriteFontCollectionLoader(std::move(loader)));

    HRESULT hr = factory->RegisterFontCollectionLoader(com_loader.Get());
    if (FAILED(hr)) {
        log().error("RegisterFontCollectionLoader failed (HRESULT " + hresult_string(hr) + ")");
        return make_error(hr);
    }

    ComPtr<IDWriteFontCollection> collection;
    hr = factory->CreateCustomFontCollection(com_loader.Get(), nullptr, 0, &collection);
    if (FAILED(hr)) {
        log().error("CreateCustomFontCollection failed (HRESULT " + hresult_string(hr) + ")");
        return make_error(hr);
    }

    return collection;
}

} // namespace typecase::fonts::directwrite
