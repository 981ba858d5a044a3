#pragma once

#include "typecase/fonts/dwrite_collection.hpp"
#include <atomic>

namespace typecase::fonts::directwrite {

// ============================================================================
// COM object base
// ============================================================================

/// IUnknown plumbing for a class implementing a single DirectWrite interface
template<typename Interface>
class ComObject : public Interface {
public:
    HRESULT STDMETHODCALLTYPE QueryInterface(REFIID riid, void** object) override {
        if (!object) {
            return E_POINTER;
        }
        if (riid == __uuidof(IUnknown) || riid == __uuidof(Interface)) {
            *object = static_cast<Interface*>(this);
            AddRef();
            return S_OK;
        }
        *object = nullptr;
        return E_NOINTERFACE;
    }

    ULONG STDMETHODCALLTYPE AddRef() override {
        return m_ref_count.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    ULONG STDMETHODCALLTYPE Release() override {
        ULONG count = m_ref_count.fetch_sub(1, std::memory_order_acq_rel) - 1;
        if (count == 0) {
            delete this;
        }
        return count;
    }

protected:
    ComObject() = default;
    virtual ~ComObject() = default;

private:
    std::atomic<ULONG> m_ref_count{1};
};

// ============================================================================
// DirectWrite wrappers
// ============================================================================

class DWriteFontCollectionLoader : public ComObject<IDWriteFontCollectionLoader> {
public:
    explicit DWriteFontCollectionLoader(RefPtr<IFontCollectionLoader> loader);

    HRESULT STDMETHODCALLTYPE CreateEnumeratorFromKey(
        IDWriteFactory* factory,
        void const* collection_key,
        UINT32 collection_key_size,
        IDWriteFontFileEnumerator** enumerator) override;

private:
    RefPtr<IFontCollectionLoader> m_loader;
};

class DWriteFontFileEnumerator : public ComObject<IDWriteFontFileEnumerator> {
public:
    explicit DWriteFontFileEnumerator(RefPtr<IFontFileEnumerator> enumerator);

    HRESULT STDMETHODCALLTYPE MoveNext(BOOL* has_current_file) override;
    HRESULT STDMETHODCALLTYPE GetCurrentFontFile(IDWriteFontFile** font_file) override;

private:
    RefPtr<IFontFileEnumerator> m_enumerator;
};

class DWriteFontFile : public ComObject<IDWriteFontFile> {
public:
    explicit DWriteFontFile(RefPtr<IFontFile> file);

    HRESULT STDMETHODCALLTYPE GetReferenceKey(
        void const** key,
        UINT32* key_size) override;

    HRESULT STDMETHODCALLTYPE GetLoader(IDWriteFontFileLoader** loader) override;

    HRESULT STDMETHODCALLTYPE Analyze(
        BOOL* is_supported_font_type,
        DWRITE_FONT_FILE_TYPE* file_type,
        DWRITE_FONT_FACE_TYPE* face_type,
        UINT32* number_of_faces) override;

private:
    RefPtr<IFontFile> m_file;
};

class DWriteFontFileLoader : public ComObject<IDWriteFontFileLoader> {
public:
    explicit DWriteFontFileLoader(RefPtr<IFontFileLoader> loader);

    HRESULT STDMETHODCALLTYPE CreateStreamFromKey(
        void const* key,
        UINT32 key_size,
        IDWriteFontFileStream** stream) override;

private:
    RefPtr<IFontFileLoader> m_loader;
};

class DWriteFontFileStream : public ComObject<IDWriteFontFileStream> {
public:
    explicit DWriteFontFileStream(RefPtr<IFontFileStream> stream);

    HRESULT STDMETHODCALLTYPE ReadFileFragment(
        void const** fragment_start,
        UINT64 file_offset,
        UINT64 fragment_size,
        void** fragment_context) override;

    void STDMETHODCALLTYPE ReleaseFileFragment(void* fragment_context) override;

    HRESULT STDMETHODCALLTYPE GetFileSize(UINT64* file_size) override;
    HRESULT STDMETHODCALLTYPE GetLastWriteTime(UINT64* last_write_time) override;

private:
    RefPtr<IFontFileStream> m_stream;
};

} // namespace typecase::fonts::directwrite
