#pragma once

// Windows only: exposes an IFontCollectionLoader to DirectWrite.

#include "typecase/core/types.hpp"
#include "typecase/fonts/font_loading.hpp"
#include <dwrite.h>
#include <wrl/client.h>

namespace typecase::fonts::directwrite {

using Microsoft::WRL::ComPtr;

/// Map a loader error to the HRESULT DirectWrite expects
[[nodiscard]] HRESULT to_hresult(LoaderError error) noexcept;

/// Registers loader with factory as a custom collection loader and builds
/// the collection from it. The wrapper stays registered for the lifetime of
/// the factory, which holds a reference to it.
[[nodiscard]] Result<ComPtr<IDWriteFontCollection>, HRESULT> create_font_collection(
    IDWriteFactory* factory,
    RefPtr<IFontCollectionLoader> loader);

} // namespace typecase::fonts::directwrite
