#pragma once

#include "typecase/core/types.hpp"
#include <string_view>

namespace typecase::fonts {

// ============================================================================
// Loader errors
// ============================================================================

/// Failures reported synchronously to the engine driving the loading protocol.
/// An unrecognized font container is not an error; see FontFileAnalysis.
enum class LoaderError : u8 {
    InvalidState,     ///< Protocol precondition violated (e.g. no current item)
    InvalidArgument,  ///< Stream key does not match the buffer
    OutOfRange,       ///< Fragment request exceeds the buffer bounds
};

[[nodiscard]] constexpr std::string_view loader_error_name(LoaderError error) {
    switch (error) {
        case LoaderError::InvalidState:    return "InvalidState";
        case LoaderError::InvalidArgument: return "InvalidArgument";
        case LoaderError::OutOfRange:      return "OutOfRange";
    }
    return "Unknown";
}

template<typename T>
using LoaderResult = Result<T, LoaderError>;

} // namespace typecase::fonts
