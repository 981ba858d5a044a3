#pragma once

#include "typecase/core/types.hpp"

namespace typecase::fonts {

// ============================================================================
// Font Engine Configuration
// ============================================================================

/**
 * @brief Configuration for the engine that consumes a font collection
 */
struct FontEngineConfig {
    /**
     * @brief Pixel size faces are scaled to after loading
     */
    f32 pixel_size = 16.0f;

    /**
     * @brief Skip files that are unsupported or fail to load instead of
     * failing the whole collection
     */
    bool skip_unsupported = true;
};

} // namespace typecase::fonts
