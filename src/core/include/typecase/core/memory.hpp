#pragma once

#include "types.hpp"

namespace typecase {

namespace memory {

// ============================================================================
// Span - borrowed view over contiguous elements
// ============================================================================

template<typename T>
class Span {
public:
    using iterator = T*;

    constexpr Span() noexcept = default;
    constexpr Span(T* data, usize size) noexcept : m_data(data), m_size(size) {}

    [[nodiscard]] constexpr T* data() const noexcept { return m_data; }
    [[nodiscard]] constexpr usize size() const noexcept { return m_size; }

    [[nodiscard]] constexpr T& operator[](usize index) const { return m_data[index]; }

    [[nodiscard]] constexpr iterator begin() const noexcept { return m_data; }
    [[nodiscard]] constexpr iterator end() const noexcept { return m_data + m_size; }

    /// Unchecked; the caller has verified offset + count <= size()
    [[nodiscard]] constexpr Span subspan(usize offset, usize count) const {
        return Span(m_data + offset, count);
    }

private:
    T* m_data{nullptr};
    usize m_size{0};
};

using ByteSpanConst = Span<const u8>;

} // namespace memory

using memory::Span;
using memory::ByteSpanConst;

} // namespace typecase
