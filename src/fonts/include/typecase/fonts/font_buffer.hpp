#pragma once

#include "typecase/core/types.hpp"
#include "typecase/core/memory.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace typecase::fonts {

// ============================================================================
// Font Buffer
// ============================================================================

/// An immutable, reference counted font file payload. The bytes never move or
/// change after construction, so their address is a stable identity for the
/// lifetime of the buffer.
class FontBuffer : public RefCounted {
public:
    explicit FontBuffer(std::vector<u8> bytes) : m_bytes(std::move(bytes)) {}

    FontBuffer(const FontBuffer&) = delete;
    FontBuffer& operator=(const FontBuffer&) = delete;

    [[nodiscard]] ByteSpanConst bytes() const noexcept {
        return ByteSpanConst(m_bytes.data(), m_bytes.size());
    }

    [[nodiscard]] const u8* data() const noexcept { return m_bytes.data(); }
    [[nodiscard]] usize size() const noexcept { return m_bytes.size(); }

private:
    const std::vector<u8> m_bytes;
};

using BufferHandle = RefPtr<const FontBuffer>;

/// Point-in-time view of the registered buffers, in registration order.
using BufferSnapshot = std::shared_ptr<const std::vector<BufferHandle>>;

// ============================================================================
// Buffer Store
// ============================================================================

/// Owns the ordered set of registered font buffers.
///
/// Writers (register_font, replace_all, clear) are serialized by a mutex and
/// publish a fresh vector each time; a snapshot only copies the published
/// pointer under that mutex. A snapshot therefore never observes a partial
/// update and is unaffected by later writes. Buffers are shared, so handles
/// given out earlier outlive replacement of the live set.
class BufferStore {
public:
    BufferStore();

    BufferStore(const BufferStore&) = delete;
    BufferStore& operator=(const BufferStore&) = delete;

    /// Append a buffer. Never fails.
    BufferHandle register_font(std::vector<u8> bytes);
    BufferHandle register_font(ByteSpanConst bytes);

    /// Current sequence by shared reference; does not copy buffers.
    [[nodiscard]] BufferSnapshot snapshot() const;

    /// Atomically swap the entire sequence.
    void replace_all(std::vector<BufferHandle> buffers);
    void clear();

    [[nodiscard]] usize size() const;

private:
    mutable std::mutex m_mutex;
    BufferSnapshot m_buffers;
};

} // namespace typecase::fonts
