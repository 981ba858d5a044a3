#include "typecase/fonts/font_buffer.hpp"
#include "typecase/core/logger.hpp"
#include <string>

namespace typecase::fonts {

namespace {

Logger& log() {
    return logging::get("fonts");
}

} // anonymous namespace

BufferStore::BufferStore()
    : m_buffers(std::make_shared<const std::vector<BufferHandle>>())
{
}

BufferHandle BufferStore::register_font(std::vector<u8> bytes) {
    auto buffer = BufferHandle(make_ref<FontBuffer>(std::move(bytes)));
    usize count = 0;
    {
        std::lock_guard lock(m_mutex);
        auto next = std::make_shared<std::vector<BufferHandle>>(*m_buffers);
        next->push_back(buffer);
        count = next->size();
        m_buffers = std::move(next);
    }

    log().debug("registered font buffer of " + std::to_string(buffer->size()) +
                " bytes (" + std::to_string(count) + " total)");
    return buffer;
}

BufferHandle BufferStore::register_font(ByteSpanConst bytes) {
    return register_font(std::vector<u8>(bytes.begin(), bytes.end()));
}

BufferSnapshot BufferStore::snapshot() const {
    std::lock_guard lock(m_mutex);
    return m_buffers;
}

void BufferStore::replace_all(std::vector<BufferHandle> buffers) {
    auto next = std::make_shared<const std::vector<BufferHandle>>(std::move(buffers));
    const usize count = next->size();
    {
        std::lock_guard lock(m_mutex);
        m_buffers = std::move(next);
    }

    log().debug("replaced font buffers (" + std::to_string(count) + " total)");
}

void BufferStore::clear() {
    replace_all({});
}

usize BufferStore::size() const {
    return snapshot()->size();
}

} // namespace typecase::fonts
