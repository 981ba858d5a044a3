#include <gtest/gtest.h>
#include "typecase/fonts/font_buffer.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace typecase;
using namespace typecase::fonts;

TEST(BufferStoreTest, StartsEmpty) {
    BufferStore store;

    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.snapshot()->empty());
}

TEST(BufferStoreTest, RegisterPreservesOrder) {
    BufferStore store;
    auto a = store.register_font(std::vector<u8>{1, 2, 3});
    auto b = store.register_font(std::vector<u8>{4, 5});

    auto files = store.snapshot();
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0], a);
    EXPECT_EQ((*files)[1], b);
    EXPECT_EQ((*files)[0]->size(), 3u);
    EXPECT_EQ((*files)[1]->bytes()[1], 5);
}

TEST(BufferStoreTest, RegisterCopiesFromSpan) {
    BufferStore store;
    std::vector<u8> source{9, 8, 7};

    auto handle = store.register_font(ByteSpanConst(source.data(), source.size()));
    source[0] = 0;

    EXPECT_NE(handle->data(), source.data());
    EXPECT_EQ(handle->bytes()[0], 9);
}

TEST(BufferStoreTest, EmptyBufferIsAccepted) {
    BufferStore store;
    auto handle = store.register_font(std::vector<u8>{});

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(handle->size(), 0u);
}

TEST(BufferStoreTest, IdenticalBytesAreDistinctBuffers) {
    BufferStore store;
    auto a = store.register_font(std::vector<u8>{1, 2, 3});
    auto b = store.register_font(std::vector<u8>{1, 2, 3});

    EXPECT_EQ(store.size(), 2u);
    EXPECT_NE(a->data(), b->data());
}

TEST(BufferStoreTest, SnapshotIsUnaffectedByLaterWrites) {
    BufferStore store;
    store.register_font(std::vector<u8>{1});
    auto before = store.snapshot();

    store.register_font(std::vector<u8>{2});
    store.clear();

    EXPECT_EQ(before->size(), 1u);
    EXPECT_EQ((*before)[0]->bytes()[0], 1);
    EXPECT_EQ(store.size(), 0u);
}

TEST(BufferStoreTest, ReplaceAllSwapsSequence) {
    BufferStore store;
    auto kept = store.register_font(std::vector<u8>{1});
    store.register_font(std::vector<u8>{2});

    auto extra = make_ref<FontBuffer>(std::vector<u8>{3, 3});
    store.replace_all({BufferHandle(extra), kept});

    auto files = store.snapshot();
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0]->size(), 2u);
    EXPECT_EQ((*files)[1], kept);
}

TEST(BufferStoreTest, HandlesOutliveClear) {
    BufferStore store;
    auto handle = store.register_font(std::vector<u8>{4, 2});
    const u8* address = handle->data();

    store.clear();

    EXPECT_EQ(handle->data(), address);
    EXPECT_EQ(handle->bytes()[1], 2);
    EXPECT_EQ(handle->ref_count(), 1u);
}

TEST(BufferStoreTest, ConcurrentRegistration) {
    BufferStore store;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kPerThread; ++i) {
                store.register_font(std::vector<u8>{static_cast<u8>(t)});
                auto snapshot = store.snapshot();
                EXPECT_FALSE(snapshot->empty());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store.size(), static_cast<usize>(kThreads * kPerThread));
}

namespace {

std::vector<BufferHandle> make_buffers(usize count, u8 fill) {
    std::vector<BufferHandle> buffers;
    for (usize i = 0; i < count; ++i) {
        buffers.push_back(make_ref<FontBuffer>(std::vector<u8>{fill, static_cast<u8>(i)}));
    }
    return buffers;
}

bool same_handles(const std::vector<BufferHandle>& a, const std::vector<BufferHandle>& b) {
    if (a.size() != b.size()) return false;
    for (usize i = 0; i < a.size(); ++i) {
        if (!(a[i] == b[i])) return false;
    }
    return true;
}

} // anonymous namespace

TEST(BufferStoreTest, SnapshotNeverSeesPartialReplace) {
    BufferStore store;
    const auto small = make_buffers(3, 0xA0);
    const auto large = make_buffers(7, 0xB0);
    store.replace_all(small);

    constexpr int kReaders = 4;
    constexpr int kWrites = 2000;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> reads{0};

    std::thread writer([&] {
        for (int i = 0; i < kWrites; ++i) {
            switch (i % 3) {
                case 0: store.replace_all(large); break;
                case 1: store.clear(); break;
                case 2: store.replace_all(small); break;
            }
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < kReaders; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto files = store.snapshot();
                if (!files->empty() && !same_handles(*files, small) && !same_handles(*files, large)) {
                    ++torn;
                }
                ++reads;
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(torn.load(), 0);
    EXPECT_GT(reads.load(), 0);
    EXPECT_TRUE(same_handles(*store.snapshot(), large) ||
                same_handles(*store.snapshot(), small) ||
                store.snapshot()->empty());
}
