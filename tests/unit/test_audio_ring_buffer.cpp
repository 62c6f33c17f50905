#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "utils/audio_ring_buffer.h"
#include "utils/buffer_registry.h"
#include "utils/sample_fifo.h"

using airlift::audio::Frame;
using airlift::audio::utils::AudioRingBuffer;
using airlift::audio::utils::BufferRegistry;
using airlift::audio::utils::SampleFifo;

namespace {
Frame frame_at(uint64_t ts) {
    Frame frame;
    frame.captured_at_ns = ts;
    frame.samples = {static_cast<int16_t>(ts), static_cast<int16_t>(ts)};
    return frame;
}
}

class AudioRingBufferTest : public ::testing::Test {
protected:
    AudioRingBuffer buffer{3};
};

TEST_F(AudioRingBufferTest, InitiallyEmpty) {
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_FALSE(buffer.pop().has_value());

    auto stats = buffer.stats();
    EXPECT_EQ(stats.capacity, 3u);
    EXPECT_EQ(stats.current_depth, 0u);
    EXPECT_EQ(stats.dropped_frames, 0u);
    EXPECT_FALSE(stats.oldest_timestamp_ns.has_value());
    EXPECT_FALSE(stats.newest_timestamp_ns.has_value());
}

TEST_F(AudioRingBufferTest, PopsInPushOrder) {
    EXPECT_EQ(buffer.push(frame_at(10)), 1u);
    EXPECT_EQ(buffer.push(frame_at(20)), 2u);

    auto first = buffer.pop();
    auto second = buffer.pop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->captured_at_ns, 10u);
    EXPECT_EQ(second->captured_at_ns, 20u);
    EXPECT_TRUE(buffer.empty());
}

TEST_F(AudioRingBufferTest, OverflowDropsOldest) {
    for (uint64_t ts = 1; ts <= 4; ++ts) {
        buffer.push(frame_at(ts));
    }

    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.dropped_frames(), 1u);

    std::vector<uint64_t> popped;
    while (auto frame = buffer.pop()) {
        popped.push_back(frame->captured_at_ns);
    }
    EXPECT_EQ(popped, (std::vector<uint64_t>{2, 3, 4}));
}

TEST_F(AudioRingBufferTest, StatsReportOldestAndNewest) {
    buffer.push(frame_at(5));
    buffer.push(frame_at(6));
    buffer.push(frame_at(7));
    buffer.push(frame_at(8));

    auto stats = buffer.stats();
    EXPECT_EQ(stats.current_depth, 3u);
    EXPECT_EQ(stats.dropped_frames, 1u);
    ASSERT_TRUE(stats.oldest_timestamp_ns.has_value());
    ASSERT_TRUE(stats.newest_timestamp_ns.has_value());
    EXPECT_EQ(*stats.oldest_timestamp_ns, 6u);
    EXPECT_EQ(*stats.newest_timestamp_ns, 8u);
}

TEST_F(AudioRingBufferTest, ClearKeepsDropCount) {
    for (uint64_t ts = 1; ts <= 5; ++ts) {
        buffer.push(frame_at(ts));
    }
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.dropped_frames(), 2u);
}

TEST(AudioRingBufferCapacityTest, ZeroCapacityHoldsOneFrame) {
    AudioRingBuffer tiny(0);
    EXPECT_EQ(tiny.capacity(), 1u);
    tiny.push(frame_at(1));
    tiny.push(frame_at(2));
    EXPECT_EQ(tiny.size(), 1u);
    EXPECT_EQ(tiny.pop()->captured_at_ns, 2u);
}

TEST(AudioRingBufferConcurrencyTest, ProducerAndConsumerThreads) {
    AudioRingBuffer shared(1000);
    constexpr uint64_t kFrames = 500;

    std::thread writer([&] {
        for (uint64_t ts = 1; ts <= kFrames; ++ts) {
            shared.push(frame_at(ts));
        }
    });

    std::vector<uint64_t> seen;
    while (seen.size() < kFrames) {
        if (auto frame = shared.pop()) {
            seen.push_back(frame->captured_at_ns);
        } else {
            std::this_thread::yield();
        }
    }
    writer.join();

    for (std::size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i], i + 1);
    }
    EXPECT_EQ(shared.dropped_frames(), 0u);
}

// --- BufferRegistry ---

TEST_F(AudioRingBufferTest, EachReaderSeesEveryFrame) {
    const auto record = buffer.add_reader("record");
    const auto stream = buffer.add_reader("stream");
    buffer.push(frame_at(10));
    buffer.push(frame_at(20));

    EXPECT_EQ(buffer.pop(record)->captured_at_ns, 10u);
    EXPECT_EQ(buffer.pop(record)->captured_at_ns, 20u);
    EXPECT_FALSE(buffer.pop(record).has_value());

    // "stream" has not read anything yet, so both frames are still held.
    EXPECT_EQ(buffer.size(), 2u);
    EXPECT_EQ(buffer.available(record), 0u);
    EXPECT_EQ(buffer.available(stream), 2u);

    EXPECT_EQ(buffer.pop(stream)->captured_at_ns, 10u);
    EXPECT_EQ(buffer.pop(stream)->captured_at_ns, 20u);
    EXPECT_TRUE(buffer.empty());
}

TEST_F(AudioRingBufferTest, SlowReaderLosesOnlyItsOwnFrames) {
    const auto fast = buffer.add_reader("fast");
    const auto slow = buffer.add_reader("slow");
    for (uint64_t ts = 1; ts <= 3; ++ts) {
        buffer.push(frame_at(ts));
        ASSERT_TRUE(buffer.pop(fast).has_value());
    }
    buffer.push(frame_at(4));

    auto fast_stats = buffer.stats(fast);
    auto slow_stats = buffer.stats(slow);
    EXPECT_EQ(fast_stats.current_depth, 1u);
    EXPECT_EQ(fast_stats.dropped_frames, 0u);
    EXPECT_EQ(slow_stats.current_depth, 3u);
    EXPECT_EQ(slow_stats.dropped_frames, 1u);
    ASSERT_TRUE(slow_stats.oldest_timestamp_ns.has_value());
    EXPECT_EQ(*slow_stats.oldest_timestamp_ns, 2u);
    EXPECT_EQ(buffer.dropped_frames(), 1u);

    std::vector<uint64_t> slow_frames;
    while (auto frame = buffer.pop(slow)) {
        slow_frames.push_back(frame->captured_at_ns);
    }
    EXPECT_EQ(slow_frames, (std::vector<uint64_t>{2, 3, 4}));
    EXPECT_EQ(buffer.pop(fast)->captured_at_ns, 4u);
    EXPECT_TRUE(buffer.empty());
}

TEST_F(AudioRingBufferTest, RemovingReaderReleasesItsBacklog) {
    const auto kept = buffer.add_reader("kept");
    const auto gone = buffer.add_reader("gone");
    EXPECT_EQ(buffer.reader_count(), 2u);
    buffer.push(frame_at(1));
    buffer.push(frame_at(2));
    buffer.pop(kept);
    buffer.pop(kept);
    EXPECT_EQ(buffer.size(), 2u);

    EXPECT_TRUE(buffer.remove_reader(gone));
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.reader_count(), 1u);

    EXPECT_FALSE(buffer.remove_reader(gone));
    EXPECT_FALSE(buffer.pop(gone).has_value());
    EXPECT_EQ(buffer.available(gone), 0u);
}

TEST_F(AudioRingBufferTest, LateReaderStartsAtOldestRetainedFrame) {
    buffer.push(frame_at(1));
    buffer.push(frame_at(2));
    const auto late = buffer.add_reader("late");
    EXPECT_EQ(buffer.available(late), 2u);
    EXPECT_EQ(buffer.pop(late)->captured_at_ns, 1u);
}

TEST(AudioRingBufferConcurrencyTest, TwoReaderThreadsEachGetAllFrames) {
    constexpr uint64_t kFrames = 500;
    AudioRingBuffer buffer(kFrames);
    const AudioRingBuffer::ReaderId ids[] = {buffer.add_reader("a"), buffer.add_reader("b")};
    std::vector<uint64_t> seen[2];

    std::vector<std::thread> readers;
    for (int r = 0; r < 2; ++r) {
        readers.emplace_back([&, r] {
            while (seen[r].size() < kFrames) {
                if (auto frame = buffer.pop(ids[r])) {
                    seen[r].push_back(frame->captured_at_ns);
                } else {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (uint64_t ts = 1; ts <= kFrames; ++ts) {
        buffer.push(frame_at(ts));
    }
    for (auto& reader : readers) {
        reader.join();
    }

    for (const auto& frames : seen) {
        ASSERT_EQ(frames.size(), kFrames);
        for (uint64_t i = 0; i < kFrames; ++i) {
            EXPECT_EQ(frames[i], i + 1);
        }
    }
    EXPECT_EQ(buffer.dropped_frames(), 0u);
    EXPECT_TRUE(buffer.empty());
}

TEST(BufferRegistryTest, RegisterAndLookup) {
    BufferRegistry registry;
    auto buffer = std::make_shared<AudioRingBuffer>(4);

    EXPECT_TRUE(registry.register_buffer("main", buffer));
    EXPECT_TRUE(registry.exists("main"));
    EXPECT_EQ(registry.get("main"), buffer);
    EXPECT_EQ(registry.get("missing"), nullptr);
}

TEST(BufferRegistryTest, DuplicateNamesRejected) {
    BufferRegistry registry;
    EXPECT_TRUE(registry.register_buffer("main", std::make_shared<AudioRingBuffer>(4)));
    EXPECT_FALSE(registry.register_buffer("main", std::make_shared<AudioRingBuffer>(4)));
    EXPECT_FALSE(registry.register_buffer("", std::make_shared<AudioRingBuffer>(4)));
    EXPECT_FALSE(registry.register_buffer("null", nullptr));
}

TEST(BufferRegistryTest, UpdateReplacesAndRemoveForgets) {
    BufferRegistry registry;
    auto first = std::make_shared<AudioRingBuffer>(4);
    auto second = std::make_shared<AudioRingBuffer>(8);
    registry.register_buffer("main", first);

    EXPECT_TRUE(registry.update("main", second));
    EXPECT_EQ(registry.get("main"), second);

    EXPECT_TRUE(registry.remove("main"));
    EXPECT_FALSE(registry.remove("main"));
    EXPECT_FALSE(registry.exists("main"));
}

TEST(BufferRegistryTest, ListIsSorted) {
    BufferRegistry registry;
    registry.register_buffer("b", std::make_shared<AudioRingBuffer>(1));
    registry.register_buffer("a", std::make_shared<AudioRingBuffer>(1));
    EXPECT_EQ(registry.list(), (std::vector<std::string>{"a", "b"}));
}

// --- SampleFifo ---

TEST(SampleFifoTest, PopExactWaitsForEnoughSamples) {
    SampleFifo fifo;
    const int16_t first[] = {1, 2, 3};
    fifo.append(first, 3);

    std::vector<int16_t> out;
    EXPECT_FALSE(fifo.pop_exact(out, 4));
    EXPECT_EQ(fifo.size(), 3u);

    const int16_t second[] = {4, 5};
    fifo.append(second, 2);
    ASSERT_TRUE(fifo.pop_exact(out, 4));
    EXPECT_EQ(out, (std::vector<int16_t>{1, 2, 3, 4}));
    EXPECT_EQ(fifo.size(), 1u);
}

TEST(SampleFifoTest, Wraparound) {
    SampleFifo fifo;
    fifo.reserve(4);
    const int16_t a[] = {1, 2, 3};
    fifo.append(a, 3);

    std::vector<int16_t> out;
    ASSERT_TRUE(fifo.pop_exact(out, 2));

    const int16_t b[] = {4, 5, 6};
    fifo.append(b, 3);
    ASSERT_TRUE(fifo.pop_exact(out, 4));
    EXPECT_EQ(out, (std::vector<int16_t>{3, 4, 5, 6}));
    EXPECT_TRUE(fifo.empty());
}
