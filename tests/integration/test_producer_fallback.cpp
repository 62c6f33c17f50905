/**
 * Producer integration tests
 * Real producers feeding ring buffers, including the degrade-to-silence paths.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <atomic>
#include <memory>
#include <thread>

#include "consumers/wav_file_consumer.h"
#include "mocks/mock_components.h"
#include "producers/sine_producer.h"
#include "producers/wav_file_producer.h"

using namespace airlift::audio;
using namespace airlift::audio::testing;
using airlift::audio::utils::AudioRingBuffer;

namespace {

bool all_zero(const Frame& frame) {
    for (int16_t s : frame.samples) {
        if (s != 0) {
            return false;
        }
    }
    return true;
}

void write_wav(const std::string& path, int sample_rate, int channels, const std::vector<int16_t>& samples) {
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    auto header = build_wav_header(sample_rate, channels, data_bytes);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    for (int16_t s : samples) {
        const uint16_t v = static_cast<uint16_t>(s);
        const char bytes[2] = {static_cast<char>(v & 0xFF), static_cast<char>(v >> 8)};
        out.write(bytes, 2);
    }
}

} // namespace

class ProducerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = std::make_shared<NodeSettings>();
        settings->producer_tuning.silence_sample_rate = 8000;
        settings->producer_tuning.silence_channels = 1;
        buffer = std::make_shared<AudioRingBuffer>(32);
    }

    std::shared_ptr<NodeSettings> settings;
    std::shared_ptr<AudioRingBuffer> buffer;
};

TEST_F(ProducerTest, MissingWavFileDegradesToSilence) {
    WavFileParams params;
    params.path = ::testing::TempDir() + "airlift_does_not_exist.wav";
    WavFileProducer producer("missing", params, settings);
    ASSERT_TRUE(producer.attach_output_buffer(buffer));

    ASSERT_TRUE(producer.start());
    ASSERT_TRUE(WaitForCondition([&] { return buffer->size() >= 2; }));

    auto status = producer.status();
    EXPECT_TRUE(status.running);
    EXPECT_FALSE(status.connected);

    auto frame = buffer->pop();
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(all_zero(*frame));
    EXPECT_EQ(frame->sample_rate, 8000);
    EXPECT_EQ(frame->channels, 1);
    EXPECT_EQ(frame->samples.size(), 800u);
    EXPECT_GT(frame->captured_at_ns, 0u);

    producer.stop();
    EXPECT_FALSE(producer.is_running());
}

TEST_F(ProducerTest, FailedOpenDegradesToSilence) {
    ScriptedProducer producer("broken", {}, nullptr, settings);
    producer.set_fail_open(true);
    producer.attach_output_buffer(buffer);

    ASSERT_TRUE(producer.start());
    ASSERT_TRUE(WaitForCondition([&] { return !buffer->empty(); }));
    EXPECT_FALSE(producer.status().connected);
    EXPECT_TRUE(all_zero(*buffer->pop()));
}

TEST_F(ProducerTest, ExhaustedSourceKeepsLastFormatForSilence) {
    ScriptedProducer producer("finite", {MakeFrame({5, 5, 5, 5}, 40, 2)}, nullptr, settings);
    producer.set_exhaust_at_end(true);
    producer.attach_output_buffer(buffer);

    ASSERT_TRUE(producer.start());
    ASSERT_TRUE(WaitForCondition([&] { return buffer->size() >= 2; }));

    auto first = buffer->pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->samples, (std::vector<int16_t>{5, 5, 5, 5}));

    auto silence = buffer->pop();
    ASSERT_TRUE(silence.has_value());
    EXPECT_TRUE(all_zero(*silence));
    EXPECT_EQ(silence->sample_rate, 40);
    EXPECT_EQ(silence->channels, 2);
    EXPECT_FALSE(producer.status().connected);
}

TEST_F(ProducerTest, MalformedFramesAreRejected) {
    Frame bad = MakeFrame({1, 2, 3}, 20, 2);
    ScriptedProducer producer("bad", {bad, MakeFrame({4, 4}, 20, 2)}, nullptr, settings);
    producer.attach_output_buffer(buffer);

    ASSERT_TRUE(producer.start());
    ASSERT_TRUE(WaitForCondition([&] { return buffer->size() == 1; }));
    EXPECT_EQ(producer.status().errors, 1u);
    EXPECT_EQ(buffer->pop()->samples, (std::vector<int16_t>{4, 4}));
}

TEST_F(ProducerTest, StartRequiresBuffer) {
    ScriptedProducer producer("orphan", {}, nullptr, settings);
    EXPECT_FALSE(producer.start());
    EXPECT_FALSE(producer.attach_output_buffer(nullptr));

    ASSERT_TRUE(producer.attach_output_buffer(buffer));
    EXPECT_FALSE(producer.attach_output_buffer(std::make_shared<AudioRingBuffer>(4)));
}

TEST_F(ProducerTest, SecondStartIsANoOpSuccess) {
    ScriptedProducer producer("twice", {}, nullptr, settings);
    producer.set_fail_open(true);
    producer.attach_output_buffer(buffer);

    ASSERT_TRUE(producer.start());
    EXPECT_TRUE(producer.start());
    EXPECT_TRUE(producer.is_running());

    producer.stop();
    producer.stop();
    EXPECT_FALSE(producer.is_running());
}

TEST_F(ProducerTest, NothingIsPushedAfterStopReturns) {
    ScriptedProducer producer("quiet", {}, nullptr, settings);
    producer.set_fail_open(true);
    producer.attach_output_buffer(buffer);

    ASSERT_TRUE(producer.start());
    ASSERT_TRUE(WaitForCondition([&] { return buffer->size() >= 2; }));
    producer.stop();

    const auto before = buffer->stats();
    const uint64_t samples_before = producer.status().samples_processed;
    // Longer than one silence quantum.
    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    const auto after = buffer->stats();
    EXPECT_EQ(after.current_depth, before.current_depth);
    EXPECT_EQ(after.dropped_frames, before.dropped_frames);
    EXPECT_EQ(after.newest_timestamp_ns, before.newest_timestamp_ns);
    EXPECT_EQ(producer.status().samples_processed, samples_before);
}

TEST_F(ProducerTest, RunningStateCanBePolledDuringStartStop) {
    ScriptedProducer producer("polled", {}, nullptr, settings);
    producer.set_fail_open(true);
    producer.attach_output_buffer(buffer);

    std::atomic<bool> done{false};
    std::atomic<int> polls{0};
    std::thread poller([&] {
        while (!done) {
            (void)producer.is_running();
            (void)producer.status();
            ++polls;
        }
    });

    for (int cycle = 0; cycle < 20; ++cycle) {
        ASSERT_TRUE(producer.start());
        EXPECT_TRUE(producer.is_running());
        producer.stop();
        EXPECT_FALSE(producer.is_running());
    }
    done = true;
    poller.join();
    EXPECT_GT(polls.load(), 0);
}

TEST(ConsumerIdleTest, EmptyPollsAreNotErrors) {
    auto settings = std::make_shared<NodeSettings>();
    settings->consumer_poll_ms = 2;
    RecordingConsumer consumer("idle", nullptr, settings);
    ASSERT_TRUE(consumer.attach_input_buffer(std::make_shared<AudioRingBuffer>(4)));

    ASSERT_TRUE(consumer.start());
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    auto status = consumer.status();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.errors, 0u);
    EXPECT_EQ(status.frames_processed, 0u);
    consumer.stop();
    EXPECT_EQ(consumer.status().errors, 0u);
}

TEST_F(ProducerTest, WavFileIsReadInQuanta) {
    const std::string path = ::testing::TempDir() + "airlift_producer_input.wav";
    // 100 Hz mono: a quantum is 10 samples; 25 samples give 10 + 10 + 5.
    std::vector<int16_t> samples(25);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(i + 1);
    }
    write_wav(path, 100, 1, samples);

    WavFileParams params;
    params.path = path;
    WavFileProducer producer("file", params, settings);
    producer.attach_output_buffer(buffer);
    ASSERT_TRUE(producer.start());

    // Three data frames, then silence once the file is exhausted.
    ASSERT_TRUE(WaitForCondition([&] { return buffer->size() >= 4; }, std::chrono::milliseconds(3000)));
    producer.stop();

    auto f1 = buffer->pop();
    auto f2 = buffer->pop();
    auto f3 = buffer->pop();
    ASSERT_TRUE(f1 && f2 && f3);
    EXPECT_EQ(f1->samples.size(), 10u);
    EXPECT_EQ(f1->samples.front(), 1);
    EXPECT_EQ(f2->samples.front(), 11);
    EXPECT_EQ(f3->samples, (std::vector<int16_t>{21, 22, 23, 24, 25}));
    EXPECT_EQ(f1->sample_rate, 100);

    auto tail = buffer->pop();
    ASSERT_TRUE(tail.has_value());
    EXPECT_TRUE(all_zero(*tail));
    EXPECT_GE(producer.status().samples_processed, 25u);
    std::remove(path.c_str());
}

TEST_F(ProducerTest, SineProducerEmitsQuantumFrames) {
    SineParams params;
    params.sample_rate = 8000;
    params.channels = 2;
    params.amplitude = 0.5;
    SineProducer producer("tone", params, settings);
    producer.attach_output_buffer(buffer);

    ASSERT_TRUE(producer.start());
    ASSERT_TRUE(WaitForCondition([&] { return !buffer->empty(); }));
    producer.stop();

    auto frame = buffer->pop();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->samples.size(), 1600u);
    EXPECT_EQ(frame->channels, 2);
    EXPECT_FALSE(producer.status().connected);

    int16_t peak = 0;
    for (std::size_t i = 0; i < frame->samples.size(); i += 2) {
        EXPECT_EQ(frame->samples[i], frame->samples[i + 1]);
        peak = std::max<int16_t>(peak, frame->samples[i]);
    }
    EXPECT_GT(peak, 15000);
    EXPECT_LE(peak, 16384);
}
