/**
 * AudioNode integration tests
 * Lifecycle ordering, status aggregation and a resolved end-to-end pipeline.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <optional>

#include "configuration/graph_resolver.h"
#include "managers/audio_node.h"
#include "mocks/mock_components.h"
#include "processors/basic_processors.h"
#include "producers/wav_file_producer.h"
#include "services/buffer_monitor_service.h"

using namespace airlift::audio;
using namespace airlift::audio::testing;
using airlift::audio::utils::AudioRingBuffer;

namespace {

std::size_t index_of(const std::vector<std::string>& events, const std::string& event) {
    auto it = std::find(events.begin(), events.end(), event);
    return static_cast<std::size_t>(it - events.begin());
}

} // namespace

class AudioNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = std::make_shared<NodeSettings>();
        settings->flow_tuning.tick_ms = 2;
        settings->consumer_poll_ms = 2;
        log = std::make_shared<EventLog>();
        node = std::make_unique<AudioNode>("node", settings);
    }

    void TearDown() override {
        node->stop();
    }

    /** producer "src" -> buffer "main" -> flow "chain" -> consumer "out", plus service "svc". */
    RecordingConsumer* build_pipeline(std::vector<Frame> script) {
        EXPECT_TRUE(node->add_ring_buffer("main", 8));
        EXPECT_TRUE(node->add_producer(std::make_unique<ScriptedProducer>("src", std::move(script), log, settings), "main"));

        auto flow = std::make_unique<Flow>("chain", settings);
        flow->add_input_buffer("src", node->buffer_registry().get("main"));
        flow->add_processor(std::make_unique<GainProcessor>("gain", 2.0f));
        auto consumer = std::make_unique<RecordingConsumer>("out", log, settings);
        RecordingConsumer* raw = consumer.get();
        flow->add_consumer(std::move(consumer));
        EXPECT_TRUE(node->add_flow(std::move(flow)));

        EXPECT_TRUE(node->add_service(std::make_unique<RecordingService>("svc", log)));
        return raw;
    }

    std::shared_ptr<NodeSettings> settings;
    std::shared_ptr<EventLog> log;
    std::unique_ptr<AudioNode> node;
};

TEST_F(AudioNodeTest, FramesFlowFromProducerToConsumer) {
    RecordingConsumer* out = build_pipeline({MakeFrame({100, -100}), MakeFrame({7, 8})});

    ASSERT_TRUE(node->start());
    EXPECT_TRUE(node->is_running());
    ASSERT_TRUE(WaitForCondition([&] { return out->frame_count() == 2; }));

    auto frames = out->frames();
    EXPECT_EQ(frames[0].samples, (std::vector<int16_t>{200, -200}));
    EXPECT_EQ(frames[1].samples, (std::vector<int16_t>{14, 16}));
}

TEST_F(AudioNodeTest, StartsUpstreamFirstAndStopsDownstreamFirst) {
    build_pipeline({});
    ASSERT_TRUE(node->start());
    ASSERT_TRUE(WaitForCondition([&] {
        auto events = log->events();
        return std::find(events.begin(), events.end(), "start:producer:src") != events.end();
    }));

    auto started = log->events();
    EXPECT_LT(index_of(started, "start:consumer:out"), index_of(started, "start:service:svc"));

    log->clear();
    node->stop();
    EXPECT_FALSE(node->is_running());

    auto stopped = log->events();
    ASSERT_EQ(stopped.size(), 3u);
    EXPECT_EQ(stopped[0], "stop:service:svc");
    EXPECT_EQ(stopped[1], "stop:consumer:out");
    EXPECT_EQ(stopped[2], "stop:producer:src");
}

TEST_F(AudioNodeTest, StatusAggregatesComponents) {
    build_pipeline({MakeFrame({1, 1})});
    ASSERT_TRUE(node->start());
    ASSERT_TRUE(WaitForCondition([&] {
        auto status = node->status();
        return !status.flow_statuses.empty() &&
               !status.flow_statuses[0].consumer_statuses.empty() &&
               status.flow_statuses[0].consumer_statuses[0].frames_processed == 1;
    }));

    auto status = node->status();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.producer_count, 1u);
    EXPECT_EQ(status.flow_count, 1u);
    EXPECT_EQ(status.service_count, 1u);
    ASSERT_EQ(status.producer_statuses.size(), 1u);
    EXPECT_TRUE(status.producer_statuses[0].connected);
    EXPECT_EQ(status.producer_statuses[0].samples_processed, 2u);
    ASSERT_TRUE(status.producer_statuses[0].buffer_stats.has_value());
    EXPECT_EQ(status.producer_statuses[0].buffer_stats->capacity, 8u);
}

TEST_F(AudioNodeTest, ComponentsCannotBeAddedWhileRunning) {
    build_pipeline({});
    ASSERT_TRUE(node->start());

    EXPECT_FALSE(node->add_ring_buffer("late", 4));
    EXPECT_FALSE(node->add_producer(std::make_unique<ScriptedProducer>("late", std::vector<Frame>{})));
    EXPECT_FALSE(node->add_flow(std::make_unique<Flow>("late", settings)));
    EXPECT_FALSE(node->add_service(std::make_unique<RecordingService>("late", log)));
}

TEST_F(AudioNodeTest, ProducerWithoutBufferNameGetsPrivateBuffer) {
    ASSERT_TRUE(node->add_producer(std::make_unique<ScriptedProducer>("solo", std::vector<Frame>{})));
    EXPECT_TRUE(node->buffer_registry().exists(producer_buffer_name("solo")));
    EXPECT_EQ(node->buffer_registry().list().size(), 1u);

    EXPECT_FALSE(node->add_producer(std::make_unique<ScriptedProducer>("solo", std::vector<Frame>{})));
    EXPECT_FALSE(node->add_producer(std::make_unique<ScriptedProducer>("lost", std::vector<Frame>{}), "missing"));
    EXPECT_FALSE(node->buffer_registry().exists(producer_buffer_name("lost")));
}

TEST_F(AudioNodeTest, UpdateProcessorConfigRoutesToFlow) {
    build_pipeline({});
    EXPECT_TRUE(node->update_processor_config("chain", "gain", {{"gain", "0.5"}}));
    EXPECT_FALSE(node->update_processor_config("chain", "missing", {{"gain", "0.5"}}));
    EXPECT_FALSE(node->update_processor_config("missing", "gain", {{"gain", "0.5"}}));
    EXPECT_FALSE(node->update_processor_config("chain", "gain", {{"gain", "-1"}}));
}

TEST_F(AudioNodeTest, FailedComponentDoesNotAbortStart) {
    ASSERT_TRUE(node->add_ring_buffer("main", 8));
    auto flow = std::make_unique<Flow>("chain", settings);
    flow->add_input_buffer("main", node->buffer_registry().get("main"));
    auto broken = std::make_unique<RecordingConsumer>("broken", log, settings);
    broken->set_fail_open(true);
    flow->add_consumer(std::move(broken));
    node->add_flow(std::move(flow));
    node->add_service(std::make_unique<RecordingService>("svc", log));

    // A consumer failure is absorbed by its flow; the node still starts everything.
    EXPECT_TRUE(node->start());
    EXPECT_TRUE(node->is_running());
    auto events = log->events();
    EXPECT_NE(std::find(events.begin(), events.end(), "start:service:svc"), events.end());
}

TEST(BufferMonitorServiceTest, ReportsWithoutConsumingFrames) {
    auto buffer = std::make_shared<AudioRingBuffer>(2);
    for (uint64_t ts = 1; ts <= 3; ++ts) {
        buffer->push(MakeFrame({1}, 20, 1, ts));
    }

    BufferMonitorService monitor("watch", "main", buffer, 5);
    ASSERT_TRUE(monitor.start());
    ASSERT_TRUE(WaitForCondition([&] { return monitor.status().reports_emitted >= 2; }));
    monitor.stop();

    EXPECT_FALSE(monitor.status().running);
    EXPECT_EQ(buffer->size(), 2u);
    auto report = monitor.last_report();
    EXPECT_EQ(report.capacity, 2u);
    EXPECT_EQ(report.current_depth, 2u);
    EXPECT_EQ(report.dropped_frames, 1u);
    EXPECT_EQ(report.oldest_timestamp_ns, std::optional<uint64_t>(2));

    BufferMonitorService orphan("orphan", "none", nullptr, 5);
    EXPECT_FALSE(orphan.start());
}

TEST(ResolvedPipelineTest, SineToWavFileEndToEnd) {
    const std::string path = ::testing::TempDir() + "airlift_end_to_end.wav";
    std::remove(path.c_str());

    airlift::config::TopologyConfig topology;
    topology.node_name = "e2e";
    topology.ringbuffers["main"].slots = 16;

    airlift::config::InputConfig tone;
    tone.type = "sine";
    tone.buffer = "main";
    tone.settings = {{"sample_rate", "8000"}, {"channels", "1"}, {"amplitude", "0.5"}};
    topology.inputs["tone"] = tone;

    airlift::config::ProcessorConfig gain;
    gain.type = "gain";
    topology.processors["unity"] = gain;

    airlift::config::OutputConfig rec;
    rec.type = "wav_file";
    rec.input = "tone";
    rec.buffer = "main";
    rec.codec_id = "pcm_s16le";
    rec.settings = {{"path", path}};
    topology.outputs["rec"] = rec;

    airlift::config::FlowConfig chain;
    chain.inputs = {"tone"};
    chain.processors = {"unity"};
    chain.outputs = {"rec"};
    topology.flows["chain"] = chain;

    auto settings = std::make_shared<NodeSettings>();
    settings->flow_tuning.tick_ms = 2;
    airlift::config::GraphResolver resolver;
    auto node = resolver.resolve(topology, settings);
    ASSERT_TRUE(node->start());

    ASSERT_TRUE(WaitForCondition([&] {
        auto status = node->status();
        return !status.flow_statuses.empty() && !status.flow_statuses[0].consumer_statuses.empty() &&
               status.flow_statuses[0].consumer_statuses[0].frames_processed >= 2;
    }));
    node->stop();

    std::ifstream in(path, std::ios::binary);
    ASSERT_TRUE(in.is_open());
    WavFormat format;
    std::string error;
    ASSERT_TRUE(parse_wav_header(in, format, error)) << error;
    EXPECT_EQ(format.sample_rate, 8000);
    EXPECT_EQ(format.channels, 1);
    // Whole 100 ms quanta of 800 samples each.
    EXPECT_GE(format.data_size, 2u * 800u * 2u);
    EXPECT_EQ(format.data_size % (800u * 2u), 0u);
    in.close();
    std::remove(path.c_str());
}
