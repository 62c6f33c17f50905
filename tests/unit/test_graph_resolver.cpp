#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>

#include "configuration/graph_resolver.h"
#include "mocks/mock_components.h"

using namespace airlift::config;
using airlift::audio::testing::CountingComponentFactory;

namespace {

bool has_violation(const std::vector<GraphViolation>& violations,
                   const std::string& rule, const std::string& element_id) {
    return std::any_of(violations.begin(), violations.end(), [&](const GraphViolation& v) {
        return v.rule == rule && v.element_id == element_id;
    });
}

/** sine "tone" -> buffer "main" -> flow "chain" (gain) -> wav output "rec". */
TopologyConfig valid_topology() {
    TopologyConfig topology;
    topology.node_name = "test-node";
    topology.ringbuffers["main"].slots = 8;

    InputConfig tone;
    tone.type = "sine";
    tone.buffer = "main";
    tone.settings = {{"frequency", "440"}, {"sample_rate", "8000"}, {"channels", "1"}};
    topology.inputs["tone"] = tone;

    ProcessorConfig gain;
    gain.type = "gain";
    gain.settings = {{"gain", "0.5"}};
    topology.processors["half"] = gain;

    OutputConfig rec;
    rec.type = "wav_file";
    rec.input = "tone";
    rec.buffer = "main";
    rec.codec_id = "pcm_s16le";
    rec.settings = {{"path", ::testing::TempDir() + "airlift_resolver_test.wav"}};
    topology.outputs["rec"] = rec;

    FlowConfig chain;
    chain.inputs = {"tone"};
    chain.processors = {"half"};
    chain.outputs = {"rec"};
    topology.flows["chain"] = chain;

    ServiceConfig monitor;
    monitor.type = "buffer_monitor";
    monitor.input = "tone";
    topology.services["monitor"] = monitor;
    return topology;
}

} // namespace

class GraphResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<CountingComponentFactory> factory = std::make_shared<CountingComponentFactory>();
    GraphResolver resolver{factory};
};

TEST_F(GraphResolverTest, ValidTopologyHasNoViolations) {
    auto violations = resolver.validate(valid_topology());
    EXPECT_TRUE(violations.empty()) << (violations.empty() ? "" : violations.front().message);
}

TEST_F(GraphResolverTest, ViolationsAreAggregatedAndNothingIsBuilt) {
    auto topology = valid_topology();
    topology.outputs["rec"].codec_id.clear();
    topology.ringbuffers["other"].slots = 4;
    topology.services["monitor"].buffer = "other";

    auto violations = resolver.validate(topology);
    EXPECT_TRUE(has_violation(violations, "output_codec_required", "rec"));
    EXPECT_TRUE(has_violation(violations, "service_reference_mismatch", "monitor"));

    try {
        resolver.resolve(topology);
        FAIL() << "resolve accepted an invalid topology";
    } catch (const GraphValidationError& e) {
        EXPECT_EQ(e.violations().size(), violations.size());
        EXPECT_NE(std::string(e.what()).find("output_codec_required"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("service_reference_mismatch"), std::string::npos);
    }
    EXPECT_EQ(factory->creations.load(), 0);
}

TEST_F(GraphResolverTest, InputMustDeclareBuffer) {
    auto topology = valid_topology();
    topology.inputs["tone"].buffer.clear();
    EXPECT_TRUE(has_violation(resolver.validate(topology), "input_buffer_required", "tone"));

    topology.inputs["tone"].buffer = "nowhere";
    EXPECT_TRUE(has_violation(resolver.validate(topology), "unknown_reference", "tone"));
}

TEST_F(GraphResolverTest, OutputMustDeclareInputAndBuffer) {
    auto topology = valid_topology();
    topology.outputs["rec"].buffer.clear();
    EXPECT_TRUE(has_violation(resolver.validate(topology), "output_reference_required", "rec"));

    topology = valid_topology();
    topology.outputs["rec"].input.clear();
    EXPECT_TRUE(has_violation(resolver.validate(topology), "output_reference_required", "rec"));
}

TEST_F(GraphResolverTest, OutputBufferMustMatchInputBuffer) {
    auto topology = valid_topology();
    topology.ringbuffers["other"].slots = 4;
    topology.outputs["rec"].buffer = "other";
    EXPECT_TRUE(has_violation(resolver.validate(topology), "output_buffer_mismatch", "rec"));
}

TEST_F(GraphResolverTest, ServiceNeedsAReference) {
    auto topology = valid_topology();
    topology.services["monitor"].input.clear();
    EXPECT_TRUE(has_violation(resolver.validate(topology), "service_reference_required", "monitor"));

    topology.services["monitor"].buffer = "main";
    EXPECT_TRUE(resolver.validate(topology).empty());
}

TEST_F(GraphResolverTest, UnknownTypesAndUnsupportedCodecs) {
    auto topology = valid_topology();
    topology.inputs["tone"].type = "theremin";
    topology.processors["half"].type = "reverb";
    topology.services["monitor"].type = "dashboard";
    topology.outputs["rec"].codec_id = "mp3";

    auto violations = resolver.validate(topology);
    EXPECT_TRUE(has_violation(violations, "unknown_type", "tone"));
    EXPECT_TRUE(has_violation(violations, "unknown_type", "half"));
    EXPECT_TRUE(has_violation(violations, "unknown_type", "monitor"));
    EXPECT_TRUE(has_violation(violations, "unsupported_codec", "rec"));
}

TEST_F(GraphResolverTest, RingBufferNeedsSlots) {
    auto topology = valid_topology();
    topology.ringbuffers["main"].slots = 0;
    EXPECT_TRUE(has_violation(resolver.validate(topology), "invalid_slots", "main"));
}

TEST_F(GraphResolverTest, OneWriterPerBuffer) {
    auto topology = valid_topology();
    topology.inputs["tone2"] = topology.inputs["tone"];
    EXPECT_TRUE(has_violation(resolver.validate(topology), "multiple_writers", "main"));

    topology.inputs["tone2"].enabled = false;
    EXPECT_FALSE(has_violation(resolver.validate(topology), "multiple_writers", "main"));
}

TEST_F(GraphResolverTest, OutputBelongsToOneFlow) {
    auto topology = valid_topology();
    FlowConfig second;
    second.outputs = {"rec"};
    topology.flows["second"] = second;
    EXPECT_TRUE(has_violation(resolver.validate(topology), "output_in_multiple_flows", "rec"));
}

TEST_F(GraphResolverTest, SharedBufferFeedsSeveralFlows) {
    auto topology = valid_topology();
    OutputConfig stream;
    stream.type = "udp";
    stream.input = "tone";
    stream.buffer = "main";
    stream.codec_id = "pcm_s16le";
    topology.outputs["stream"] = stream;

    FlowConfig live;
    live.inputs = {"tone"};
    live.outputs = {"stream"};
    topology.flows["live"] = live;

    auto violations = resolver.validate(topology);
    EXPECT_TRUE(violations.empty()) << (violations.empty() ? "" : violations.front().message);

    auto node = resolver.resolve(topology);
    ASSERT_NE(node->find_flow("chain"), nullptr);
    ASSERT_NE(node->find_flow("live"), nullptr);
    EXPECT_EQ(node->find_flow("live")->consumer_count(), 1u);
    // chain and live each hold their own read position on "main".
    EXPECT_EQ(node->buffer_registry().get("main")->reader_count(), 2u);
}

TEST_F(GraphResolverTest, MixerInputsMayShareFlowInputs) {
    auto topology = valid_topology();
    ProcessorConfig mixer;
    mixer.type = "mixer";
    mixer.settings = {{"input.tone", "producer:tone"}};
    topology.processors["mix"] = mixer;
    topology.flows["chain"].processors = {"mix", "half"};
    EXPECT_TRUE(resolver.validate(topology).empty());

    // The mixer alone carries "tone" into the chain.
    topology.flows["chain"].inputs.clear();
    EXPECT_TRUE(resolver.validate(topology).empty());

    topology.processors["mix"].settings["input.ghost"] = "nowhere";
    EXPECT_TRUE(has_violation(resolver.validate(topology), "unknown_reference", "mix"));
}

TEST_F(GraphResolverTest, FlowOutputsMustReadAFlowInput) {
    auto topology = valid_topology();
    topology.ringbuffers["rb_line"].slots = 4;
    InputConfig line;
    line.type = "sine";
    line.buffer = "rb_line";
    topology.inputs["line"] = line;
    topology.flows["chain"].inputs = {"line"};

    auto violations = resolver.validate(topology);
    EXPECT_TRUE(has_violation(violations, "output_not_in_flow_chain", "rec"));
    EXPECT_THROW(resolver.resolve(topology), GraphValidationError);

    ProcessorConfig mixer;
    mixer.type = "mixer";
    mixer.settings = {{"input.tone", "main"}, {"enabled.tone", "false"}};
    topology.processors["mix"] = mixer;
    topology.flows["chain"].processors = {"mix"};
    EXPECT_TRUE(has_violation(resolver.validate(topology), "output_not_in_flow_chain", "rec"));

    topology.processors["mix"].settings["enabled.tone"] = "true";
    EXPECT_FALSE(has_violation(resolver.validate(topology), "output_not_in_flow_chain", "rec"));
}

TEST_F(GraphResolverTest, FlowReferencesMustExist) {
    auto topology = valid_topology();
    topology.flows["chain"].inputs.push_back("ghost");
    topology.flows["chain"].processors.push_back("ghost_proc");
    topology.flows["chain"].outputs.push_back("ghost_out");

    auto violations = resolver.validate(topology);
    EXPECT_EQ(std::count_if(violations.begin(), violations.end(),
                            [](const GraphViolation& v) { return v.element_id == "chain"; }),
              3);
}

TEST_F(GraphResolverTest, ResolveBuildsUnstartedNode) {
    auto topology = valid_topology();
    OutputConfig direct;
    direct.type = "wav_file";
    direct.input = "tone";
    direct.buffer = "main";
    direct.codec_id = "pcm_s16le";
    direct.settings = {{"path", ::testing::TempDir() + "airlift_resolver_direct.wav"}};
    topology.outputs["direct_rec"] = direct;
    topology.flows["chain"].processors = {"half"};

    auto node = resolver.resolve(topology);
    ASSERT_NE(node, nullptr);
    EXPECT_FALSE(node->is_running());
    EXPECT_EQ(node->name(), "test-node");

    auto flows = node->flow_names();
    EXPECT_NE(std::find(flows.begin(), flows.end(), "chain"), flows.end());
    EXPECT_NE(std::find(flows.begin(), flows.end(), "direct:tone"), flows.end());
    EXPECT_EQ(node->producer_names(), (std::vector<std::string>{"tone"}));

    auto* direct_flow = node->find_flow("direct:tone");
    ASSERT_NE(direct_flow, nullptr);
    EXPECT_EQ(direct_flow->input_count(), 1u);
    EXPECT_EQ(direct_flow->consumer_count(), 1u);

    EXPECT_TRUE(node->buffer_registry().exists("main"));
    EXPECT_EQ(node->buffer_registry().get("producer:tone"), node->buffer_registry().get("main"));
    EXPECT_EQ(node->status().service_count, 1u);

    // tone, half, rec, direct_rec, monitor
    EXPECT_EQ(factory->creations.load(), 5);
}

TEST_F(GraphResolverTest, DisabledElementsAreSkipped) {
    auto topology = valid_topology();
    topology.inputs["tone"].enabled = false;
    topology.outputs["rec"].enabled = false;
    topology.services["monitor"].enabled = false;

    auto node = resolver.resolve(topology);
    EXPECT_TRUE(node->producer_names().empty());
    ASSERT_NE(node->find_flow("chain"), nullptr);
    EXPECT_EQ(node->find_flow("chain")->consumer_count(), 0u);
    EXPECT_EQ(node->status().service_count, 0u);
}
