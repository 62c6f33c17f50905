#include "graph_resolver.h"

#include "../processors/audio_mixer.h"
#include "../utils/cpp_logger.h"

#include <map>
#include <set>
#include <sstream>

namespace airlift {
namespace config {

namespace {

std::string describe(const std::vector<GraphViolation>& violations) {
    std::ostringstream out;
    out << "Topology rejected with " << violations.size() << " violation(s):";
    for (const auto& v : violations) {
        out << "\n  [" << v.rule << "] " << v.element_kind << " '" << v.element_id << "': " << v.message;
    }
    return out.str();
}

const char* const kProducerBufferPrefix = "producer:";

/**
 * Maps a registry buffer name to the declared ring buffer it aliases.
 * Returns an empty string when the name resolves to nothing.
 */
std::string canonical_buffer(const TopologyConfig& topology, const std::string& registry_name) {
    if (topology.ringbuffers.count(registry_name)) {
        return registry_name;
    }
    const std::string prefix(kProducerBufferPrefix);
    if (registry_name.compare(0, prefix.size(), prefix) == 0) {
        auto it = topology.inputs.find(registry_name.substr(prefix.size()));
        if (it != topology.inputs.end() && topology.ringbuffers.count(it->second.buffer)) {
            return it->second.buffer;
        }
    }
    return {};
}

/** Collects violations for one validation pass. */
class ViolationSink {
public:
    void add(std::string rule, std::string kind, std::string id, std::string message) {
        violations_.push_back(GraphViolation{std::move(rule), std::move(kind), std::move(id), std::move(message)});
    }
    std::vector<GraphViolation> take() { return std::move(violations_); }

private:
    std::vector<GraphViolation> violations_;
};

/** Outputs claimed by at least one flow, enabled or not. */
std::set<std::string> outputs_in_flows(const TopologyConfig& topology) {
    std::set<std::string> claimed;
    for (const auto& flow : topology.flows) {
        claimed.insert(flow.second.outputs.begin(), flow.second.outputs.end());
    }
    return claimed;
}

std::string direct_flow_name(const std::string& input_name) {
    return "direct:" + input_name;
}

/**
 * True when `flow` carries audio from `input_name`: either the flow reads the
 * input directly or one of its mixers has an enabled input on the same buffer.
 */
bool flow_reads_input(const TopologyConfig& topology, const FlowConfig& flow, const std::string& input_name) {
    for (const auto& name : flow.inputs) {
        if (name == input_name) {
            return true;
        }
    }
    auto input_it = topology.inputs.find(input_name);
    if (input_it == topology.inputs.end() || input_it->second.buffer.empty()) {
        return false;
    }
    for (const auto& processor_name : flow.processors) {
        auto it = topology.processors.find(processor_name);
        if (it == topology.processors.end() || it->second.type != "mixer") {
            continue;
        }
        for (const auto& mixer_input : audio::parse_mixer_inputs(it->second.settings)) {
            if (mixer_input.enabled && canonical_buffer(topology, mixer_input.buffer_name) == input_it->second.buffer) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

GraphValidationError::GraphValidationError(std::vector<GraphViolation> violations)
    : std::runtime_error(describe(violations)), violations_(std::move(violations)) {}

GraphResolver::GraphResolver(std::shared_ptr<ComponentFactory> factory)
    : factory_(factory ? std::move(factory) : std::make_shared<DefaultComponentFactory>()) {}

std::vector<GraphViolation> GraphResolver::validate(const TopologyConfig& topology) const {
    ViolationSink sink;

    for (const auto& entry : topology.ringbuffers) {
        if (entry.second.slots < 1) {
            sink.add("invalid_slots", "ringbuffer", entry.first, "ring buffer needs at least one slot");
        }
    }

    std::map<std::string, std::vector<std::string>> writers;
    for (const auto& entry : topology.inputs) {
        const std::string& id = entry.first;
        const InputConfig& input = entry.second;
        if (!factory_->supports_input_type(input.type)) {
            sink.add("unknown_type", "input", id, "unsupported input type '" + input.type + "'");
        }
        if (input.buffer.empty()) {
            sink.add("input_buffer_required", "input", id, "input must declare the ring buffer it writes");
        } else if (!topology.ringbuffers.count(input.buffer)) {
            sink.add("unknown_reference", "input", id, "ring buffer '" + input.buffer + "' is not declared");
        } else if (input.enabled) {
            writers[input.buffer].push_back(id);
        }
    }
    for (const auto& entry : writers) {
        if (entry.second.size() > 1) {
            sink.add("multiple_writers", "ringbuffer", entry.first,
                     std::to_string(entry.second.size()) + " enabled inputs write this buffer");
        }
    }

    for (const auto& entry : topology.processors) {
        const std::string& id = entry.first;
        const ProcessorConfig& processor = entry.second;
        if (!factory_->supports_processor_type(processor.type)) {
            sink.add("unknown_type", "processor", id, "unsupported processor type '" + processor.type + "'");
            continue;
        }
        if (processor.type == "mixer") {
            for (const auto& mixer_input : audio::parse_mixer_inputs(processor.settings)) {
                if (canonical_buffer(topology, mixer_input.buffer_name).empty()) {
                    sink.add("unknown_reference", "processor", id,
                             "mixer input '" + mixer_input.name + "' names unknown buffer '" +
                             mixer_input.buffer_name + "'");
                }
            }
        }
    }

    for (const auto& entry : topology.outputs) {
        const std::string& id = entry.first;
        const OutputConfig& output = entry.second;
        if (output.input.empty() || output.buffer.empty()) {
            sink.add("output_reference_required", "output", id, "output must declare both input and buffer");
        }
        auto input_it = topology.inputs.find(output.input);
        if (!output.input.empty() && input_it == topology.inputs.end()) {
            sink.add("unknown_reference", "output", id, "input '" + output.input + "' is not declared");
        }
        if (!output.buffer.empty() && !topology.ringbuffers.count(output.buffer)) {
            sink.add("unknown_reference", "output", id, "ring buffer '" + output.buffer + "' is not declared");
        }
        if (input_it != topology.inputs.end() && !output.buffer.empty() &&
            input_it->second.buffer != output.buffer) {
            sink.add("output_buffer_mismatch", "output", id,
                     "input '" + output.input + "' writes '" + input_it->second.buffer + "', not '" +
                     output.buffer + "'");
        }
        const bool known_type = factory_->supports_output_type(output.type);
        if (!known_type) {
            sink.add("unknown_type", "output", id, "unsupported output type '" + output.type + "'");
        }
        if (output.codec_id.empty()) {
            sink.add("output_codec_required", "output", id, "output must declare a codec_id");
        } else if (known_type && !factory_->supports_codec(output.type, output.codec_id)) {
            sink.add("unsupported_codec", "output", id,
                     "codec '" + output.codec_id + "' is not supported by '" + output.type + "' outputs");
        }
    }

    for (const auto& entry : topology.services) {
        const std::string& id = entry.first;
        const ServiceConfig& service = entry.second;
        if (!factory_->supports_service_type(service.type)) {
            sink.add("unknown_type", "service", id, "unsupported service type '" + service.type + "'");
        }
        if (service.buffer.empty() && service.input.empty()) {
            sink.add("service_reference_required", "service", id, "service must reference a buffer or an input");
            continue;
        }
        if (!service.buffer.empty() && !topology.ringbuffers.count(service.buffer)) {
            sink.add("unknown_reference", "service", id, "ring buffer '" + service.buffer + "' is not declared");
        }
        auto input_it = topology.inputs.find(service.input);
        if (!service.input.empty() && input_it == topology.inputs.end()) {
            sink.add("unknown_reference", "service", id, "input '" + service.input + "' is not declared");
        }
        if (input_it != topology.inputs.end() && !service.buffer.empty() &&
            input_it->second.buffer != service.buffer) {
            sink.add("service_reference_mismatch", "service", id,
                     "input '" + service.input + "' writes '" + input_it->second.buffer + "', not '" +
                     service.buffer + "'");
        }
    }

    std::map<std::string, std::vector<std::string>> output_owners;
    for (const auto& entry : topology.flows) {
        const std::string& id = entry.first;
        const FlowConfig& flow = entry.second;
        for (const auto& input_name : flow.inputs) {
            if (!topology.inputs.count(input_name)) {
                sink.add("unknown_reference", "flow", id, "input '" + input_name + "' is not declared");
            }
        }
        for (const auto& processor_name : flow.processors) {
            if (!topology.processors.count(processor_name)) {
                sink.add("unknown_reference", "flow", id, "processor '" + processor_name + "' is not declared");
            }
        }
        for (const auto& output_name : flow.outputs) {
            auto output_it = topology.outputs.find(output_name);
            if (output_it == topology.outputs.end()) {
                sink.add("unknown_reference", "flow", id, "output '" + output_name + "' is not declared");
            } else if (topology.inputs.count(output_it->second.input) &&
                       !flow_reads_input(topology, flow, output_it->second.input)) {
                sink.add("output_not_in_flow_chain", "output", output_name,
                         "flow '" + id + "' does not read input '" + output_it->second.input + "'");
            }
            output_owners[output_name].push_back(id);
        }
    }
    for (const auto& entry : output_owners) {
        if (entry.second.size() > 1) {
            sink.add("output_in_multiple_flows", "output", entry.first,
                     "output is listed by " + std::to_string(entry.second.size()) + " flows");
        }
    }

    return sink.take();
}

std::unique_ptr<audio::AudioNode> GraphResolver::resolve(const TopologyConfig& topology,
                                                         std::shared_ptr<audio::NodeSettings> settings) const {
    std::vector<GraphViolation> violations = validate(topology);
    if (!violations.empty()) {
        LOG_CPP_ERROR("[GraphResolver] Topology '%s' has %zu violation(s).",
                      topology.node_name.c_str(), violations.size());
        throw GraphValidationError(std::move(violations));
    }

    auto node = std::make_unique<audio::AudioNode>(topology.node_name, std::move(settings));
    auto node_settings = node->settings();
    ViolationSink failures;

    for (const auto& entry : topology.ringbuffers) {
        if (!node->add_ring_buffer(entry.first, entry.second.slots)) {
            failures.add("component_construction", "ringbuffer", entry.first, "ring buffer could not be registered");
        }
    }

    for (const auto& entry : topology.inputs) {
        if (!entry.second.enabled) {
            LOG_CPP_INFO("[GraphResolver] Input '%s' is disabled.", entry.first.c_str());
            continue;
        }
        auto producer = factory_->create_producer(entry.first, entry.second, node_settings);
        if (!producer || !node->add_producer(std::move(producer), entry.second.buffer)) {
            failures.add("component_construction", "input", entry.first, "producer could not be created");
        }
    }

    auto attach_output = [&](audio::Flow& flow, const std::string& output_name) {
        const OutputConfig& output = topology.outputs.at(output_name);
        if (!output.enabled) {
            LOG_CPP_INFO("[GraphResolver] Output '%s' is disabled.", output_name.c_str());
            return;
        }
        auto consumer = factory_->create_consumer(output_name, output, node_settings);
        if (!consumer || !flow.add_consumer(std::move(consumer))) {
            failures.add("component_construction", "output", output_name, "consumer could not be created");
        }
    };

    for (const auto& entry : topology.flows) {
        const FlowConfig& flow_config = entry.second;
        if (!flow_config.enabled) {
            LOG_CPP_INFO("[GraphResolver] Flow '%s' is disabled.", entry.first.c_str());
            continue;
        }
        auto flow = std::make_unique<audio::Flow>(entry.first, node_settings);
        for (const auto& input_name : flow_config.inputs) {
            auto buffer = node->buffer_registry().get(topology.inputs.at(input_name).buffer);
            if (!flow->add_input_buffer(input_name, buffer)) {
                failures.add("component_construction", "flow", entry.first,
                             "input '" + input_name + "' could not be connected");
            }
        }
        for (const auto& processor_name : flow_config.processors) {
            auto processor = factory_->create_processor(
                processor_name, topology.processors.at(processor_name), node->buffer_registry());
            if (!processor || !flow->add_processor(std::move(processor))) {
                failures.add("component_construction", "processor", processor_name,
                             "processor could not be created for flow '" + entry.first + "'");
            }
        }
        for (const auto& output_name : flow_config.outputs) {
            attach_output(*flow, output_name);
        }
        if (!node->add_flow(std::move(flow))) {
            failures.add("component_construction", "flow", entry.first, "flow could not be added");
        }
    }

    // Outputs outside every flow read their input's buffer through an implicit flow.
    const std::set<std::string> claimed = outputs_in_flows(topology);
    std::map<std::string, std::unique_ptr<audio::Flow>> direct_flows;
    for (const auto& entry : topology.outputs) {
        if (!entry.second.enabled || claimed.count(entry.first)) {
            continue;
        }
        const std::string& input_name = entry.second.input;
        auto& flow = direct_flows[input_name];
        if (!flow) {
            flow = std::make_unique<audio::Flow>(direct_flow_name(input_name), node_settings);
            auto buffer = node->buffer_registry().get(topology.inputs.at(input_name).buffer);
            if (!flow->add_input_buffer(input_name, buffer)) {
                failures.add("component_construction", "output", entry.first,
                             "input '" + input_name + "' could not be connected");
            }
        }
        attach_output(*flow, entry.first);
    }
    for (auto& entry : direct_flows) {
        const std::string flow_name = entry.second->name();
        if (!node->add_flow(std::move(entry.second))) {
            failures.add("component_construction", "flow", flow_name, "flow could not be added");
        }
    }

    for (const auto& entry : topology.services) {
        const ServiceConfig& service_config = entry.second;
        if (!service_config.enabled) {
            LOG_CPP_INFO("[GraphResolver] Service '%s' is disabled.", entry.first.c_str());
            continue;
        }
        const std::string buffer_name = service_config.buffer.empty()
                                            ? topology.inputs.at(service_config.input).buffer
                                            : service_config.buffer;
        auto service = factory_->create_service(entry.first, service_config, buffer_name,
                                                node->buffer_registry().get(buffer_name), node_settings);
        if (!service || !node->add_service(std::move(service))) {
            failures.add("component_construction", "service", entry.first, "service could not be created");
        }
    }

    violations = failures.take();
    if (!violations.empty()) {
        LOG_CPP_ERROR("[GraphResolver] Failed to build %zu component(s) of '%s'.",
                      violations.size(), topology.node_name.c_str());
        throw GraphValidationError(std::move(violations));
    }

    LOG_CPP_INFO("[GraphResolver] Resolved node '%s': %zu buffers, %zu flows.",
                 topology.node_name.c_str(), topology.ringbuffers.size(), node->flow_names().size());
    return node;
}

} // namespace config
} // namespace airlift
