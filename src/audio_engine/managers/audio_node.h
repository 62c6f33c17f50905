/**
 * @file audio_node.h
 * @brief Defines the AudioNode, the top-level owner of producers, flows and services.
 * @details The node is assembled once (normally by the GraphResolver) and then
 *          started. Adding components after `start()` is rejected. Start order is
 *          producers, flows, services; stop order is the reverse so that flows
 *          can drain before their producers go away.
 */
#ifndef AIRLIFT_AUDIO_NODE_H
#define AIRLIFT_AUDIO_NODE_H

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../audio_types.h"
#include "../configuration/node_settings.h"
#include "../flow/flow.h"
#include "../producers/audio_producer.h"
#include "../services/buffer_monitor_service.h"
#include "../utils/buffer_registry.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace airlift {
namespace audio {

/** @brief Registry name under which a producer's output buffer is published. */
std::string producer_buffer_name(const std::string& producer_name);

/**
 * @class AudioNode
 * @brief Container exposing aggregated lifecycle and status for a resolved pipeline.
 */
class AudioNode {
public:
    AudioNode(std::string name, std::shared_ptr<NodeSettings> settings);
    ~AudioNode();

    AudioNode(const AudioNode&) = delete;
    AudioNode& operator=(const AudioNode&) = delete;

    /**
     * @brief Creates and registers a named ring buffer.
     * @param slots Capacity in Frames; 0 uses the configured default.
     * @return false if running or the name is taken.
     */
    bool add_ring_buffer(const std::string& buffer_name, std::size_t slots);

    /**
     * @brief Takes ownership of a producer and attaches its output buffer.
     * @param buffer_name Registry buffer to write into. When empty a private buffer
     *        is created. Either way the buffer is also registered as `producer:<name>`.
     * @return false if running, the producer name is taken or the buffer is unknown.
     */
    bool add_producer(std::unique_ptr<AudioProducer> producer, const std::string& buffer_name = "");

    /** @return false if running, `flow` is null or its name is taken. */
    bool add_flow(std::unique_ptr<Flow> flow);

    /** @return false if running, `service` is null or its name is taken. */
    bool add_service(std::unique_ptr<NodeService> service);

    /**
     * @brief Starts producers, then flows, then services.
     * @details Components that fail to start are logged and skipped; the node still runs.
     * @return false if any component failed to start.
     */
    bool start();

    /** @brief Stops services, then flows (with their consumers), then producers. */
    void stop();

    bool is_running() const { return running_.load(); }

    NodeStatus status() const;

    /**
     * @brief Forwards a runtime configuration patch to one processor of one flow.
     * @return false if the flow or processor is unknown or the patch is rejected.
     */
    bool update_processor_config(const std::string& flow_name,
                                 const std::string& processor_name,
                                 const SettingsMap& patch);

    Flow* find_flow(const std::string& flow_name) const;
    AudioProducer* find_producer(const std::string& producer_name) const;

    std::vector<std::string> flow_names() const;
    std::vector<std::string> producer_names() const;

    utils::BufferRegistry& buffer_registry() { return registry_; }
    const utils::BufferRegistry& buffer_registry() const { return registry_; }

    const std::string& name() const { return name_; }
    std::shared_ptr<NodeSettings> settings() const { return settings_; }

private:
    std::string name_;
    std::shared_ptr<NodeSettings> settings_;
    utils::BufferRegistry registry_;

    mutable std::mutex components_mutex_;
    std::vector<std::unique_ptr<AudioProducer>> producers_;
    std::vector<std::unique_ptr<Flow>> flows_;
    std::vector<std::unique_ptr<NodeService>> services_;

    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point started_at_;
};

/**
 * @brief Binds NodeSettings and the AudioNode runtime API to a Python module.
 * @param m The pybind11 module.
 */
inline void bind_audio_node(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<Mp3Tuning>(m, "Mp3Tuning")
        .def(py::init<>())
        .def_readwrite("bitrate_kbps", &Mp3Tuning::bitrate_kbps)
        .def_readwrite("vbr_enabled", &Mp3Tuning::vbr_enabled)
        .def_readwrite("quality", &Mp3Tuning::quality);

    py::class_<FlowTuning>(m, "FlowTuning")
        .def(py::init<>())
        .def_readwrite("tick_ms", &FlowTuning::tick_ms)
        .def_readwrite("idle_sleep_ms", &FlowTuning::idle_sleep_ms);

    py::class_<ProducerTuning>(m, "ProducerTuning")
        .def(py::init<>())
        .def_readwrite("silence_sample_rate", &ProducerTuning::silence_sample_rate)
        .def_readwrite("silence_channels", &ProducerTuning::silence_channels);

    py::class_<NodeSettings, std::shared_ptr<NodeSettings>>(m, "NodeSettings")
        .def(py::init<>())
        .def_readwrite("ring_buffer_capacity", &NodeSettings::ring_buffer_capacity)
        .def_readwrite("consumer_poll_ms", &NodeSettings::consumer_poll_ms)
        .def_readwrite("monitor_interval_ms", &NodeSettings::monitor_interval_ms)
        .def_readwrite("flow_tuning", &NodeSettings::flow_tuning)
        .def_readwrite("producer_tuning", &NodeSettings::producer_tuning)
        .def_readwrite("mp3_tuning", &NodeSettings::mp3_tuning);

    py::class_<AudioNode, std::shared_ptr<AudioNode>>(m, "AudioNode", "A resolved audio pipeline")
        .def_property_readonly("name", &AudioNode::name)
        .def("start", &AudioNode::start, py::call_guard<py::gil_scoped_release>(),
             "Starts producers, flows and services. Returns false if any component failed to start.")
        .def("stop", &AudioNode::stop, py::call_guard<py::gil_scoped_release>(),
             "Stops services, flows and producers, blocking until every thread has exited.")
        .def("is_running", &AudioNode::is_running)
        .def("status", &AudioNode::status, "Returns an aggregated NodeStatus snapshot.")
        .def("update_processor_config", &AudioNode::update_processor_config,
             py::arg("flow"), py::arg("processor"), py::arg("patch"),
             "Applies a partial configuration patch to a running processor.")
        .def("flow_names", &AudioNode::flow_names)
        .def("producer_names", &AudioNode::producer_names)
        .def("buffer_names", [](const AudioNode& node) { return node.buffer_registry().list(); });
}

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_NODE_H
