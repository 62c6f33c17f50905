/**
 * @file topology_types.h
 * @brief Declarative pipeline description consumed by the GraphResolver.
 * @details Plain data supplied by the configuration layer. Every element is
 *          keyed by a unique name and references others by name. Loading these
 *          from files is left to the caller.
 */
#ifndef AIRLIFT_TOPOLOGY_TYPES_H
#define AIRLIFT_TOPOLOGY_TYPES_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../utils/settings_map.h"

namespace airlift {
namespace config {

using audio::SettingsMap;

struct RingBufferConfig {
    std::size_t slots = 0;
};

/** @brief A Producer declaration. `buffer` is the ring buffer it writes. */
struct InputConfig {
    std::string type;
    std::string buffer;
    bool enabled = true;
    SettingsMap settings;
};

struct ProcessorConfig {
    std::string type;
    SettingsMap settings;
};

/**
 * @brief A Consumer declaration.
 * @details `input` and `buffer` must agree: the buffer is the one `input` writes.
 */
struct OutputConfig {
    std::string type;
    std::string input;
    std::string buffer;
    std::string codec_id;
    bool enabled = true;
    SettingsMap settings;
};

struct ServiceConfig {
    std::string type;
    std::string buffer;
    std::string input;
    bool enabled = true;
    SettingsMap settings;
};

struct FlowConfig {
    std::vector<std::string> inputs;
    std::vector<std::string> processors;
    std::vector<std::string> outputs;
    bool enabled = true;
};

struct TopologyConfig {
    std::string node_name = "airlift";
    std::map<std::string, RingBufferConfig> ringbuffers;
    std::map<std::string, InputConfig> inputs;
    std::map<std::string, ProcessorConfig> processors;
    std::map<std::string, OutputConfig> outputs;
    std::map<std::string, ServiceConfig> services;
    std::map<std::string, FlowConfig> flows;
};

/**
 * @brief Binds the topology structs to a Python module.
 * @param m The pybind11 module.
 */
inline void bind_topology_types(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<RingBufferConfig>(m, "RingBufferConfig")
        .def(py::init<>())
        .def_readwrite("slots", &RingBufferConfig::slots);

    py::class_<InputConfig>(m, "InputConfig")
        .def(py::init<>())
        .def_readwrite("type", &InputConfig::type)
        .def_readwrite("buffer", &InputConfig::buffer)
        .def_readwrite("enabled", &InputConfig::enabled)
        .def_readwrite("settings", &InputConfig::settings);

    py::class_<ProcessorConfig>(m, "ProcessorConfig")
        .def(py::init<>())
        .def_readwrite("type", &ProcessorConfig::type)
        .def_readwrite("settings", &ProcessorConfig::settings);

    py::class_<OutputConfig>(m, "OutputConfig")
        .def(py::init<>())
        .def_readwrite("type", &OutputConfig::type)
        .def_readwrite("input", &OutputConfig::input)
        .def_readwrite("buffer", &OutputConfig::buffer)
        .def_readwrite("codec_id", &OutputConfig::codec_id)
        .def_readwrite("enabled", &OutputConfig::enabled)
        .def_readwrite("settings", &OutputConfig::settings);

    py::class_<ServiceConfig>(m, "ServiceConfig")
        .def(py::init<>())
        .def_readwrite("type", &ServiceConfig::type)
        .def_readwrite("buffer", &ServiceConfig::buffer)
        .def_readwrite("input", &ServiceConfig::input)
        .def_readwrite("enabled", &ServiceConfig::enabled)
        .def_readwrite("settings", &ServiceConfig::settings);

    py::class_<FlowConfig>(m, "FlowConfig")
        .def(py::init<>())
        .def_readwrite("inputs", &FlowConfig::inputs)
        .def_readwrite("processors", &FlowConfig::processors)
        .def_readwrite("outputs", &FlowConfig::outputs)
        .def_readwrite("enabled", &FlowConfig::enabled);

    py::class_<TopologyConfig>(m, "TopologyConfig", "Declarative description of an audio node")
        .def(py::init<>())
        .def_readwrite("node_name", &TopologyConfig::node_name)
        .def_readwrite("ringbuffers", &TopologyConfig::ringbuffers)
        .def_readwrite("inputs", &TopologyConfig::inputs)
        .def_readwrite("processors", &TopologyConfig::processors)
        .def_readwrite("outputs", &TopologyConfig::outputs)
        .def_readwrite("services", &TopologyConfig::services)
        .def_readwrite("flows", &TopologyConfig::flows);
}

} // namespace config
} // namespace airlift

#endif // AIRLIFT_TOPOLOGY_TYPES_H
