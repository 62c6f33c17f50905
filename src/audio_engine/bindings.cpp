/**
 * @file bindings.cpp
 * @brief Defines the Python module for the Airlift C++ audio engine.
 * @details This file uses pybind11 to create the `airlift_audio_engine` Python module.
 *          Each component header carries its own `bind_*` function; they are called
 *          here in dependency order, with basic types before the classes using them.
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "audio_constants.h"
#include "audio_types.h"
#include "configuration/graph_resolver.h"
#include "configuration/processor_config_applier.h"
#include "configuration/topology_types.h"
#include "managers/audio_node.h"
#include "utils/cpp_logger.h"

namespace py = pybind11;
using namespace airlift;

PYBIND11_MODULE(airlift_audio_engine, m) {
    m.doc() = "Airlift C++ Audio Engine Extension";

    // 1. Logger has no dependencies on other bound types
    audio::logging::bind_logger(m);

    // 2. Frame and status snapshots
    audio::bind_audio_types(m);

    // 3. Node settings and the AudioNode runtime API
    audio::bind_audio_node(m);

    // 4. Declarative topology, then the resolver that consumes it
    config::bind_topology_types(m);
    config::bind_graph_resolver(m);

    // 5. Runtime configuration applier depends on AudioNode
    config::bind_processor_config_applier(m);

    m.attr("MAX_CHANNELS") = py::int_(audio::MAX_CHANNELS);
    m.attr("DEFAULT_SAMPLE_RATE") = py::int_(audio::DEFAULT_SAMPLE_RATE);
    m.attr("DEFAULT_CHANNELS") = py::int_(audio::DEFAULT_CHANNELS);
}
