/**
 * @file graph_resolver.h
 * @brief Validates a TopologyConfig and materializes it into a runnable AudioNode.
 * @details Validation collects every rule violation in one pass. Resolution
 *          refuses to build anything while violations remain, so a rejected
 *          topology never leaves half-started components behind.
 */
#ifndef AIRLIFT_GRAPH_RESOLVER_H
#define AIRLIFT_GRAPH_RESOLVER_H

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "component_factory.h"
#include "node_settings.h"
#include "topology_types.h"
#include "../managers/audio_node.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace airlift {
namespace config {

/** @brief One broken rule on one topology element. */
struct GraphViolation {
    std::string rule;
    std::string element_kind;
    std::string element_id;
    std::string message;
};

/**
 * @class GraphValidationError
 * @brief Thrown by GraphResolver::resolve with the complete list of violations.
 */
class GraphValidationError : public std::runtime_error {
public:
    explicit GraphValidationError(std::vector<GraphViolation> violations);

    const std::vector<GraphViolation>& violations() const noexcept { return violations_; }

private:
    std::vector<GraphViolation> violations_;
};

/**
 * @class GraphResolver
 * @brief Turns a declarative topology into an AudioNode.
 */
class GraphResolver {
public:
    /**
     * @param factory Builds the concrete components. Defaults to DefaultComponentFactory.
     */
    explicit GraphResolver(std::shared_ptr<ComponentFactory> factory = nullptr);

    /**
     * @brief Checks every rule against `topology` without building anything.
     * @return All violations found; empty when the topology is valid.
     */
    std::vector<GraphViolation> validate(const TopologyConfig& topology) const;

    /**
     * @brief Validates, then builds and wires the node. The node is not started.
     * @param settings Node-wide tuning; null uses defaults.
     * @throws GraphValidationError if validation or component construction fails.
     */
    std::unique_ptr<audio::AudioNode> resolve(const TopologyConfig& topology,
                                              std::shared_ptr<audio::NodeSettings> settings = nullptr) const;

private:
    std::shared_ptr<ComponentFactory> factory_;
};

/**
 * @brief Binds GraphViolation, GraphValidationError and GraphResolver to a Python module.
 * @param m The pybind11 module.
 */
inline void bind_graph_resolver(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<GraphViolation>(m, "GraphViolation")
        .def(py::init<>())
        .def_readonly("rule", &GraphViolation::rule)
        .def_readonly("element_kind", &GraphViolation::element_kind)
        .def_readonly("element_id", &GraphViolation::element_id)
        .def_readonly("message", &GraphViolation::message)
        .def("__repr__", [](const GraphViolation& v) {
            return "<GraphViolation " + v.rule + " " + v.element_kind + ":" + v.element_id + ">";
        });

    py::register_exception<GraphValidationError>(m, "GraphValidationError", PyExc_ValueError);

    py::class_<GraphResolver>(m, "GraphResolver", "Validates topologies and builds AudioNodes")
        .def(py::init([]() { return std::make_unique<GraphResolver>(); }))
        .def("validate", &GraphResolver::validate, py::arg("topology"),
             "Returns every violation in the topology; an empty list means it is valid.")
        .def("resolve",
             [](const GraphResolver& self, const TopologyConfig& topology,
                std::shared_ptr<audio::NodeSettings> settings) {
                 return std::shared_ptr<audio::AudioNode>(self.resolve(topology, std::move(settings)));
             },
             py::arg("topology"), py::arg("settings") = nullptr,
             "Builds an unstarted AudioNode. Raises GraphValidationError on an invalid topology.");
}

} // namespace config
} // namespace airlift

#endif // AIRLIFT_GRAPH_RESOLVER_H
