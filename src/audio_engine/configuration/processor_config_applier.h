/**
 * @file processor_config_applier.h
 * @brief Defines the ProcessorConfigApplier, which reconciles desired processor settings with a live node.
 * @details The applier keeps a shadow copy of the settings it has successfully
 *          pushed. Each `apply_state` call diffs the desired state against that
 *          shadow and sends only the keys that changed, so repeated applies of the
 *          same state are no-ops.
 */
#ifndef AIRLIFT_PROCESSOR_CONFIG_APPLIER_H
#define AIRLIFT_PROCESSOR_CONFIG_APPLIER_H

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "../managers/audio_node.h"
#include "../utils/settings_map.h"

namespace airlift {
namespace config {

using audio::SettingsMap;

/** @brief Desired settings for one processor instance in one flow. */
struct DesiredProcessorSettings {
    std::string flow;
    std::string processor;
    SettingsMap settings;
};

struct DesiredProcessorState {
    std::vector<DesiredProcessorSettings> processors;
};

/**
 * @class ProcessorConfigApplier
 * @brief Pushes runtime configuration changes into an AudioNode.
 */
class ProcessorConfigApplier {
public:
    /**
     * @param node The node to control. Must outlive the applier.
     */
    explicit ProcessorConfigApplier(audio::AudioNode& node);

    ProcessorConfigApplier(const ProcessorConfigApplier&) = delete;
    ProcessorConfigApplier& operator=(const ProcessorConfigApplier&) = delete;

    /**
     * @brief Applies the changed keys of `desired_state` to the node.
     * @details Keys missing from the desired state are left as they are on the
     *          processor. Failed patches are not recorded and are retried on the
     *          next apply.
     * @return false if any patch was rejected.
     */
    bool apply_state(DesiredProcessorState desired_state);

    /** @brief Settings last applied to `processor` in `flow`; empty if none. */
    SettingsMap applied_settings(const std::string& flow, const std::string& processor) const;

    /** @brief Forgets the shadow state so the next apply pushes every key. */
    void reset();

private:
    using ProcessorKey = std::pair<std::string, std::string>;

    /** @brief Keys of `desired` that are new or differ from `applied`. */
    static SettingsMap compute_patch(const SettingsMap& applied, const SettingsMap& desired);

    audio::AudioNode& node_;

    mutable std::mutex apply_mutex_;
    std::map<ProcessorKey, SettingsMap> applied_;
};

/**
 * @brief Binds the applier and its state structs to a Python module.
 * @param m The pybind11 module.
 */
inline void bind_processor_config_applier(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<DesiredProcessorSettings>(m, "DesiredProcessorSettings")
        .def(py::init<>())
        .def_readwrite("flow", &DesiredProcessorSettings::flow)
        .def_readwrite("processor", &DesiredProcessorSettings::processor)
        .def_readwrite("settings", &DesiredProcessorSettings::settings);

    py::class_<DesiredProcessorState>(m, "DesiredProcessorState")
        .def(py::init<>())
        .def_readwrite("processors", &DesiredProcessorState::processors);

    py::class_<ProcessorConfigApplier>(m, "ProcessorConfigApplier", "Applies desired processor settings to a running AudioNode")
        .def(py::init<audio::AudioNode&>(), py::arg("node"), py::keep_alive<1, 2>())
        .def("apply_state", &ProcessorConfigApplier::apply_state, py::arg("desired_state"),
             py::call_guard<py::gil_scoped_release>(), "Applies the changed settings of a desired state.")
        .def("applied_settings", &ProcessorConfigApplier::applied_settings, py::arg("flow"), py::arg("processor"))
        .def("reset", &ProcessorConfigApplier::reset);
}

} // namespace config
} // namespace airlift

#endif // AIRLIFT_PROCESSOR_CONFIG_APPLIER_H
