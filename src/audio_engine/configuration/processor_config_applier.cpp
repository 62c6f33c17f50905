#include "processor_config_applier.h"

#include "../utils/cpp_logger.h"

#include <chrono>

namespace airlift {
namespace config {

ProcessorConfigApplier::ProcessorConfigApplier(audio::AudioNode& node) : node_(node) {}

SettingsMap ProcessorConfigApplier::compute_patch(const SettingsMap& applied, const SettingsMap& desired) {
    SettingsMap patch;
    for (const auto& entry : desired) {
        auto it = applied.find(entry.first);
        if (it == applied.end() || it->second != entry.second) {
            patch.insert(entry);
        }
    }
    return patch;
}

bool ProcessorConfigApplier::apply_state(DesiredProcessorState desired_state) {
    std::lock_guard<std::mutex> lock(apply_mutex_);
    using clock = std::chrono::steady_clock;
    const auto t_start = clock::now();

    std::map<ProcessorKey, SettingsMap> next_applied;
    std::size_t patches_sent = 0;
    std::size_t patches_failed = 0;

    for (auto& desired : desired_state.processors) {
        const ProcessorKey key{desired.flow, desired.processor};
        auto previous = applied_.find(key);
        const SettingsMap empty;
        const SettingsMap& applied = previous != applied_.end() ? previous->second : empty;

        SettingsMap patch = compute_patch(applied, desired.settings);
        SettingsMap recorded = applied;
        if (!patch.empty()) {
            ++patches_sent;
            if (node_.update_processor_config(desired.flow, desired.processor, patch)) {
                for (auto& entry : patch) {
                    recorded[entry.first] = entry.second;
                }
            } else {
                ++patches_failed;
                LOG_CPP_WARNING("[ConfigApplier] Patch of %zu key(s) rejected by '%s' in flow '%s'.",
                                patch.size(), desired.processor.c_str(), desired.flow.c_str());
            }
        }
        if (!recorded.empty()) {
            next_applied[key] = std::move(recorded);
        }
    }

    // Processors absent from the desired state keep their settings but leave the shadow.
    applied_ = std::move(next_applied);

    const auto t_end = clock::now();
    LOG_CPP_INFO("[ConfigApplier] Applied %zu patch(es), %zu rejected, in %lld ms",
                 patches_sent, patches_failed,
                 (long long)std::chrono::duration_cast<std::chrono::milliseconds>(t_end - t_start).count());
    return patches_failed == 0;
}

SettingsMap ProcessorConfigApplier::applied_settings(const std::string& flow, const std::string& processor) const {
    std::lock_guard<std::mutex> lock(apply_mutex_);
    auto it = applied_.find(ProcessorKey{flow, processor});
    return it != applied_.end() ? it->second : SettingsMap{};
}

void ProcessorConfigApplier::reset() {
    std::lock_guard<std::mutex> lock(apply_mutex_);
    applied_.clear();
}

} // namespace config
} // namespace airlift
