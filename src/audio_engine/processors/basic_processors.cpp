#include "basic_processors.h"

#include "../utils/cpp_logger.h"

#include <cmath>

namespace airlift {
namespace audio {

bool PassThroughProcessor::update_config(const SettingsMap& patch) {
    (void)patch;
    return true;
}

bool PassThroughProcessor::process_frames(utils::AudioRingBuffer& input,
                                          utils::AudioRingBuffer& output,
                                          std::size_t& frames_emitted) {
    while (auto frame = input.pop()) {
        output.push(std::move(*frame));
        ++frames_emitted;
    }
    return true;
}

GainProcessor::GainProcessor(std::string name, float gain)
    : AudioProcessor(std::move(name)), gain_(1.0f) {
    if (!set_gain(gain)) {
        LOG_CPP_WARNING("[GainProcessor:%s] Invalid initial gain %f, using 1.0.", name_.c_str(), gain);
    }
}

bool GainProcessor::set_gain(float gain) {
    if (!std::isfinite(gain) || gain < 0.0f) {
        return false;
    }
    gain_ = gain;
    return true;
}

bool GainProcessor::update_config(const SettingsMap& patch) {
    if (patch.count("gain") == 0) {
        return true;
    }
    auto value = utils::parse_float(patch, "gain");
    if (!value || !set_gain(*value)) {
        LOG_CPP_WARNING("[GainProcessor:%s] Ignoring invalid gain '%s'.",
                        name_.c_str(), patch.at("gain").c_str());
        return false;
    }
    LOG_CPP_DEBUG("[GainProcessor:%s] Gain set to %f.", name_.c_str(), *value);
    return true;
}

bool GainProcessor::process_frames(utils::AudioRingBuffer& input,
                                   utils::AudioRingBuffer& output,
                                   std::size_t& frames_emitted) {
    while (auto frame = input.pop()) {
        const float gain = gain_.load();
        for (auto& sample : frame->samples) {
            sample = clamp_sample(static_cast<float>(sample) * gain);
        }
        output.push(std::move(*frame));
        ++frames_emitted;
    }
    return true;
}

} // namespace audio
} // namespace airlift
