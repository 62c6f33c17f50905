#include "audio_mixer.h"

#include "../utils/cpp_logger.h"

#include <algorithm>
#include <cmath>

namespace airlift {
namespace audio {

namespace {
const std::string kInputPrefix = "input.";
const std::string kGainPrefix = "gain.";
const std::string kEnabledPrefix = "enabled.";

float clamp_gain(float gain) {
    if (!std::isfinite(gain)) {
        return 0.0f;
    }
    return std::clamp(gain, 0.0f, 1.0f);
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

constexpr long kMaxSampleRate = 768000;

bool valid_format(long sample_rate, long channels) {
    return sample_rate >= FRAME_QUANTUM_DIVISOR && sample_rate <= kMaxSampleRate &&
           channels > 0 && channels <= MAX_CHANNELS;
}
}

std::vector<MixerInputConfig> parse_mixer_inputs(const SettingsMap& settings) {
    std::vector<MixerInputConfig> inputs;
    for (const auto& entry : settings) {
        if (!starts_with(entry.first, kInputPrefix)) {
            continue;
        }
        MixerInputConfig input;
        input.name = entry.first.substr(kInputPrefix.size());
        input.buffer_name = entry.second;
        input.gain = utils::get_float(settings, kGainPrefix + input.name, 1.0f);
        input.enabled = utils::get_bool(settings, kEnabledPrefix + input.name, true);
        inputs.push_back(std::move(input));
    }
    return inputs;
}

AudioMixer::AudioMixer(std::string name, MixerParams params)
    : AudioProcessor(std::move(name)), params_(params) {
    if (!valid_format(params_.output_sample_rate, params_.output_channels)) {
        LOG_CPP_WARNING("[AudioMixer:%s] Invalid output format (rate=%d, channels=%d). Using %d Hz, %d channels.",
                        name_.c_str(), params_.output_sample_rate, params_.output_channels,
                        DEFAULT_SAMPLE_RATE, DEFAULT_CHANNELS);
        params_.output_sample_rate = DEFAULT_SAMPLE_RATE;
        params_.output_channels = DEFAULT_CHANNELS;
    }
    if (!std::isfinite(params_.master_gain) || params_.master_gain < 0.0f) {
        params_.master_gain = 1.0f;
    }
}

AudioMixer::~AudioMixer() {
    for (auto& entry : inputs_) {
        entry.second.buffer->remove_reader(entry.second.reader);
    }
}

bool AudioMixer::connect_input(const std::string& input_name,
                               std::shared_ptr<utils::AudioRingBuffer> buffer,
                               float gain) {
    if (input_name.empty() || !buffer) {
        LOG_CPP_ERROR("[AudioMixer:%s] Attempted to connect an unnamed or null input.", name_.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(mixer_mutex_);
    MixerInput& input = inputs_[input_name];
    if (input.buffer) {
        input.buffer->remove_reader(input.reader);
    }
    input.reader = buffer->add_reader("mixer:" + name_ + ":" + input_name);
    input.buffer = std::move(buffer);
    input.gain = clamp_gain(gain);
    LOG_CPP_INFO("[AudioMixer:%s] Connected input '%s' (gain=%.2f).", name_.c_str(), input_name.c_str(), input.gain);
    return true;
}

bool AudioMixer::disconnect_input(const std::string& input_name) {
    std::lock_guard<std::mutex> lock(mixer_mutex_);
    auto it = inputs_.find(input_name);
    if (it == inputs_.end()) {
        LOG_CPP_WARNING("[AudioMixer:%s] Cannot disconnect unknown input '%s'.", name_.c_str(), input_name.c_str());
        return false;
    }
    it->second.buffer->remove_reader(it->second.reader);
    inputs_.erase(it);
    LOG_CPP_INFO("[AudioMixer:%s] Disconnected input '%s'.", name_.c_str(), input_name.c_str());
    return true;
}

bool AudioMixer::set_input_gain(const std::string& input_name, float gain) {
    std::lock_guard<std::mutex> lock(mixer_mutex_);
    auto it = inputs_.find(input_name);
    if (it == inputs_.end()) {
        return false;
    }
    it->second.gain = clamp_gain(gain);
    return true;
}

std::optional<float> AudioMixer::input_gain(const std::string& input_name) const {
    std::lock_guard<std::mutex> lock(mixer_mutex_);
    auto it = inputs_.find(input_name);
    if (it == inputs_.end()) {
        return std::nullopt;
    }
    return it->second.gain;
}

std::vector<std::string> AudioMixer::input_names() const {
    std::lock_guard<std::mutex> lock(mixer_mutex_);
    std::vector<std::string> names;
    names.reserve(inputs_.size());
    for (const auto& entry : inputs_) {
        names.push_back(entry.first);
    }
    return names;
}

std::size_t AudioMixer::connect_from_registry(const utils::BufferRegistry& registry,
                                              const std::vector<MixerInputConfig>& inputs) {
    std::size_t connected = 0;
    for (const auto& input : inputs) {
        if (!input.enabled) {
            LOG_CPP_DEBUG("[AudioMixer:%s] Skipping disabled input '%s'.", name_.c_str(), input.name.c_str());
            continue;
        }
        auto buffer = registry.get(input.buffer_name);
        if (!buffer) {
            LOG_CPP_WARNING("[AudioMixer:%s] Buffer '%s' for input '%s' not found in registry.",
                            name_.c_str(), input.buffer_name.c_str(), input.name.c_str());
            continue;
        }
        if (connect_input(input.name, std::move(buffer), input.gain)) {
            ++connected;
        }
    }
    return connected;
}

MixerParams AudioMixer::params() const {
    std::lock_guard<std::mutex> lock(mixer_mutex_);
    return params_;
}

bool AudioMixer::has_private_inputs() const {
    std::lock_guard<std::mutex> lock(mixer_mutex_);
    return !inputs_.empty();
}

bool AudioMixer::update_config(const SettingsMap& patch) {
    bool ok = true;
    std::lock_guard<std::mutex> lock(mixer_mutex_);

    for (const auto& entry : patch) {
        if (!starts_with(entry.first, kGainPrefix)) {
            continue;
        }
        const std::string input_name = entry.first.substr(kGainPrefix.size());
        auto value = utils::parse_float(patch, entry.first);
        auto it = inputs_.find(input_name);
        if (!value) {
            LOG_CPP_WARNING("[AudioMixer:%s] Invalid gain '%s' for input '%s'.",
                            name_.c_str(), entry.second.c_str(), input_name.c_str());
            ok = false;
        } else if (it == inputs_.end()) {
            LOG_CPP_WARNING("[AudioMixer:%s] Gain update for unknown input '%s' ignored.",
                            name_.c_str(), input_name.c_str());
        } else {
            it->second.gain = clamp_gain(*value);
        }
    }

    MixerParams updated = params_;
    if (patch.count("output_sample_rate")) {
        auto value = utils::parse_int(patch, "output_sample_rate");
        if (value && valid_format(*value, updated.output_channels)) {
            updated.output_sample_rate = static_cast<int>(*value);
        } else {
            LOG_CPP_WARNING("[AudioMixer:%s] Invalid output_sample_rate '%s'.",
                            name_.c_str(), patch.at("output_sample_rate").c_str());
            ok = false;
        }
    }
    if (patch.count("output_channels")) {
        auto value = utils::parse_int(patch, "output_channels");
        if (value && valid_format(updated.output_sample_rate, *value)) {
            updated.output_channels = static_cast<int>(*value);
        } else {
            LOG_CPP_WARNING("[AudioMixer:%s] Invalid output_channels '%s'.",
                            name_.c_str(), patch.at("output_channels").c_str());
            ok = false;
        }
    }
    if (patch.count("master_gain")) {
        auto value = utils::parse_float(patch, "master_gain");
        if (value && std::isfinite(*value) && *value >= 0.0f) {
            updated.master_gain = *value;
        } else {
            LOG_CPP_WARNING("[AudioMixer:%s] Invalid master_gain '%s'.",
                            name_.c_str(), patch.at("master_gain").c_str());
            ok = false;
        }
    }
    params_ = updated;
    return ok;
}

bool AudioMixer::process_frames(utils::AudioRingBuffer& input,
                                utils::AudioRingBuffer& output,
                                std::size_t& frames_emitted) {
    (void)input;
    std::lock_guard<std::mutex> lock(mixer_mutex_);

    const std::size_t quantum = quantum_samples(params_.output_sample_rate, params_.output_channels);
    accumulator_.assign(quantum, 0);

    bool any_input = false;
    for (auto& entry : inputs_) {
        auto frame = entry.second.buffer->pop(entry.second.reader);
        if (!frame) {
            continue;
        }
        any_input = true;
        const float gain = entry.second.gain;
        const std::size_t count = std::min(frame->samples.size(), quantum);
        for (std::size_t i = 0; i < count; ++i) {
            const int16_t scaled = clamp_sample(static_cast<float>(frame->samples[i]) * gain);
            accumulator_[i] = clamp_sample(accumulator_[i] + static_cast<int32_t>(scaled));
        }
    }

    if (!any_input) {
        return true;
    }

    Frame mixed;
    mixed.captured_at_ns = utc_ns_now();
    mixed.sample_rate = params_.output_sample_rate;
    mixed.channels = params_.output_channels;
    mixed.samples.resize(quantum);
    const float master_gain = params_.master_gain;
    for (std::size_t i = 0; i < quantum; ++i) {
        mixed.samples[i] = clamp_sample(static_cast<float>(accumulator_[i]) * master_gain);
    }
    output.push(std::move(mixed));
    ++frames_emitted;
    return true;
}

} // namespace audio
} // namespace airlift
