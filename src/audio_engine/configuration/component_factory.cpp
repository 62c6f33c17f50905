#include "component_factory.h"

#include "../consumers/mp3_file_consumer.h"
#include "../consumers/udp_stream_consumer.h"
#include "../consumers/wav_file_consumer.h"
#include "../processors/audio_mixer.h"
#include "../processors/basic_processors.h"
#include "../producers/alsa_capture_producer.h"
#include "../producers/sine_producer.h"
#include "../producers/wav_file_producer.h"
#include "../utils/cpp_logger.h"

namespace airlift {
namespace config {

using audio::utils::get_bool;
using audio::utils::get_float;
using audio::utils::get_int;
using audio::utils::get_int_in_range;
using audio::utils::get_string;

namespace {
const char* const kCodecPcm = "pcm_s16le";
const char* const kCodecMp3 = "mp3";

constexpr long kMaxSampleRate = 768000;
constexpr long kMaxPortNumber = 65535;
constexpr long kMaxAlsaFrames = 1L << 20;

// Integer settings are narrowed only after they are known to fit.
long bounded_setting(const std::string& owner, const SettingsMap& s, const std::string& key,
                     long fallback, long min_value, long max_value) {
    auto parsed = audio::utils::parse_int(s, key);
    if (parsed && (*parsed < min_value || *parsed > max_value)) {
        LOG_CPP_WARNING("[ComponentFactory] '%s': %s=%ld outside [%ld, %ld]; using %ld.",
                        owner.c_str(), key.c_str(), *parsed, min_value, max_value, fallback);
    }
    return get_int_in_range(s, key, fallback, min_value, max_value);
}

int sample_rate_setting(const std::string& owner, const SettingsMap& s, const std::string& key, int fallback) {
    return static_cast<int>(bounded_setting(owner, s, key, fallback, 1, kMaxSampleRate));
}

int channels_setting(const std::string& owner, const SettingsMap& s, const std::string& key, int fallback) {
    return static_cast<int>(bounded_setting(owner, s, key, fallback, 1, audio::MAX_CHANNELS));
}
}

bool DefaultComponentFactory::supports_input_type(const std::string& type) const {
    return type == "sine" || type == "wav_file" || type == "alsa";
}

bool DefaultComponentFactory::supports_processor_type(const std::string& type) const {
    return type == "passthrough" || type == "gain" || type == "mixer";
}

bool DefaultComponentFactory::supports_output_type(const std::string& type) const {
    return type == "wav_file" || type == "mp3_file" || type == "udp";
}

bool DefaultComponentFactory::supports_service_type(const std::string& type) const {
    return type == "buffer_monitor";
}

bool DefaultComponentFactory::supports_codec(const std::string& output_type, const std::string& codec_id) const {
    if (output_type == "wav_file" || output_type == "udp") {
        return codec_id == kCodecPcm;
    }
    if (output_type == "mp3_file") {
        return codec_id == kCodecMp3;
    }
    return false;
}

std::unique_ptr<audio::AudioProducer> DefaultComponentFactory::create_producer(
    const std::string& name,
    const InputConfig& config,
    std::shared_ptr<audio::NodeSettings> settings) {
    const SettingsMap& s = config.settings;

    if (config.type == "sine") {
        audio::SineParams params;
        params.frequency = get_float(s, "frequency", static_cast<float>(params.frequency));
        params.sample_rate = sample_rate_setting(name, s, "sample_rate", params.sample_rate);
        params.channels = channels_setting(name, s, "channels", params.channels);
        params.amplitude = get_float(s, "amplitude", static_cast<float>(params.amplitude));
        return std::make_unique<audio::SineProducer>(name, params, std::move(settings));
    }
    if (config.type == "wav_file") {
        audio::WavFileParams params;
        params.path = get_string(s, "path", "");
        params.loop = get_bool(s, "loop", false);
        return std::make_unique<audio::WavFileProducer>(name, std::move(params), std::move(settings));
    }
    if (config.type == "alsa") {
        audio::AlsaCaptureParams params;
        params.device = get_string(s, "device", params.device);
        params.sample_rate = static_cast<unsigned int>(
            sample_rate_setting(name, s, "sample_rate", static_cast<int>(params.sample_rate)));
        params.channels = static_cast<unsigned int>(
            channels_setting(name, s, "channels", static_cast<int>(params.channels)));
        params.period_frames = static_cast<unsigned long>(bounded_setting(
            name, s, "period_frames", static_cast<long>(params.period_frames), 1, kMaxAlsaFrames));
        params.buffer_frames = static_cast<unsigned long>(bounded_setting(
            name, s, "buffer_frames", static_cast<long>(params.buffer_frames), 0, kMaxAlsaFrames));
        return std::make_unique<audio::AlsaCaptureProducer>(name, std::move(params), std::move(settings));
    }
    LOG_CPP_ERROR("[ComponentFactory] Unknown input type '%s' for '%s'.", config.type.c_str(), name.c_str());
    return nullptr;
}

std::unique_ptr<audio::AudioProcessor> DefaultComponentFactory::create_processor(
    const std::string& name,
    const ProcessorConfig& config,
    const audio::utils::BufferRegistry& registry) {
    const SettingsMap& s = config.settings;

    if (config.type == "passthrough") {
        return std::make_unique<audio::PassThroughProcessor>(name);
    }
    if (config.type == "gain") {
        return std::make_unique<audio::GainProcessor>(name, get_float(s, "gain", 1.0f));
    }
    if (config.type == "mixer") {
        audio::MixerParams params;
        params.output_sample_rate = sample_rate_setting(name, s, "output_sample_rate", params.output_sample_rate);
        params.output_channels = channels_setting(name, s, "output_channels", params.output_channels);
        params.master_gain = get_float(s, "master_gain", params.master_gain);
        auto mixer = std::make_unique<audio::AudioMixer>(name, params);
        const auto inputs = audio::parse_mixer_inputs(s);
        const std::size_t connected = mixer->connect_from_registry(registry, inputs);
        LOG_CPP_DEBUG("[ComponentFactory] Mixer '%s' connected %zu of %zu inputs.", name.c_str(), connected, inputs.size());
        return mixer;
    }
    LOG_CPP_ERROR("[ComponentFactory] Unknown processor type '%s' for '%s'.", config.type.c_str(), name.c_str());
    return nullptr;
}

std::unique_ptr<audio::AudioConsumer> DefaultComponentFactory::create_consumer(
    const std::string& name,
    const OutputConfig& config,
    std::shared_ptr<audio::NodeSettings> settings) {
    const SettingsMap& s = config.settings;

    if (config.type == "wav_file") {
        audio::WavFileConsumerParams params;
        params.path = get_string(s, "path", "");
        params.sample_rate = sample_rate_setting(name, s, "sample_rate", params.sample_rate);
        params.channels = channels_setting(name, s, "channels", params.channels);
        return std::make_unique<audio::WavFileConsumer>(name, std::move(params), std::move(settings));
    }
    if (config.type == "mp3_file") {
        audio::Mp3FileConsumerParams params;
        params.path = get_string(s, "path", "");
        params.sample_rate = sample_rate_setting(name, s, "sample_rate", params.sample_rate);
        params.channels = channels_setting(name, s, "channels", params.channels);
        return std::make_unique<audio::Mp3FileConsumer>(name, std::move(params), std::move(settings));
    }
    if (config.type == "udp") {
        audio::UdpStreamParams params;
        params.host = get_string(s, "host", params.host);
        params.port = static_cast<int>(bounded_setting(name, s, "port", params.port, 0, kMaxPortNumber));
        return std::make_unique<audio::UdpStreamConsumer>(name, std::move(params), std::move(settings));
    }
    LOG_CPP_ERROR("[ComponentFactory] Unknown output type '%s' for '%s'.", config.type.c_str(), name.c_str());
    return nullptr;
}

std::unique_ptr<audio::NodeService> DefaultComponentFactory::create_service(
    const std::string& name,
    const ServiceConfig& config,
    const std::string& buffer_name,
    std::shared_ptr<audio::utils::AudioRingBuffer> buffer,
    std::shared_ptr<audio::NodeSettings> settings) {
    if (config.type == "buffer_monitor") {
        if (!buffer) {
            LOG_CPP_ERROR("[ComponentFactory] Service '%s' has no buffer to monitor.", name.c_str());
            return nullptr;
        }
        const long interval_ms = get_int(config.settings, "interval_ms", audio::resolve_monitor_interval_ms(settings));
        return std::make_unique<audio::BufferMonitorService>(name, buffer_name, std::move(buffer), interval_ms);
    }
    LOG_CPP_ERROR("[ComponentFactory] Unknown service type '%s' for '%s'.", config.type.c_str(), name.c_str());
    return nullptr;
}

} // namespace config
} // namespace airlift
