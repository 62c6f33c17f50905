/**
 * @file audio_mixer.h
 * @brief Defines the AudioMixer, a processor merging several private input buffers.
 * @details Each call pops at most one Frame per connected input, scales it by the
 *          input's gain and accumulates it into one 100 ms output quantum with
 *          saturation to the int16 range. The buffer passed to `process` as input
 *          is ignored. If no input had a Frame, nothing is emitted.
 */
#ifndef AIRLIFT_AUDIO_MIXER_H
#define AIRLIFT_AUDIO_MIXER_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "audio_processor.h"
#include "../utils/buffer_registry.h"

namespace airlift {
namespace audio {

/**
 * @struct MixerInputConfig
 * @brief Declares one mixer input by registry buffer name.
 */
struct MixerInputConfig {
    std::string name;
    std::string buffer_name;
    float gain = 1.0f;
    bool enabled = true;
};

struct MixerParams {
    int output_sample_rate = DEFAULT_SAMPLE_RATE;
    int output_channels = DEFAULT_CHANNELS;
    /** @brief Applied after accumulation. Not clamped to 1.0. */
    float master_gain = 1.0f;
};

/**
 * @brief Extracts mixer inputs from `input.<name>=<buffer>` and `gain.<name>=<g>` settings.
 * @details `enabled.<name>=false` disables an input. Results are ordered by input name.
 */
std::vector<MixerInputConfig> parse_mixer_inputs(const SettingsMap& settings);

/**
 * @class AudioMixer
 * @brief Combines independently fed input buffers into one output Frame per call.
 * @details Input gains are clamped into [0.0, 1.0] on every write. All state is
 *          guarded by one mutex so that configuration changes are safe while the
 *          owning flow is processing.
 */
class AudioMixer : public AudioProcessor {
public:
    AudioMixer(std::string name, MixerParams params);
    ~AudioMixer() override;

    /**
     * @brief Connects or replaces an input.
     * @details The mixer reads `buffer` through its own reader position, leaving
     *          other readers of the same buffer unaffected.
     * @return false if `input_name` is empty or `buffer` is null.
     */
    bool connect_input(const std::string& input_name, std::shared_ptr<utils::AudioRingBuffer> buffer, float gain = 1.0f);

    /** @return false if `input_name` is not connected. */
    bool disconnect_input(const std::string& input_name);

    /**
     * @brief Sets an input gain, clamped into [0.0, 1.0].
     * @return false if `input_name` is not connected.
     */
    bool set_input_gain(const std::string& input_name, float gain);

    std::optional<float> input_gain(const std::string& input_name) const;

    std::vector<std::string> input_names() const;

    /**
     * @brief Connects every enabled input whose buffer is found in `registry`.
     * @return The number of inputs connected.
     */
    std::size_t connect_from_registry(const utils::BufferRegistry& registry,
                                      const std::vector<MixerInputConfig>& inputs);

    MixerParams params() const;

    /**
     * @details Recognized keys: `gain.<input>`, `output_sample_rate`,
     *          `output_channels`, `master_gain`.
     */
    bool update_config(const SettingsMap& patch) override;

    std::string type() const override { return "mixer"; }

    bool has_private_inputs() const override;

protected:
    bool process_frames(utils::AudioRingBuffer& input,
                        utils::AudioRingBuffer& output,
                        std::size_t& frames_emitted) override;

private:
    struct MixerInput {
        std::shared_ptr<utils::AudioRingBuffer> buffer;
        utils::AudioRingBuffer::ReaderId reader = utils::AudioRingBuffer::kDefaultReader;
        float gain = 1.0f;
    };

    mutable std::mutex mixer_mutex_;
    std::map<std::string, MixerInput> inputs_;
    MixerParams params_;
    std::vector<int32_t> accumulator_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_MIXER_H
