/**
 * @file basic_processors.h
 * @brief Stateless single-input processors: pass-through and gain.
 */
#ifndef AIRLIFT_BASIC_PROCESSORS_H
#define AIRLIFT_BASIC_PROCESSORS_H

#include "audio_processor.h"

namespace airlift {
namespace audio {

/**
 * @class PassThroughProcessor
 * @brief Moves Frames from input to output unchanged.
 */
class PassThroughProcessor : public AudioProcessor {
public:
    explicit PassThroughProcessor(std::string name) : AudioProcessor(std::move(name)) {}

    bool update_config(const SettingsMap& patch) override;
    std::string type() const override { return "passthrough"; }

protected:
    bool process_frames(utils::AudioRingBuffer& input,
                        utils::AudioRingBuffer& output,
                        std::size_t& frames_emitted) override;
};

/**
 * @class GainProcessor
 * @brief Multiplies every sample by a non-negative factor, saturating to int16.
 * @details Recognized config key: `gain`.
 */
class GainProcessor : public AudioProcessor {
public:
    GainProcessor(std::string name, float gain);

    bool update_config(const SettingsMap& patch) override;
    std::string type() const override { return "gain"; }

    float gain() const { return gain_.load(); }

    /** @return false if `gain` is negative or not finite. */
    bool set_gain(float gain);

protected:
    bool process_frames(utils::AudioRingBuffer& input,
                        utils::AudioRingBuffer& output,
                        std::size_t& frames_emitted) override;

private:
    std::atomic<float> gain_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_BASIC_PROCESSORS_H
