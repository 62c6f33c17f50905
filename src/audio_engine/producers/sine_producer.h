/**
 * @file sine_producer.h
 * @brief A test-tone producer emitting a continuous sine wave.
 */
#ifndef AIRLIFT_SINE_PRODUCER_H
#define AIRLIFT_SINE_PRODUCER_H

#include "audio_producer.h"

namespace airlift {
namespace audio {

struct SineParams {
    double frequency = 440.0;
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;
    /** @brief Peak level as a fraction of full scale. */
    double amplitude = 0.2;
};

/**
 * @class SineProducer
 * @brief Generates 100 ms Frames of a sine tone, paced by the steady clock.
 */
class SineProducer : public AudioProducer {
public:
    SineProducer(std::string name, SineParams params, std::shared_ptr<NodeSettings> settings);
    ~SineProducer() noexcept override;

    std::string type() const override { return "sine"; }

protected:
    bool open_source() override;
    CaptureResult capture_frame(Frame& out) override;
    void close_source() override {}

private:
    SineParams params_;
    double phase_ = 0.0;
    std::chrono::steady_clock::time_point next_deadline_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_SINE_PRODUCER_H
