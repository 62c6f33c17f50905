#pragma once

#include "audio_producer.h"
#include "../utils/sample_fifo.h"

#include <string>
#include <vector>

#include <alsa/asoundlib.h>

namespace airlift {
namespace audio {

struct AlsaCaptureParams {
    std::string device = "default";
    unsigned int sample_rate = DEFAULT_SAMPLE_RATE;
    unsigned int channels = DEFAULT_CHANNELS;
    unsigned long period_frames = 1024;
    /** @brief 0 selects four periods. */
    unsigned long buffer_frames = 0;
};

/**
 * @class AlsaCaptureProducer
 * @brief Captures S16_LE interleaved audio from an ALSA PCM device.
 * @details Device periods are re-chunked into 100 ms Frames. X-runs are recovered
 *          with `snd_pcm_recover`; unrecoverable errors degrade the producer to silence.
 */
class AlsaCaptureProducer : public AudioProducer {
public:
    AlsaCaptureProducer(std::string name, AlsaCaptureParams params, std::shared_ptr<NodeSettings> settings);
    ~AlsaCaptureProducer() noexcept override;

    std::string type() const override { return "alsa"; }

protected:
    bool open_source() override;
    CaptureResult capture_frame(Frame& out) override;
    void close_source() override;

private:
    bool recover_from_error(int err);

    AlsaCaptureParams params_;

    snd_pcm_t* pcm_handle_ = nullptr;
    unsigned int active_sample_rate_ = DEFAULT_SAMPLE_RATE;
    unsigned int active_channels_ = DEFAULT_CHANNELS;
    snd_pcm_uframes_t period_frames_ = 0;
    snd_pcm_uframes_t buffer_frames_ = 0;
    std::size_t quantum_samples_ = 0;

    std::vector<int16_t> period_buffer_;
    utils::SampleFifo chunk_fifo_;
};

} // namespace audio
} // namespace airlift
