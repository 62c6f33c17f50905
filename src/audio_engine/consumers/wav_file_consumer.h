/**
 * @file wav_file_consumer.h
 * @brief Records Frames to a canonical 16-bit PCM WAV file.
 */
#ifndef AIRLIFT_WAV_FILE_CONSUMER_H
#define AIRLIFT_WAV_FILE_CONSUMER_H

#include <array>
#include <fstream>

#include "audio_consumer.h"

namespace airlift {
namespace audio {

inline constexpr std::size_t kWavHeaderSize = 44;

struct WavFileConsumerParams {
    std::string path;
    /** @brief Header format used until the first Frame arrives. */
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;
};

/**
 * @brief Builds the 44-byte RIFF/WAVE header for linear PCM.
 * @param data_bytes Size of the sample data region.
 */
std::array<uint8_t, kWavHeaderSize> build_wav_header(int sample_rate, int channels, uint32_t data_bytes);

/**
 * @class WavFileConsumer
 * @brief Streams Frames into a WAV file and finalizes the header sizes on stop.
 * @details The header format follows the first Frame written. Frames whose
 *          format differs from it are rejected as write errors.
 */
class WavFileConsumer : public AudioConsumer {
public:
    WavFileConsumer(std::string name, WavFileConsumerParams params, std::shared_ptr<NodeSettings> settings);
    ~WavFileConsumer() noexcept override;

    std::string type() const override { return "wav_file"; }

protected:
    bool open_sink() override;
    bool write_frame(const Frame& frame, std::size_t& bytes_written) override;
    void close_sink() override;

private:
    bool write_header(uint32_t data_bytes);

    WavFileConsumerParams params_;
    std::ofstream file_;
    int sample_rate_ = DEFAULT_SAMPLE_RATE;
    int channels_ = DEFAULT_CHANNELS;
    bool format_locked_ = false;
    uint32_t data_bytes_ = 0;
    std::vector<uint8_t> write_buffer_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_WAV_FILE_CONSUMER_H
