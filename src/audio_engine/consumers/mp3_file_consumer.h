/**
 * @file mp3_file_consumer.h
 * @brief Encodes Frames to an MP3 file with LAME.
 */
#ifndef AIRLIFT_MP3_FILE_CONSUMER_H
#define AIRLIFT_MP3_FILE_CONSUMER_H

#include <fstream>
#include <lame/lame.h>

#include "audio_consumer.h"

namespace airlift {
namespace audio {

struct Mp3FileConsumerParams {
    std::string path;
    /** @brief Encoder input format. Frames in any other format are rejected. */
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;
};

/**
 * @class Mp3FileConsumer
 * @brief Writes LAME-encoded MP3 to a file, flushing the encoder on stop.
 * @details Bitrate, VBR and algorithm quality come from `NodeSettings::mp3_tuning`.
 */
class Mp3FileConsumer : public AudioConsumer {
public:
    Mp3FileConsumer(std::string name, Mp3FileConsumerParams params, std::shared_ptr<NodeSettings> settings);
    ~Mp3FileConsumer() noexcept override;

    std::string type() const override { return "mp3_file"; }

protected:
    bool open_sink() override;
    bool write_frame(const Frame& frame, std::size_t& bytes_written) override;
    void close_sink() override;

private:
    bool initialize_lame();
    void release_lame();

    Mp3FileConsumerParams params_;
    Mp3Tuning tuning_;
    lame_t lame_flags_ = nullptr;
    std::ofstream file_;
    std::vector<unsigned char> encode_buffer_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_MP3_FILE_CONSUMER_H
