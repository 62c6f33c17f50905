/**
 * @file wav_file_producer.h
 * @brief Plays a 16-bit PCM WAV file into the pipeline in real time.
 */
#ifndef AIRLIFT_WAV_FILE_PRODUCER_H
#define AIRLIFT_WAV_FILE_PRODUCER_H

#include <fstream>

#include "audio_producer.h"

namespace airlift {
namespace audio {

struct WavFileParams {
    std::string path;
    /** @brief Rewind at end of file instead of falling back to silence. */
    bool loop = false;
};

/**
 * @struct WavFormat
 * @brief The parts of a RIFF/WAVE header the producer needs.
 */
struct WavFormat {
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;
    std::streamoff data_offset = 0;
    uint32_t data_size = 0;
};

/**
 * @brief Parses the RIFF chunk list of an open WAV stream.
 * @param stream The stream, positioned anywhere.
 * @param out Filled on success.
 * @param error Receives a description on failure.
 * @return true if the file is linear PCM with 16-bit samples and a data chunk.
 */
bool parse_wav_header(std::istream& stream, WavFormat& out, std::string& error);

/**
 * @class WavFileProducer
 * @brief Emits 100 ms Frames read from a WAV file, paced by the steady clock.
 */
class WavFileProducer : public AudioProducer {
public:
    WavFileProducer(std::string name, WavFileParams params, std::shared_ptr<NodeSettings> settings);
    ~WavFileProducer() noexcept override;

    std::string type() const override { return "wav_file"; }

protected:
    bool open_source() override;
    CaptureResult capture_frame(Frame& out) override;
    void close_source() override;

private:
    bool rewind();

    WavFileParams params_;
    std::ifstream file_;
    WavFormat format_;
    uint32_t data_remaining_ = 0;
    std::vector<char> read_buffer_;
    std::chrono::steady_clock::time_point next_deadline_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_WAV_FILE_PRODUCER_H
