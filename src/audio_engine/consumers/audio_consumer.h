/**
 * @file audio_consumer.h
 * @brief Defines the AudioConsumer base class for components that drain Frames to a sink.
 */
#ifndef AIRLIFT_AUDIO_CONSUMER_H
#define AIRLIFT_AUDIO_CONSUMER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "../audio_types.h"
#include "../configuration/node_settings.h"
#include "../utils/audio_component.h"
#include "../utils/audio_ring_buffer.h"

namespace airlift {
namespace audio {

/**
 * @class AudioConsumer
 * @brief Abstract base class for Frame consumers.
 * @details The drain loop polls the attached input buffer and hands each Frame
 *          to `write_frame`. Empty polls are not errors; the loop sleeps for
 *          `consumer_poll_ms` and retries. A failed write is counted and the loop
 *          continues. Derived destructors must call `stop()`.
 */
class AudioConsumer : public AudioComponent {
public:
    ~AudioConsumer() override = default;

    /**
     * @brief Attaches the buffer this consumer drains.
     * @return false if the consumer is running or `buffer` is null.
     */
    bool attach_input_buffer(std::shared_ptr<utils::AudioRingBuffer> buffer);

    std::shared_ptr<utils::AudioRingBuffer> input_buffer() const;

    /**
     * @brief Opens the sink and spawns the drain loop. A no-op success when running.
     * @return false if no buffer is attached, the sink cannot be opened or the thread fails.
     */
    bool start() override;

    /**
     * @brief Stops the drain loop, writes any Frames still queued and closes the sink.
     */
    void stop() override;

    ConsumerStatus status() const;

    /** @brief The component type identifier, e.g. "wav_file". */
    virtual std::string type() const = 0;

protected:
    AudioConsumer(std::string name, std::shared_ptr<NodeSettings> settings);

    virtual bool open_sink() = 0;

    /**
     * @brief Writes one Frame to the sink.
     * @param bytes_written Receives the number of bytes delivered.
     * @return false on a write failure.
     */
    virtual bool write_frame(const Frame& frame, std::size_t& bytes_written) = 0;

    virtual void close_sink() = 0;

    void run() override;

    std::shared_ptr<NodeSettings> settings_;

private:
    void consume(const Frame& frame);

    mutable std::mutex buffer_mutex_;
    std::shared_ptr<utils::AudioRingBuffer> input_buffer_;

    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> frames_processed_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_CONSUMER_H
