/**
 * @file audio_producer.h
 * @brief Defines the AudioProducer base class for components that originate Frames.
 * @details A producer owns one capture thread that pulls audio from an external
 *          source and pushes it into the ring buffer attached before `start()`.
 *          When the source cannot be reached the producer keeps running and emits
 *          silent 100 ms Frames so that downstream stages keep their cadence.
 */
#ifndef AIRLIFT_AUDIO_PRODUCER_H
#define AIRLIFT_AUDIO_PRODUCER_H

#include <atomic>
#include <chrono>
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
 * @enum CaptureResult
 * @brief Outcome of one `capture_frame` call.
 */
enum class CaptureResult {
    FrameReady, ///< `out` holds a Frame to publish.
    NoData,     ///< Nothing this round; the loop calls again.
    Failed,     ///< The source broke; the producer degrades to silence.
    Exhausted   ///< The source ended normally; the producer degrades to silence.
};

/**
 * @class AudioProducer
 * @brief Abstract base class for all Frame producers.
 * @details Derived classes implement `open_source`, `capture_frame` and
 *          `close_source`. The base runs the capture loop, validates Frames,
 *          updates counters and handles the silence fallback. Derived destructors
 *          must call `stop()`.
 */
class AudioProducer : public AudioComponent {
public:
    ~AudioProducer() override = default;

    /**
     * @brief Attaches the ring buffer this producer writes to.
     * @details Must be called once before `start()`.
     * @return false if the producer is running, a buffer is already attached or `buffer` is null.
     */
    bool attach_output_buffer(std::shared_ptr<utils::AudioRingBuffer> buffer);

    /** @brief The attached output buffer, or nullptr. */
    std::shared_ptr<utils::AudioRingBuffer> output_buffer() const;

    /**
     * @brief Spawns the capture loop. Calling it while running is a no-op success.
     * @return false if no output buffer is attached or the thread could not start.
     */
    bool start() override;

    /** @brief Requests loop termination and blocks until the capture thread exits. */
    void stop() override;

    ProducerStatus status() const;

    /** @brief The component type identifier, e.g. "sine". */
    virtual std::string type() const = 0;

protected:
    AudioProducer(std::string name, std::shared_ptr<NodeSettings> settings);

    /**
     * @brief Opens the external source.
     * @return false if the source is unreachable.
     */
    virtual bool open_source() = 0;

    /**
     * @brief Produces the next Frame. May block, but must return promptly once
     *        `stop_flag_` is set.
     */
    virtual CaptureResult capture_frame(Frame& out) = 0;

    /** @brief Releases the external source. Called from the capture thread. */
    virtual void close_source() = 0;

    /**
     * @brief Sleeps until `deadline` or a stop request.
     * @return false if the producer was asked to stop.
     */
    bool sleep_until(std::chrono::steady_clock::time_point deadline);

    void run() override;

    std::shared_ptr<NodeSettings> settings_;

private:
    bool publish(Frame frame);
    void run_silence_fallback();

    mutable std::mutex buffer_mutex_;
    std::shared_ptr<utils::AudioRingBuffer> output_buffer_;

    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> samples_processed_{0};
    std::atomic<uint64_t> errors_{0};

    // Format of the silence emitted after a failure; updated by every published Frame.
    int fallback_sample_rate_;
    int fallback_channels_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_PRODUCER_H
