/**
 * @file audio_processor.h
 * @brief Defines the AudioProcessor base class for in-flow transforms.
 * @details Processors have no thread of their own. The owning Flow calls
 *          `process(input, output)` once per stage per tick on its own thread.
 *          `update_config` may be called concurrently from any other thread.
 */
#ifndef AIRLIFT_AUDIO_PROCESSOR_H
#define AIRLIFT_AUDIO_PROCESSOR_H

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

#include "../audio_types.h"
#include "../utils/audio_ring_buffer.h"
#include "../utils/settings_map.h"

namespace airlift {
namespace audio {

/**
 * @class AudioProcessor
 * @brief Abstract base for processors. Wraps each call with counters and timing.
 */
class AudioProcessor {
public:
    virtual ~AudioProcessor() = default;

    AudioProcessor(const AudioProcessor&) = delete;
    AudioProcessor& operator=(const AudioProcessor&) = delete;

    /**
     * @brief Drains every Frame currently in `input`, transforms it and pushes the
     *        result to `output` in arrival order.
     * @return false if the transform reported an error or threw.
     */
    bool process(utils::AudioRingBuffer& input, utils::AudioRingBuffer& output);

    /**
     * @brief Applies a partial configuration patch.
     * @details Unrecognized keys are ignored. Safe to call while the owning flow runs.
     * @return false if a recognized key carried an invalid value. Valid keys in the
     *         same patch are still applied.
     */
    virtual bool update_config(const SettingsMap& patch) = 0;

    /** @brief The component type identifier, e.g. "gain". */
    virtual std::string type() const = 0;

    /**
     * @brief True if the processor reads buffers other than the one passed to `process`.
     * @details A flow whose first stage has private inputs runs even without flow inputs.
     */
    virtual bool has_private_inputs() const { return false; }

    ProcessorStatus status() const;

    const std::string& name() const { return name_; }

    /** @brief Mirrors the owning flow's state. Entering the running state resets the rate window. */
    void set_running(bool running);

protected:
    explicit AudioProcessor(std::string name) : name_(std::move(name)) {}

    /**
     * @brief The variant-specific transform.
     * @param frames_emitted Receives the number of Frames pushed to `output`.
     */
    virtual bool process_frames(utils::AudioRingBuffer& input,
                                utils::AudioRingBuffer& output,
                                std::size_t& frames_emitted) = 0;

    std::string name_;

private:
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frames_processed_{0};
    std::atomic<uint64_t> errors_{0};

    mutable std::mutex timing_mutex_;
    std::chrono::steady_clock::time_point running_since_;
    uint64_t frames_at_start_ = 0;
    double latency_estimate_ms_ = 0.0;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_PROCESSOR_H
