/**
 * @file audio_ring_buffer.h
 * @brief Bounded, thread-shared FIFO of Frames with drop-oldest overflow.
 * @details `AudioRingBuffer` is the only channel between pipeline stages. It is
 *          written by exactly one thread and read by one or more threads. Every
 *          operation runs inside a single mutex region and none of them block
 *          waiting for data or space.
 *
 *          Each reader owns a read position, so several readers of the same
 *          buffer each see every Frame. A Frame is released once every
 *          registered reader has read it, or when capacity pressure evicts it.
 *          Readers that never register share the default position used by
 *          `pop()`.
 */
#ifndef AIRLIFT_AUDIO_RING_BUFFER_H
#define AIRLIFT_AUDIO_RING_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../audio_types.h"

namespace airlift {
namespace audio {
namespace utils {

/**
 * @class AudioRingBuffer
 * @brief A bounded Frame queue that evicts its oldest element when full.
 * @details Shared by `std::shared_ptr` between its writer and readers and never
 *          copied. `push` never fails: under capacity pressure the oldest Frame is
 *          discarded and `dropped_frames` increments by one per eviction.
 */
class AudioRingBuffer {
public:
    /** @brief Handle of one registered reader. */
    using ReaderId = uint64_t;

    /** @brief The position shared by every caller of `pop()`. Registered on first use. */
    static constexpr ReaderId kDefaultReader = 0;

    /**
     * @brief Constructs an empty buffer.
     * @param capacity Maximum number of Frames held. Values below 1 become 1.
     */
    explicit AudioRingBuffer(std::size_t capacity);

    AudioRingBuffer(const AudioRingBuffer&) = delete;
    AudioRingBuffer& operator=(const AudioRingBuffer&) = delete;
    AudioRingBuffer(AudioRingBuffer&&) = delete;
    AudioRingBuffer& operator=(AudioRingBuffer&&) = delete;

    /**
     * @brief Appends a Frame, evicting the oldest one if the buffer is full.
     * @return The depth after the push.
     */
    std::size_t push(Frame frame);

    /**
     * @brief Removes and returns the oldest Frame for the default reader without blocking.
     * @return The Frame, or `std::nullopt` if nothing is left for the default reader.
     */
    std::optional<Frame> pop();

    /**
     * @brief Returns the next Frame for `reader` and advances its position.
     * @return The Frame, or `std::nullopt` if the reader is caught up or unknown.
     */
    std::optional<Frame> pop(ReaderId reader);

    /**
     * @brief Registers a reader positioned at the oldest retained Frame.
     * @param label Shown in logs only.
     */
    ReaderId add_reader(const std::string& label);

    /**
     * @brief Unregisters a reader. Frames only it was holding are released.
     * @return false if `reader` is not registered.
     */
    bool remove_reader(ReaderId reader);

    /** @brief Number of Frames `reader` has not read yet. */
    std::size_t available(ReaderId reader) const;

    std::size_t reader_count() const;

    /** @brief Snapshot of capacity, depth, drop counter and timestamp range. */
    RingBufferStats stats() const;

    /**
     * @brief The same snapshot as seen by one reader.
     * @details `current_depth` is the reader's unread count and `dropped_frames`
     *          counts Frames evicted before the reader got to them.
     */
    RingBufferStats stats(ReaderId reader) const;

    /** @brief Number of retained Frames, i.e. the backlog of the slowest reader. */
    std::size_t size() const;
    bool empty() const;
    std::size_t capacity() const { return capacity_; }
    uint64_t dropped_frames() const;

    /** @brief Discards all queued Frames. The drop counter is not affected. */
    void clear();

private:
    struct ReaderState {
        std::string label;
        /** @brief Sequence number of the next Frame this reader will get. */
        uint64_t next_seq = 0;
        uint64_t missed = 0;
    };

    ReaderState* find_reader_locked(ReaderId reader);
    const ReaderState* find_reader_locked(ReaderId reader) const;
    std::size_t unread_locked(const ReaderState& state) const;
    void release_read_frames_locked();

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Frame> frames_;
    /** @brief Sequence number of `frames_.front()`. */
    uint64_t head_seq_ = 0;
    uint64_t dropped_frames_ = 0;
    std::map<ReaderId, ReaderState> readers_;
    ReaderId next_reader_id_ = kDefaultReader + 1;
};

} // namespace utils
} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_RING_BUFFER_H
