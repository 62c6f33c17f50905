#include "audio_ring_buffer.h"

#include "cpp_logger.h"

#include <algorithm>

namespace airlift {
namespace audio {
namespace utils {

AudioRingBuffer::AudioRingBuffer(std::size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

std::size_t AudioRingBuffer::push(Frame frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.size() >= capacity_) {
        frames_.pop_front();
        for (auto& entry : readers_) {
            if (entry.second.next_seq <= head_seq_) {
                entry.second.next_seq = head_seq_ + 1;
                ++entry.second.missed;
            }
        }
        ++head_seq_;
        ++dropped_frames_;
    }
    frames_.push_back(std::move(frame));
    return frames_.size();
}

std::optional<Frame> AudioRingBuffer::pop() {
    return pop(kDefaultReader);
}

std::optional<Frame> AudioRingBuffer::pop(ReaderId reader) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReaderState* state = find_reader_locked(reader);
    if (!state) {
        if (reader != kDefaultReader) {
            return std::nullopt;
        }
        state = &readers_.emplace(kDefaultReader, ReaderState{"default", head_seq_, 0}).first->second;
    }

    const uint64_t offset = state->next_seq - head_seq_;
    if (offset >= frames_.size()) {
        return std::nullopt;
    }
    ++state->next_seq;

    // The sole remaining reader of the front Frame takes it without a copy.
    const bool last_reader_of_front = offset == 0 &&
        std::none_of(readers_.begin(), readers_.end(),
                     [this](const auto& entry) { return entry.second.next_seq <= head_seq_; });
    if (last_reader_of_front) {
        Frame frame = std::move(frames_.front());
        frames_.pop_front();
        ++head_seq_;
        release_read_frames_locked();
        return frame;
    }
    return frames_[static_cast<std::size_t>(offset)];
}

AudioRingBuffer::ReaderId AudioRingBuffer::add_reader(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    const ReaderId id = next_reader_id_++;
    readers_.emplace(id, ReaderState{label, head_seq_, 0});
    LOG_CPP_DEBUG("[AudioRingBuffer] Reader '%s' registered (%zu readers).", label.c_str(), readers_.size());
    return id;
}

bool AudioRingBuffer::remove_reader(ReaderId reader) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = readers_.find(reader);
    if (it == readers_.end()) {
        return false;
    }
    LOG_CPP_DEBUG("[AudioRingBuffer] Reader '%s' removed.", it->second.label.c_str());
    readers_.erase(it);
    release_read_frames_locked();
    return true;
}

std::size_t AudioRingBuffer::available(ReaderId reader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ReaderState* state = find_reader_locked(reader);
    if (!state) {
        return reader == kDefaultReader ? frames_.size() : 0;
    }
    return unread_locked(*state);
}

std::size_t AudioRingBuffer::reader_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readers_.size();
}

RingBufferStats AudioRingBuffer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RingBufferStats stats;
    stats.capacity = capacity_;
    stats.current_depth = frames_.size();
    stats.dropped_frames = dropped_frames_;
    if (!frames_.empty()) {
        stats.oldest_timestamp_ns = frames_.front().captured_at_ns;
        stats.newest_timestamp_ns = frames_.back().captured_at_ns;
    }
    return stats;
}

RingBufferStats AudioRingBuffer::stats(ReaderId reader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    RingBufferStats stats;
    stats.capacity = capacity_;
    const ReaderState* state = find_reader_locked(reader);
    if (!state) {
        return stats;
    }
    stats.current_depth = unread_locked(*state);
    stats.dropped_frames = state->missed;
    if (stats.current_depth > 0) {
        stats.oldest_timestamp_ns = frames_[static_cast<std::size_t>(state->next_seq - head_seq_)].captured_at_ns;
        stats.newest_timestamp_ns = frames_.back().captured_at_ns;
    }
    return stats;
}

std::size_t AudioRingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

bool AudioRingBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.empty();
}

uint64_t AudioRingBuffer::dropped_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_frames_;
}

void AudioRingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    head_seq_ += frames_.size();
    frames_.clear();
    for (auto& entry : readers_) {
        entry.second.next_seq = std::max(entry.second.next_seq, head_seq_);
    }
}

AudioRingBuffer::ReaderState* AudioRingBuffer::find_reader_locked(ReaderId reader) {
    auto it = readers_.find(reader);
    return it != readers_.end() ? &it->second : nullptr;
}

const AudioRingBuffer::ReaderState* AudioRingBuffer::find_reader_locked(ReaderId reader) const {
    auto it = readers_.find(reader);
    return it != readers_.end() ? &it->second : nullptr;
}

std::size_t AudioRingBuffer::unread_locked(const ReaderState& state) const {
    return frames_.size() - static_cast<std::size_t>(state.next_seq - head_seq_);
}

void AudioRingBuffer::release_read_frames_locked() {
    if (readers_.empty()) {
        return;
    }
    uint64_t slowest = readers_.begin()->second.next_seq;
    for (const auto& entry : readers_) {
        slowest = std::min(slowest, entry.second.next_seq);
    }
    while (!frames_.empty() && head_seq_ < slowest) {
        frames_.pop_front();
        ++head_seq_;
    }
}

} // namespace utils
} // namespace audio
} // namespace airlift
