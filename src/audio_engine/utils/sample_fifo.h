#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace airlift {
namespace audio {
namespace utils {

/**
 * Growable single-threaded FIFO of int16 samples. Capture loops append
 * whatever period size the device delivers and pop fixed-size quanta.
 */
class SampleFifo {
public:
    SampleFifo() = default;

    bool empty() const { return size_ == 0; }
    std::size_t size() const { return size_; }

    void reserve(std::size_t capacity) { grow_to(capacity); }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    void append(const int16_t* samples, std::size_t count) {
        if (!samples || count == 0) {
            return;
        }
        grow_to(size_ + count);
        const std::size_t cap = storage_.size();
        const std::size_t tail = (head_ + size_) % cap;
        const std::size_t first = std::min(count, cap - tail);
        std::memcpy(storage_.data() + tail, samples, first * sizeof(int16_t));
        if (count > first) {
            std::memcpy(storage_.data(), samples + first, (count - first) * sizeof(int16_t));
        }
        size_ += count;
    }

    // Pops exactly `count` samples into `out`, or nothing if fewer are queued.
    bool pop_exact(std::vector<int16_t>& out, std::size_t count) {
        if (count == 0 || size_ < count) {
            return false;
        }
        out.resize(count);
        const std::size_t cap = storage_.size();
        const std::size_t first = std::min(count, cap - head_);
        std::memcpy(out.data(), storage_.data() + head_, first * sizeof(int16_t));
        if (count > first) {
            std::memcpy(out.data() + first, storage_.data(), (count - first) * sizeof(int16_t));
        }
        head_ = (head_ + count) % cap;
        size_ -= count;
        return true;
    }

private:
    void grow_to(std::size_t capacity) {
        if (capacity <= storage_.size()) {
            return;
        }
        std::size_t new_capacity = storage_.empty() ? capacity : storage_.size();
        while (new_capacity < capacity) {
            new_capacity *= 2;
        }
        std::vector<int16_t> grown(new_capacity);
        if (size_ > 0) {
            const std::size_t first = std::min(size_, storage_.size() - head_);
            std::memcpy(grown.data(), storage_.data() + head_, first * sizeof(int16_t));
            if (size_ > first) {
                std::memcpy(grown.data() + first, storage_.data(), (size_ - first) * sizeof(int16_t));
            }
        }
        storage_.swap(grown);
        head_ = 0;
    }

    std::vector<int16_t> storage_;
    std::size_t head_ = 0;
    std::size_t size_ = 0;
};

} // namespace utils
} // namespace audio
} // namespace airlift
