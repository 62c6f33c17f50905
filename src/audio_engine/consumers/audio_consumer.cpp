#include "audio_consumer.h"

#include "../utils/cpp_logger.h"

namespace airlift {
namespace audio {

AudioConsumer::AudioConsumer(std::string name, std::shared_ptr<NodeSettings> settings)
    : AudioComponent(std::move(name)), settings_(std::move(settings)) {}

bool AudioConsumer::attach_input_buffer(std::shared_ptr<utils::AudioRingBuffer> buffer) {
    if (!buffer) {
        LOG_CPP_ERROR("[Consumer:%s] Cannot attach a null input buffer.", name_.c_str());
        return false;
    }
    if (is_running()) {
        LOG_CPP_ERROR("[Consumer:%s] Cannot attach an input buffer while running.", name_.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    input_buffer_ = std::move(buffer);
    return true;
}

std::shared_ptr<utils::AudioRingBuffer> AudioConsumer::input_buffer() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return input_buffer_;
}

bool AudioConsumer::start() {
    if (is_running()) {
        return true;
    }
    if (!input_buffer()) {
        LOG_CPP_ERROR("[Consumer:%s] Cannot start without an input buffer.", name_.c_str());
        errors_++;
        return false;
    }
    if (!open_sink()) {
        LOG_CPP_ERROR("[Consumer:%s] Failed to open sink.", name_.c_str());
        errors_++;
        return false;
    }
    connected_ = true;
    if (!launch_thread()) {
        LOG_CPP_ERROR("[Consumer:%s] Failed to launch drain thread.", name_.c_str());
        errors_++;
        connected_ = false;
        close_sink();
        return false;
    }
    LOG_CPP_INFO("[Consumer:%s] Started (%s).", name_.c_str(), type().c_str());
    return true;
}

void AudioConsumer::stop() {
    if (!thread_launched()) {
        return;
    }
    LOG_CPP_INFO("[Consumer:%s] Stopping...", name_.c_str());
    join_thread();

    // Flush the backlog left by the stopped upstream.
    if (auto buffer = input_buffer()) {
        while (auto frame = buffer->pop()) {
            consume(*frame);
        }
    }
    close_sink();
    connected_ = false;
    LOG_CPP_INFO("[Consumer:%s] Stopped. frames=%llu bytes=%llu errors=%llu", name_.c_str(),
                 static_cast<unsigned long long>(frames_processed_.load()),
                 static_cast<unsigned long long>(bytes_written_.load()),
                 static_cast<unsigned long long>(errors_.load()));
}

ConsumerStatus AudioConsumer::status() const {
    ConsumerStatus status;
    status.name = name_;
    status.running = is_running();
    status.connected = connected_.load();
    status.frames_processed = frames_processed_.load();
    status.bytes_written = bytes_written_.load();
    status.errors = errors_.load();
    return status;
}

void AudioConsumer::consume(const Frame& frame) {
    std::size_t bytes = 0;
    if (write_frame(frame, bytes)) {
        frames_processed_++;
        bytes_written_ += bytes;
    } else {
        errors_++;
        LOG_CPP_WARNING("[Consumer:%s] Write failed (errors=%llu).", name_.c_str(),
                        static_cast<unsigned long long>(errors_.load()));
    }
}

void AudioConsumer::run() {
    const auto poll_interval = std::chrono::milliseconds(resolve_consumer_poll_ms(settings_));
    auto buffer = input_buffer();
    LOG_CPP_DEBUG("[Consumer:%s] Drain thread starting.", name_.c_str());

    while (!stop_flag_) {
        auto frame = buffer->pop();
        if (!frame) {
            wait_for_stop(poll_interval);
            continue;
        }
        consume(*frame);
    }
    LOG_CPP_DEBUG("[Consumer:%s] Drain thread exiting.", name_.c_str());
}

} // namespace audio
} // namespace airlift
