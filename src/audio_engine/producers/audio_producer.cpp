#include "audio_producer.h"

#include "../utils/cpp_logger.h"

namespace airlift {
namespace audio {

namespace {
constexpr std::chrono::milliseconds kQuantumDuration(1000 / FRAME_QUANTUM_DIVISOR);
}

AudioProducer::AudioProducer(std::string name, std::shared_ptr<NodeSettings> settings)
    : AudioComponent(std::move(name)),
      settings_(std::move(settings)),
      fallback_sample_rate_(DEFAULT_SAMPLE_RATE),
      fallback_channels_(DEFAULT_CHANNELS) {
    if (settings_) {
        if (settings_->producer_tuning.silence_sample_rate > 0) {
            fallback_sample_rate_ = settings_->producer_tuning.silence_sample_rate;
        }
        if (settings_->producer_tuning.silence_channels > 0 &&
            settings_->producer_tuning.silence_channels <= MAX_CHANNELS) {
            fallback_channels_ = settings_->producer_tuning.silence_channels;
        }
    }
}

bool AudioProducer::attach_output_buffer(std::shared_ptr<utils::AudioRingBuffer> buffer) {
    if (!buffer) {
        LOG_CPP_ERROR("[Producer:%s] Cannot attach a null output buffer.", name_.c_str());
        return false;
    }
    if (is_running()) {
        LOG_CPP_ERROR("[Producer:%s] Cannot attach an output buffer while running.", name_.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    if (output_buffer_) {
        LOG_CPP_ERROR("[Producer:%s] Output buffer already attached.", name_.c_str());
        return false;
    }
    output_buffer_ = std::move(buffer);
    return true;
}

std::shared_ptr<utils::AudioRingBuffer> AudioProducer::output_buffer() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return output_buffer_;
}

bool AudioProducer::start() {
    if (is_running()) {
        return true;
    }
    if (!output_buffer()) {
        LOG_CPP_ERROR("[Producer:%s] Cannot start without an output buffer.", name_.c_str());
        return false;
    }
    if (!launch_thread()) {
        LOG_CPP_ERROR("[Producer:%s] Failed to launch capture thread.", name_.c_str());
        return false;
    }
    LOG_CPP_INFO("[Producer:%s] Started (%s).", name_.c_str(), type().c_str());
    return true;
}

void AudioProducer::stop() {
    if (!thread_launched()) {
        return;
    }
    LOG_CPP_INFO("[Producer:%s] Stopping...", name_.c_str());
    join_thread();
    connected_ = false;
    LOG_CPP_INFO("[Producer:%s] Stopped.", name_.c_str());
}

ProducerStatus AudioProducer::status() const {
    ProducerStatus status;
    status.name = name_;
    status.running = is_running();
    status.connected = connected_.load();
    status.samples_processed = samples_processed_.load();
    status.errors = errors_.load();
    if (auto buffer = output_buffer()) {
        status.buffer_stats = buffer->stats();
    }
    return status;
}

bool AudioProducer::sleep_until(std::chrono::steady_clock::time_point deadline) {
    auto now = std::chrono::steady_clock::now();
    if (deadline <= now) {
        return !stop_flag_;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    return !wait_for_stop(remaining);
}

bool AudioProducer::publish(Frame frame) {
    if (!frame.is_well_formed()) {
        errors_++;
        LOG_CPP_WARNING("[Producer:%s] Rejected malformed frame (%zu samples, %d channels).",
                        name_.c_str(), frame.samples.size(), frame.channels);
        return false;
    }
    auto buffer = output_buffer();
    if (!buffer) {
        return false;
    }
    if (frame.captured_at_ns == 0) {
        frame.captured_at_ns = utc_ns_now();
    }
    fallback_sample_rate_ = frame.sample_rate > 0 ? frame.sample_rate : fallback_sample_rate_;
    fallback_channels_ = frame.channels;
    samples_processed_ += frame.samples.size();
    buffer->push(std::move(frame));
    return true;
}

void AudioProducer::run() {
    LOG_CPP_INFO("[Producer:%s] Capture thread starting.", name_.c_str());

    if (!open_source()) {
        connected_ = false;
        LOG_CPP_WARNING("[Producer:%s] Source unavailable. Emitting silence.", name_.c_str());
        run_silence_fallback();
        LOG_CPP_INFO("[Producer:%s] Capture thread exiting.", name_.c_str());
        return;
    }
    connected_ = true;

    while (!stop_flag_) {
        Frame frame;
        CaptureResult result = capture_frame(frame);
        if (result == CaptureResult::FrameReady) {
            publish(std::move(frame));
            continue;
        }
        if (result == CaptureResult::NoData) {
            continue;
        }

        if (result == CaptureResult::Failed) {
            errors_++;
            LOG_CPP_ERROR("[Producer:%s] Capture failed. Falling back to silence.", name_.c_str());
        } else {
            LOG_CPP_INFO("[Producer:%s] Source exhausted. Falling back to silence.", name_.c_str());
        }
        connected_ = false;
        close_source();
        run_silence_fallback();
        LOG_CPP_INFO("[Producer:%s] Capture thread exiting.", name_.c_str());
        return;
    }

    close_source();
    LOG_CPP_INFO("[Producer:%s] Capture thread exiting.", name_.c_str());
}

void AudioProducer::run_silence_fallback() {
    auto next_deadline = std::chrono::steady_clock::now();
    while (!stop_flag_) {
        publish(make_silence_frame(fallback_sample_rate_, fallback_channels_));
        next_deadline += kQuantumDuration;
        if (!sleep_until(next_deadline)) {
            break;
        }
    }
}

} // namespace audio
} // namespace airlift
