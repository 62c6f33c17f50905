#include "audio_processor.h"

#include "../utils/cpp_logger.h"

namespace airlift {
namespace audio {

namespace {
// Weight of the newest sample in the smoothed latency estimate.
constexpr double kLatencySmoothing = 0.1;
}

bool AudioProcessor::process(utils::AudioRingBuffer& input, utils::AudioRingBuffer& output) {
    const auto started = std::chrono::steady_clock::now();
    std::size_t frames_emitted = 0;
    bool ok = false;
    try {
        ok = process_frames(input, output, frames_emitted);
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("[Processor:%s] Exception during process: %s", name_.c_str(), e.what());
        ok = false;
    }
    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    frames_processed_ += frames_emitted;
    if (!ok) {
        errors_++;
    }

    std::lock_guard<std::mutex> lock(timing_mutex_);
    if (latency_estimate_ms_ == 0.0) {
        latency_estimate_ms_ = elapsed_ms;
    } else {
        latency_estimate_ms_ += kLatencySmoothing * (elapsed_ms - latency_estimate_ms_);
    }
    return ok;
}

void AudioProcessor::set_running(bool running) {
    if (running && !running_) {
        std::lock_guard<std::mutex> lock(timing_mutex_);
        running_since_ = std::chrono::steady_clock::now();
        frames_at_start_ = frames_processed_.load();
    }
    running_ = running;
}

ProcessorStatus AudioProcessor::status() const {
    ProcessorStatus status;
    status.name = name_;
    status.running = running_.load();
    status.frames_processed = frames_processed_.load();
    status.errors = errors_.load();

    std::lock_guard<std::mutex> lock(timing_mutex_);
    status.latency_estimate_ms = latency_estimate_ms_;
    if (status.running) {
        const double seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - running_since_).count();
        if (seconds > 0.0) {
            status.processing_rate = static_cast<double>(status.frames_processed - frames_at_start_) / seconds;
        }
    }
    return status;
}

} // namespace audio
} // namespace airlift
