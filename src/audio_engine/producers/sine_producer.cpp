#include "sine_producer.h"

#include "../utils/cpp_logger.h"

#include <cmath>

namespace airlift {
namespace audio {

namespace {
constexpr double kTwoPi = 6.283185307179586;
constexpr std::chrono::milliseconds kQuantumDuration(1000 / FRAME_QUANTUM_DIVISOR);
}

SineProducer::SineProducer(std::string name, SineParams params, std::shared_ptr<NodeSettings> settings)
    : AudioProducer(std::move(name), std::move(settings)), params_(params) {}

SineProducer::~SineProducer() noexcept {
    stop();
}

bool SineProducer::open_source() {
    if (params_.sample_rate <= 0 || params_.channels <= 0 || params_.channels > MAX_CHANNELS) {
        LOG_CPP_ERROR("[SineProducer:%s] Invalid format (rate=%d, channels=%d).",
                      name_.c_str(), params_.sample_rate, params_.channels);
        return false;
    }
    if (params_.frequency <= 0.0 || params_.frequency * 2.0 > params_.sample_rate) {
        LOG_CPP_WARNING("[SineProducer:%s] Frequency %.1f Hz is outside (0, Nyquist).",
                        name_.c_str(), params_.frequency);
    }
    phase_ = 0.0;
    next_deadline_ = std::chrono::steady_clock::now();
    LOG_CPP_INFO("[SineProducer:%s] Generating %.1f Hz at %d Hz, %d channels.",
                 name_.c_str(), params_.frequency, params_.sample_rate, params_.channels);
    return true;
}

CaptureResult SineProducer::capture_frame(Frame& out) {
    if (!sleep_until(next_deadline_)) {
        return CaptureResult::NoData;
    }
    next_deadline_ += kQuantumDuration;

    const std::size_t frames = static_cast<std::size_t>(params_.sample_rate / FRAME_QUANTUM_DIVISOR);
    const double peak = params_.amplitude * static_cast<double>(SAMPLE_MAX);
    const double step = kTwoPi * params_.frequency / static_cast<double>(params_.sample_rate);

    out.captured_at_ns = utc_ns_now();
    out.sample_rate = params_.sample_rate;
    out.channels = params_.channels;
    out.samples.resize(frames * static_cast<std::size_t>(params_.channels));

    for (std::size_t i = 0; i < frames; ++i) {
        const int16_t value = clamp_sample(static_cast<float>(peak * std::sin(phase_)));
        for (int ch = 0; ch < params_.channels; ++ch) {
            out.samples[i * params_.channels + ch] = value;
        }
        phase_ += step;
        if (phase_ >= kTwoPi) {
            phase_ -= kTwoPi;
        }
    }
    return CaptureResult::FrameReady;
}

} // namespace audio
} // namespace airlift
