#include "alsa_capture_producer.h"

#include "../utils/cpp_logger.h"

#include <cerrno>

namespace airlift {
namespace audio {

AlsaCaptureProducer::AlsaCaptureProducer(std::string name,
                                         AlsaCaptureParams params,
                                         std::shared_ptr<NodeSettings> settings)
    : AudioProducer(std::move(name), std::move(settings)), params_(std::move(params)) {}

AlsaCaptureProducer::~AlsaCaptureProducer() noexcept {
    stop();
}

bool AlsaCaptureProducer::open_source() {
    if (pcm_handle_) {
        return true;
    }
    if (params_.device.empty()) {
        LOG_CPP_ERROR("[AlsaCapture:%s] No ALSA device configured.", name_.c_str());
        return false;
    }

    active_channels_ = params_.channels ? params_.channels : DEFAULT_CHANNELS;
    active_sample_rate_ = params_.sample_rate ? params_.sample_rate : DEFAULT_SAMPLE_RATE;

    int err = snd_pcm_open(&pcm_handle_, params_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] snd_pcm_open(%s) failed: %s",
                      name_.c_str(), params_.device.c_str(), snd_strerror(err));
        pcm_handle_ = nullptr;
        return false;
    }

    snd_pcm_hw_params_t* hw_params = nullptr;
    if (snd_pcm_hw_params_malloc(&hw_params) < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] Failed to allocate hw params.", name_.c_str());
        close_source();
        return false;
    }

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] snd_pcm_hw_params_any failed: %s", name_.c_str(), snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_source();
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] Failed to set interleaved access: %s", name_.c_str(), snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_source();
        return false;
    }

    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, SND_PCM_FORMAT_S16_LE)) < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] S16_LE capture unsupported: %s", name_.c_str(), snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_source();
        return false;
    }

    if ((err = snd_pcm_hw_params_set_channels(pcm_handle_, hw_params, active_channels_)) < 0) {
        if (active_channels_ == 1) {
            LOG_CPP_ERROR("[AlsaCapture:%s] Failed to set channel count: %s", name_.c_str(), snd_strerror(err));
            snd_pcm_hw_params_free(hw_params);
            close_source();
            return false;
        }
        LOG_CPP_WARNING("[AlsaCapture:%s] Requested %u channels unsupported (%s). Retrying as mono.",
                        name_.c_str(), active_channels_, snd_strerror(err));
        int fallback_err = snd_pcm_hw_params_set_channels(pcm_handle_, hw_params, 1);
        if (fallback_err < 0) {
            LOG_CPP_ERROR("[AlsaCapture:%s] Failed to set fallback mono capture: %s",
                          name_.c_str(), snd_strerror(fallback_err));
            snd_pcm_hw_params_free(hw_params);
            close_source();
            return false;
        }
        active_channels_ = 1;
    }

    unsigned int requested_rate = active_sample_rate_;
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &requested_rate, nullptr)) < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] Failed to set sample rate: %s", name_.c_str(), snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_source();
        return false;
    }
    active_sample_rate_ = requested_rate;

    snd_pcm_uframes_t desired_period = params_.period_frames ? params_.period_frames : 1024;
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &desired_period, nullptr)) < 0) {
        LOG_CPP_WARNING("[AlsaCapture:%s] Failed to set period size: %s", name_.c_str(), snd_strerror(err));
    }

    snd_pcm_uframes_t desired_buffer = params_.buffer_frames ? params_.buffer_frames : desired_period * 4;
    if ((err = snd_pcm_hw_params_set_buffer_size_near(pcm_handle_, hw_params, &desired_buffer)) < 0) {
        LOG_CPP_WARNING("[AlsaCapture:%s] Failed to set buffer size: %s", name_.c_str(), snd_strerror(err));
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] Failed to apply hw params: %s", name_.c_str(), snd_strerror(err));
        snd_pcm_hw_params_free(hw_params);
        close_source();
        return false;
    }

    snd_pcm_hw_params_get_period_size(hw_params, &period_frames_, nullptr);
    snd_pcm_hw_params_get_buffer_size(hw_params, &buffer_frames_);
    snd_pcm_hw_params_free(hw_params);

    snd_pcm_sw_params_t* sw_params = nullptr;
    if (snd_pcm_sw_params_malloc(&sw_params) == 0) {
        if (snd_pcm_sw_params_current(pcm_handle_, sw_params) == 0) {
            snd_pcm_sw_params_set_start_threshold(pcm_handle_, sw_params, period_frames_);
            snd_pcm_sw_params_set_avail_min(pcm_handle_, sw_params, period_frames_);
            if ((err = snd_pcm_sw_params(pcm_handle_, sw_params)) < 0) {
                LOG_CPP_WARNING("[AlsaCapture:%s] Failed to apply sw params: %s", name_.c_str(), snd_strerror(err));
            }
        }
        snd_pcm_sw_params_free(sw_params);
    }

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] Failed to prepare device: %s", name_.c_str(), snd_strerror(err));
        close_source();
        return false;
    }

    quantum_samples_ = quantum_samples(static_cast<int>(active_sample_rate_), static_cast<int>(active_channels_));
    period_buffer_.assign(period_frames_ * active_channels_, 0);
    chunk_fifo_.clear();
    chunk_fifo_.reserve(quantum_samples_ * 2);

    LOG_CPP_INFO("[AlsaCapture:%s] Opened %s (rate=%u Hz, channels=%u, period=%lu frames, buffer=%lu frames).",
                 name_.c_str(), params_.device.c_str(), active_sample_rate_, active_channels_,
                 static_cast<unsigned long>(period_frames_), static_cast<unsigned long>(buffer_frames_));
    return true;
}

void AlsaCaptureProducer::close_source() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaCaptureProducer::recover_from_error(int err) {
    if (!pcm_handle_) {
        return false;
    }
    const bool is_xrun = (err == -EPIPE);
    LOG_CPP_WARNING("[AlsaCapture:%s] Read error detected (err=%s)%s. Attempting recovery.",
                    name_.c_str(), snd_strerror(err), is_xrun ? " [x-run]" : "");
    err = snd_pcm_recover(pcm_handle_, err, 1);
    if (err < 0) {
        LOG_CPP_ERROR("[AlsaCapture:%s] snd_pcm_recover failed: %s", name_.c_str(), snd_strerror(err));
        return false;
    }
    return true;
}

CaptureResult AlsaCaptureProducer::capture_frame(Frame& out) {
    while (!stop_flag_) {
        if (chunk_fifo_.pop_exact(out.samples, quantum_samples_)) {
            out.captured_at_ns = utc_ns_now();
            out.sample_rate = static_cast<int>(active_sample_rate_);
            out.channels = static_cast<int>(active_channels_);
            return CaptureResult::FrameReady;
        }

        snd_pcm_sframes_t frames_read = snd_pcm_readi(pcm_handle_, period_buffer_.data(), period_frames_);
        if (frames_read == 0) {
            continue;
        }
        if (frames_read < 0) {
            if (!recover_from_error(static_cast<int>(frames_read))) {
                return CaptureResult::Failed;
            }
            continue;
        }
        chunk_fifo_.append(period_buffer_.data(), static_cast<std::size_t>(frames_read) * active_channels_);
    }
    return CaptureResult::NoData;
}

} // namespace audio
} // namespace airlift
