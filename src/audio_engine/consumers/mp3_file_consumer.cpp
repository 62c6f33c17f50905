#include "mp3_file_consumer.h"

#include "../utils/cpp_logger.h"

#include <algorithm>

namespace airlift {
namespace audio {

namespace {
// LAME's documented worst case: 1.25 * samples + 7200.
std::size_t mp3_buffer_bytes(std::size_t frames_per_channel) {
    return frames_per_channel + frames_per_channel / 4 + 7200;
}
}

Mp3FileConsumer::Mp3FileConsumer(std::string name,
                                 Mp3FileConsumerParams params,
                                 std::shared_ptr<NodeSettings> settings)
    : AudioConsumer(std::move(name), std::move(settings)), params_(std::move(params)) {
    if (settings_) {
        tuning_ = settings_->mp3_tuning;
    }
}

Mp3FileConsumer::~Mp3FileConsumer() noexcept {
    stop();
    release_lame();
}

bool Mp3FileConsumer::initialize_lame() {
    LOG_CPP_INFO("[Mp3FileConsumer:%s] Initializing LAME MP3 encoder...", name_.c_str());
    lame_flags_ = lame_init();
    if (!lame_flags_) {
        LOG_CPP_ERROR("[Mp3FileConsumer:%s] lame_init() failed.", name_.c_str());
        return false;
    }

    lame_set_in_samplerate(lame_flags_, params_.sample_rate);
    lame_set_num_channels(lame_flags_, params_.channels);
    lame_set_mode(lame_flags_, params_.channels == 1 ? MONO : JOINT_STEREO);
    lame_set_brate(lame_flags_, tuning_.bitrate_kbps > 0 ? tuning_.bitrate_kbps : 128);
    lame_set_VBR(lame_flags_, tuning_.vbr_enabled ? vbr_default : vbr_off);
    lame_set_quality(lame_flags_, std::clamp(tuning_.quality, 0, 9));

    int ret = lame_init_params(lame_flags_);
    if (ret < 0) {
        LOG_CPP_ERROR("[Mp3FileConsumer:%s] lame_init_params() failed with code: %d", name_.c_str(), ret);
        release_lame();
        return false;
    }

    encode_buffer_.resize(mp3_buffer_bytes(quantum_samples(params_.sample_rate, 1)));
    LOG_CPP_INFO("[Mp3FileConsumer:%s] LAME initialized (%d kbps%s).", name_.c_str(),
                 tuning_.bitrate_kbps, tuning_.vbr_enabled ? ", VBR" : "");
    return true;
}

void Mp3FileConsumer::release_lame() {
    if (lame_flags_) {
        lame_close(lame_flags_);
        lame_flags_ = nullptr;
    }
}

bool Mp3FileConsumer::open_sink() {
    if (params_.path.empty()) {
        LOG_CPP_ERROR("[Mp3FileConsumer:%s] No output path configured.", name_.c_str());
        return false;
    }
    if (params_.sample_rate <= 0 || params_.channels < 1 || params_.channels > 2) {
        LOG_CPP_ERROR("[Mp3FileConsumer:%s] MP3 supports 1 or 2 channels at a positive rate (got %d Hz, %d ch).",
                      name_.c_str(), params_.sample_rate, params_.channels);
        return false;
    }
    if (!initialize_lame()) {
        return false;
    }
    file_.open(params_.path, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        LOG_CPP_ERROR("[Mp3FileConsumer:%s] Cannot open '%s' for writing.", name_.c_str(), params_.path.c_str());
        release_lame();
        return false;
    }
    return true;
}

bool Mp3FileConsumer::write_frame(const Frame& frame, std::size_t& bytes_written) {
    if (!lame_flags_ || !file_.is_open()) {
        return false;
    }
    if (frame.sample_rate != params_.sample_rate || frame.channels != params_.channels) {
        LOG_CPP_WARNING("[Mp3FileConsumer:%s] Dropping frame with format %d Hz/%d ch; encoder is %d Hz/%d ch.",
                        name_.c_str(), frame.sample_rate, frame.channels, params_.sample_rate, params_.channels);
        return false;
    }
    const int frames_per_channel = static_cast<int>(frame.frame_count());
    if (frames_per_channel == 0) {
        return true;
    }
    const std::size_t needed = mp3_buffer_bytes(static_cast<std::size_t>(frames_per_channel));
    if (encode_buffer_.size() < needed) {
        encode_buffer_.resize(needed);
    }

    int mp3_bytes_encoded = 0;
    if (params_.channels == 2) {
        mp3_bytes_encoded = lame_encode_buffer_interleaved(
            lame_flags_,
            const_cast<short int*>(reinterpret_cast<const short int*>(frame.samples.data())),
            frames_per_channel,
            encode_buffer_.data(),
            static_cast<int>(encode_buffer_.size()));
    } else {
        mp3_bytes_encoded = lame_encode_buffer(
            lame_flags_,
            reinterpret_cast<const short int*>(frame.samples.data()),
            nullptr,
            frames_per_channel,
            encode_buffer_.data(),
            static_cast<int>(encode_buffer_.size()));
    }

    if (mp3_bytes_encoded < 0) {
        LOG_CPP_ERROR("[Mp3FileConsumer:%s] LAME encoding failed with code: %d", name_.c_str(), mp3_bytes_encoded);
        return false;
    }
    if (mp3_bytes_encoded > 0) {
        file_.write(reinterpret_cast<const char*>(encode_buffer_.data()), mp3_bytes_encoded);
        if (!file_) {
            LOG_CPP_ERROR("[Mp3FileConsumer:%s] Write to '%s' failed.", name_.c_str(), params_.path.c_str());
            file_.clear();
            return false;
        }
    }
    bytes_written = static_cast<std::size_t>(mp3_bytes_encoded);
    return true;
}

void Mp3FileConsumer::close_sink() {
    if (lame_flags_ && file_.is_open()) {
        LOG_CPP_INFO("[Mp3FileConsumer:%s] Flushing LAME buffer...", name_.c_str());
        int flush_bytes = lame_encode_flush(lame_flags_, encode_buffer_.data(), static_cast<int>(encode_buffer_.size()));
        if (flush_bytes > 0) {
            file_.write(reinterpret_cast<const char*>(encode_buffer_.data()), flush_bytes);
        }
    }
    if (file_.is_open()) {
        file_.close();
    }
    release_lame();
}

} // namespace audio
} // namespace airlift
