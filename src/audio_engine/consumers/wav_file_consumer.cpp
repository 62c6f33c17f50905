#include "wav_file_consumer.h"

#include "../utils/cpp_logger.h"

#include <cstring>
#include <limits>

namespace airlift {
namespace audio {

namespace {
constexpr std::streamoff kRiffSizeOffset = 4;
constexpr std::streamoff kDataSizeOffset = 40;
constexpr uint32_t kRiffHeaderOverhead = 36;

void put_le16(uint8_t* p, uint16_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void put_le32(uint8_t* p, uint32_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}
}

std::array<uint8_t, kWavHeaderSize> build_wav_header(int sample_rate, int channels, uint32_t data_bytes) {
    std::array<uint8_t, kWavHeaderSize> header{};
    const uint16_t block_align = static_cast<uint16_t>(channels * (PCM_BIT_DEPTH / 8));
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;

    std::memcpy(header.data(), "RIFF", 4);
    put_le32(header.data() + 4, kRiffHeaderOverhead + data_bytes);
    std::memcpy(header.data() + 8, "WAVE", 4);
    std::memcpy(header.data() + 12, "fmt ", 4);
    put_le32(header.data() + 16, 16);
    put_le16(header.data() + 20, 1); // linear PCM
    put_le16(header.data() + 22, static_cast<uint16_t>(channels));
    put_le32(header.data() + 24, static_cast<uint32_t>(sample_rate));
    put_le32(header.data() + 28, byte_rate);
    put_le16(header.data() + 32, block_align);
    put_le16(header.data() + 34, PCM_BIT_DEPTH);
    std::memcpy(header.data() + 36, "data", 4);
    put_le32(header.data() + 40, data_bytes);
    return header;
}

WavFileConsumer::WavFileConsumer(std::string name,
                                 WavFileConsumerParams params,
                                 std::shared_ptr<NodeSettings> settings)
    : AudioConsumer(std::move(name), std::move(settings)), params_(std::move(params)) {}

WavFileConsumer::~WavFileConsumer() noexcept {
    stop();
}

bool WavFileConsumer::write_header(uint32_t data_bytes) {
    const auto header = build_wav_header(sample_rate_, channels_, data_bytes);
    file_.seekp(0, std::ios::beg);
    file_.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    file_.seekp(0, std::ios::end);
    return static_cast<bool>(file_);
}

bool WavFileConsumer::open_sink() {
    if (params_.path.empty()) {
        LOG_CPP_ERROR("[WavFileConsumer:%s] No output path configured.", name_.c_str());
        return false;
    }
    file_.open(params_.path, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        LOG_CPP_ERROR("[WavFileConsumer:%s] Cannot open '%s' for writing.", name_.c_str(), params_.path.c_str());
        return false;
    }
    sample_rate_ = params_.sample_rate > 0 ? params_.sample_rate : DEFAULT_SAMPLE_RATE;
    channels_ = (params_.channels > 0 && params_.channels <= MAX_CHANNELS) ? params_.channels : DEFAULT_CHANNELS;
    format_locked_ = false;
    data_bytes_ = 0;
    if (!write_header(0)) {
        LOG_CPP_ERROR("[WavFileConsumer:%s] Failed to write header to '%s'.", name_.c_str(), params_.path.c_str());
        file_.close();
        return false;
    }
    LOG_CPP_INFO("[WavFileConsumer:%s] Recording to '%s'.", name_.c_str(), params_.path.c_str());
    return true;
}

bool WavFileConsumer::write_frame(const Frame& frame, std::size_t& bytes_written) {
    if (!file_.is_open()) {
        return false;
    }
    if (!format_locked_) {
        if (frame.sample_rate != sample_rate_ || frame.channels != channels_) {
            sample_rate_ = frame.sample_rate;
            channels_ = frame.channels;
            if (!write_header(0)) {
                return false;
            }
        }
        format_locked_ = true;
    } else if (frame.sample_rate != sample_rate_ || frame.channels != channels_) {
        LOG_CPP_WARNING("[WavFileConsumer:%s] Dropping frame with format %d Hz/%d ch; file is %d Hz/%d ch.",
                        name_.c_str(), frame.sample_rate, frame.channels, sample_rate_, channels_);
        return false;
    }

    const std::size_t bytes = frame.samples.size() * sizeof(int16_t);
    if (bytes > std::numeric_limits<uint32_t>::max() - kRiffHeaderOverhead - data_bytes_) {
        LOG_CPP_ERROR("[WavFileConsumer:%s] File would exceed the 4 GiB WAV limit.", name_.c_str());
        return false;
    }
    write_buffer_.resize(bytes);
    for (std::size_t i = 0; i < frame.samples.size(); ++i) {
        put_le16(write_buffer_.data() + i * 2, static_cast<uint16_t>(frame.samples[i]));
    }
    file_.write(reinterpret_cast<const char*>(write_buffer_.data()), static_cast<std::streamsize>(bytes));
    if (!file_) {
        LOG_CPP_ERROR("[WavFileConsumer:%s] Write to '%s' failed.", name_.c_str(), params_.path.c_str());
        file_.clear();
        return false;
    }
    data_bytes_ += static_cast<uint32_t>(bytes);
    bytes_written = bytes;
    return true;
}

void WavFileConsumer::close_sink() {
    if (!file_.is_open()) {
        return;
    }
    uint8_t size_field[4];
    put_le32(size_field, kRiffHeaderOverhead + data_bytes_);
    file_.seekp(kRiffSizeOffset, std::ios::beg);
    file_.write(reinterpret_cast<const char*>(size_field), sizeof(size_field));
    put_le32(size_field, data_bytes_);
    file_.seekp(kDataSizeOffset, std::ios::beg);
    file_.write(reinterpret_cast<const char*>(size_field), sizeof(size_field));
    if (!file_) {
        LOG_CPP_ERROR("[WavFileConsumer:%s] Failed to finalize header of '%s'.", name_.c_str(), params_.path.c_str());
    }
    file_.close();
    LOG_CPP_INFO("[WavFileConsumer:%s] Closed '%s' (%u data bytes).", name_.c_str(), params_.path.c_str(), data_bytes_);
}

} // namespace audio
} // namespace airlift
