#include "wav_file_producer.h"

#include "../utils/cpp_logger.h"

#include <algorithm>
#include <cstring>

namespace airlift {
namespace audio {

namespace {
constexpr uint16_t kWaveFormatPcm = 1;
constexpr uint16_t kWaveFormatExtensible = 0xFFFE;

uint16_t read_le16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_le32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}
}

bool parse_wav_header(std::istream& stream, WavFormat& out, std::string& error) {
    unsigned char riff[12];
    stream.seekg(0, std::ios::beg);
    if (!stream.read(reinterpret_cast<char*>(riff), sizeof(riff))) {
        error = "file shorter than RIFF header";
        return false;
    }
    if (std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        error = "not a RIFF/WAVE file";
        return false;
    }

    bool have_fmt = false;
    uint16_t format_tag = 0;
    unsigned char chunk_header[8];
    while (stream.read(reinterpret_cast<char*>(chunk_header), sizeof(chunk_header))) {
        const uint32_t chunk_size = read_le32(chunk_header + 4);
        if (std::memcmp(chunk_header, "fmt ", 4) == 0) {
            if (chunk_size < 16) {
                error = "fmt chunk too small";
                return false;
            }
            unsigned char fmt[16];
            if (!stream.read(reinterpret_cast<char*>(fmt), sizeof(fmt))) {
                error = "truncated fmt chunk";
                return false;
            }
            format_tag = read_le16(fmt);
            out.channels = read_le16(fmt + 2);
            out.sample_rate = static_cast<int>(read_le32(fmt + 4));
            out.bits_per_sample = read_le16(fmt + 14);
            have_fmt = true;
            // Skip cbSize and extension bytes, plus the pad byte of odd-sized chunks.
            stream.seekg(static_cast<std::streamoff>(chunk_size - 16 + (chunk_size & 1)), std::ios::cur);
        } else if (std::memcmp(chunk_header, "data", 4) == 0) {
            if (!have_fmt) {
                error = "data chunk before fmt chunk";
                return false;
            }
            if (format_tag != kWaveFormatPcm && format_tag != kWaveFormatExtensible) {
                error = "unsupported format tag " + std::to_string(format_tag);
                return false;
            }
            if (out.bits_per_sample != 16) {
                error = "unsupported bit depth " + std::to_string(out.bits_per_sample);
                return false;
            }
            if (out.channels <= 0 || out.channels > MAX_CHANNELS || out.sample_rate <= 0) {
                error = "invalid channel count or sample rate";
                return false;
            }
            out.data_offset = stream.tellg();
            out.data_size = chunk_size;
            return true;
        } else {
            stream.seekg(static_cast<std::streamoff>(chunk_size + (chunk_size & 1)), std::ios::cur);
        }
    }
    error = "no data chunk";
    return false;
}

WavFileProducer::WavFileProducer(std::string name, WavFileParams params, std::shared_ptr<NodeSettings> settings)
    : AudioProducer(std::move(name), std::move(settings)), params_(std::move(params)) {}

WavFileProducer::~WavFileProducer() noexcept {
    stop();
}

bool WavFileProducer::open_source() {
    file_.open(params_.path, std::ios::binary);
    if (!file_.is_open()) {
        LOG_CPP_ERROR("[WavFileProducer:%s] Cannot open '%s'.", name_.c_str(), params_.path.c_str());
        return false;
    }
    std::string error;
    if (!parse_wav_header(file_, format_, error)) {
        LOG_CPP_ERROR("[WavFileProducer:%s] Invalid WAV file '%s': %s",
                      name_.c_str(), params_.path.c_str(), error.c_str());
        file_.close();
        return false;
    }
    data_remaining_ = format_.data_size;
    next_deadline_ = std::chrono::steady_clock::now();
    LOG_CPP_INFO("[WavFileProducer:%s] Opened '%s' (rate=%d Hz, channels=%d, %u data bytes%s).",
                 name_.c_str(), params_.path.c_str(), format_.sample_rate, format_.channels,
                 format_.data_size, params_.loop ? ", looping" : "");
    return true;
}

bool WavFileProducer::rewind() {
    file_.clear();
    file_.seekg(format_.data_offset, std::ios::beg);
    data_remaining_ = format_.data_size;
    return static_cast<bool>(file_);
}

CaptureResult WavFileProducer::capture_frame(Frame& out) {
    if (data_remaining_ < static_cast<uint32_t>(format_.channels * 2)) {
        if (!params_.loop) {
            return CaptureResult::Exhausted;
        }
        if (!rewind()) {
            LOG_CPP_ERROR("[WavFileProducer:%s] Rewind failed.", name_.c_str());
            return CaptureResult::Failed;
        }
        if (data_remaining_ < static_cast<uint32_t>(format_.channels * 2)) {
            return CaptureResult::Exhausted;
        }
    }

    if (!sleep_until(next_deadline_)) {
        return CaptureResult::NoData;
    }

    const std::size_t bytes_per_frame = static_cast<std::size_t>(format_.channels) * 2;
    const std::size_t quantum_bytes = quantum_samples(format_.sample_rate, format_.channels) * 2;
    std::size_t want = std::min<std::size_t>(quantum_bytes, data_remaining_);
    want -= want % bytes_per_frame;

    read_buffer_.resize(want);
    file_.read(read_buffer_.data(), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(file_.gcount());
    if (got == 0) {
        LOG_CPP_WARNING("[WavFileProducer:%s] File ended before the declared data size.", name_.c_str());
        data_remaining_ = 0;
        return CaptureResult::Exhausted;
    }
    got -= got % bytes_per_frame;
    data_remaining_ -= static_cast<uint32_t>(std::min<std::size_t>(want, data_remaining_));

    out.captured_at_ns = utc_ns_now();
    out.sample_rate = format_.sample_rate;
    out.channels = format_.channels;
    out.samples.resize(got / 2);
    const unsigned char* src = reinterpret_cast<const unsigned char*>(read_buffer_.data());
    for (std::size_t i = 0; i < out.samples.size(); ++i) {
        out.samples[i] = static_cast<int16_t>(read_le16(src + i * 2));
    }

    next_deadline_ += std::chrono::microseconds(
        static_cast<long long>(out.frame_count()) * 1000000LL / format_.sample_rate);
    return CaptureResult::FrameReady;
}

void WavFileProducer::close_source() {
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace audio
} // namespace airlift
