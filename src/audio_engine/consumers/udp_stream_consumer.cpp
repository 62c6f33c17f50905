#include "udp_stream_consumer.h"

#include "../utils/cpp_logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace airlift {
namespace audio {

namespace {
uint16_t channel_mask_for(int channels) {
    switch (channels) {
        case 1: return 0x0004; // FC
        case 2: return 0x0003; // FL FR
        case 4: return 0x0033; // FL FR BL BR
        case 6: return 0x003F; // 5.1
        case 8: return 0x063F; // 7.1
        default: return 0x0000;
    }
}
}

std::array<uint8_t, kScreamHeaderBytes> build_scream_header(int sample_rate, int channels) {
    const bool base_44100 = sample_rate > 0 && (sample_rate % 44100) == 0;
    const int base = base_44100 ? 44100 : 48000;
    int mult = sample_rate > 0 ? sample_rate / base : 1;
    if (mult < 1) {
        mult = 1;
    }
    const uint16_t mask = channel_mask_for(channels);

    std::array<uint8_t, kScreamHeaderBytes> header{};
    header[0] = static_cast<uint8_t>((mult & 0x7F) | (base_44100 ? 0x80 : 0x00));
    header[1] = static_cast<uint8_t>(PCM_BIT_DEPTH);
    header[2] = static_cast<uint8_t>(channels);
    header[3] = static_cast<uint8_t>(mask & 0xFF);
    header[4] = static_cast<uint8_t>((mask >> 8) & 0xFF);
    return header;
}

UdpStreamConsumer::UdpStreamConsumer(std::string name, UdpStreamParams params, std::shared_ptr<NodeSettings> settings)
    : AudioConsumer(std::move(name), std::move(settings)), params_(std::move(params)) {
    std::memset(&dest_addr_, 0, sizeof(dest_addr_));
}

UdpStreamConsumer::~UdpStreamConsumer() noexcept {
    stop();
}

bool UdpStreamConsumer::open_sink() {
    LOG_CPP_INFO("[UdpStream:%s] Setting up networking...", name_.c_str());
    if (params_.port <= 0 || params_.port > 65535) {
        LOG_CPP_ERROR("[UdpStream:%s] Invalid port %d.", name_.c_str(), params_.port);
        return false;
    }
    std::memset(&dest_addr_, 0, sizeof(dest_addr_));
    dest_addr_.sin_family = AF_INET;
    dest_addr_.sin_port = htons(static_cast<uint16_t>(params_.port));
    if (inet_pton(AF_INET, params_.host.c_str(), &dest_addr_.sin_addr) <= 0) {
        LOG_CPP_ERROR("[UdpStream:%s] Invalid UDP destination IP address: %s", name_.c_str(), params_.host.c_str());
        return false;
    }

    socket_fd_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_fd_ < 0) {
        LOG_CPP_ERROR("[UdpStream:%s] Failed to create UDP socket: %s", name_.c_str(), std::strerror(errno));
        socket_fd_ = -1;
        return false;
    }

    int priority = 6; // AC_VO
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_PRIORITY, &priority, sizeof(priority)) < 0) {
        LOG_CPP_WARNING("[UdpStream:%s] Failed to set socket priority.", name_.c_str());
    }
    int tos_value = 46 << 2; // DSCP EF
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_TOS, &tos_value, sizeof(tos_value)) < 0) {
        LOG_CPP_WARNING("[UdpStream:%s] Failed to set TOS/DSCP.", name_.c_str());
    }

    header_sample_rate_ = 0;
    header_channels_ = 0;
    packetizer_buffer_.clear();
    packetizer_buffer_.reserve(kScreamPayloadBytes * 2);
    packet_buffer_.resize(kScreamHeaderBytes + kScreamPayloadBytes);

    LOG_CPP_INFO("[UdpStream:%s] Networking setup complete (UDP target: %s:%d)",
                 name_.c_str(), params_.host.c_str(), params_.port);
    return true;
}

bool UdpStreamConsumer::send_packet(const uint8_t* payload, std::size_t payload_size) {
    std::memcpy(packet_buffer_.data(), header_.data(), kScreamHeaderBytes);
    std::memcpy(packet_buffer_.data() + kScreamHeaderBytes, payload, payload_size);
    const std::size_t length = kScreamHeaderBytes + payload_size;

    ssize_t sent_bytes = sendto(socket_fd_, packet_buffer_.data(), length, 0,
                                reinterpret_cast<const struct sockaddr*>(&dest_addr_), sizeof(dest_addr_));
    if (sent_bytes < 0) {
        LOG_CPP_ERROR("[UdpStream:%s] UDP sendto failed: %s", name_.c_str(), std::strerror(errno));
        return false;
    }
    if (static_cast<std::size_t>(sent_bytes) != length) {
        LOG_CPP_ERROR("[UdpStream:%s] UDP sendto sent partial data: %zd/%zu", name_.c_str(), sent_bytes, length);
        return false;
    }
    return true;
}

bool UdpStreamConsumer::write_frame(const Frame& frame, std::size_t& bytes_written) {
    if (socket_fd_ < 0) {
        return false;
    }
    if (frame.sample_rate != header_sample_rate_ || frame.channels != header_channels_) {
        if (!packetizer_buffer_.empty()) {
            LOG_CPP_DEBUG("[UdpStream:%s] Format changed; dropping %zu pending bytes.",
                          name_.c_str(), packetizer_buffer_.size());
            packetizer_buffer_.clear();
        }
        header_ = build_scream_header(frame.sample_rate, frame.channels);
        header_sample_rate_ = frame.sample_rate;
        header_channels_ = frame.channels;
    }

    const std::size_t old_size = packetizer_buffer_.size();
    packetizer_buffer_.resize(old_size + frame.samples.size() * sizeof(int16_t));
    uint8_t* dst = packetizer_buffer_.data() + old_size;
    for (std::size_t i = 0; i < frame.samples.size(); ++i) {
        const uint16_t value = static_cast<uint16_t>(frame.samples[i]);
        dst[i * 2] = static_cast<uint8_t>(value & 0xFF);
        dst[i * 2 + 1] = static_cast<uint8_t>(value >> 8);
    }

    bool ok = true;
    std::size_t offset = 0;
    while (packetizer_buffer_.size() - offset >= kScreamPayloadBytes) {
        if (send_packet(packetizer_buffer_.data() + offset, kScreamPayloadBytes)) {
            bytes_written += kScreamHeaderBytes + kScreamPayloadBytes;
        } else {
            ok = false;
        }
        offset += kScreamPayloadBytes;
    }
    packetizer_buffer_.erase(packetizer_buffer_.begin(), packetizer_buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return ok;
}

void UdpStreamConsumer::close_sink() {
    if (socket_fd_ < 0) {
        return;
    }
    if (!packetizer_buffer_.empty()) {
        if (!send_packet(packetizer_buffer_.data(), packetizer_buffer_.size())) {
            LOG_CPP_WARNING("[UdpStream:%s] Final partial packet was not delivered.", name_.c_str());
        }
        packetizer_buffer_.clear();
    }
    LOG_CPP_INFO("[UdpStream:%s] Closing UDP socket", name_.c_str());
    ::close(socket_fd_);
    socket_fd_ = -1;
}

} // namespace audio
} // namespace airlift
