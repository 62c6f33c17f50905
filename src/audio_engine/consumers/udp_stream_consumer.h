/**
 * @file udp_stream_consumer.h
 * @brief Streams Frames as Scream-style UDP datagrams.
 * @details Each datagram carries a 5-byte format header followed by at most
 *          1152 bytes of little-endian 16-bit PCM.
 */
#pragma once

#include "audio_consumer.h"

#include <array>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace airlift {
namespace audio {

inline constexpr std::size_t kScreamHeaderBytes = 5;
inline constexpr std::size_t kScreamPayloadBytes = 1152;

struct UdpStreamParams {
    std::string host = "127.0.0.1";
    int port = 4010;
};

/**
 * @brief Builds the 5-byte stream header for a format.
 * @details Byte 0 holds the rate multiplier with bit 7 selecting a 44.1 kHz base
 *          (48 kHz otherwise), byte 1 the bit depth, byte 2 the channel count and
 *          bytes 3-4 the little-endian channel mask.
 */
std::array<uint8_t, kScreamHeaderBytes> build_scream_header(int sample_rate, int channels);

/**
 * @class UdpStreamConsumer
 * @brief Packetizes Frames into fixed-size UDP datagrams.
 */
class UdpStreamConsumer : public AudioConsumer {
public:
    UdpStreamConsumer(std::string name, UdpStreamParams params, std::shared_ptr<NodeSettings> settings);
    ~UdpStreamConsumer() noexcept override;

    std::string type() const override { return "udp"; }

protected:
    bool open_sink() override;
    bool write_frame(const Frame& frame, std::size_t& bytes_written) override;
    void close_sink() override;

private:
    bool send_packet(const uint8_t* payload, std::size_t payload_size);

    UdpStreamParams params_;
    int socket_fd_ = -1;
    struct sockaddr_in dest_addr_;
    std::array<uint8_t, kScreamHeaderBytes> header_{};
    int header_sample_rate_ = 0;
    int header_channels_ = 0;
    std::vector<uint8_t> packetizer_buffer_;
    std::vector<uint8_t> packet_buffer_;
};

} // namespace audio
} // namespace airlift
