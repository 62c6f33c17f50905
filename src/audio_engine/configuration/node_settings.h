#ifndef AIRLIFT_NODE_SETTINGS_H
#define AIRLIFT_NODE_SETTINGS_H

#include <cstddef>
#include <memory>

#include "../audio_constants.h"

namespace airlift {
namespace audio {

inline constexpr std::size_t kDefaultRingBufferCapacity = 1000;
inline constexpr long kDefaultFlowTickMs = 10;
inline constexpr long kDefaultFlowIdleSleepMs = 100;
inline constexpr long kDefaultConsumerPollMs = 5;
inline constexpr long kDefaultMonitorIntervalMs = 1000;

struct Mp3Tuning {
    int bitrate_kbps = 128;
    bool vbr_enabled = false;
    int quality = 2; // LAME algorithm quality, 0 (best) .. 9 (fastest)
};

struct FlowTuning {
    long tick_ms = kDefaultFlowTickMs;
    long idle_sleep_ms = kDefaultFlowIdleSleepMs;
};

struct ProducerTuning {
    // Format of the silence emitted before a source has ever delivered audio.
    int silence_sample_rate = DEFAULT_SAMPLE_RATE;
    int silence_channels = DEFAULT_CHANNELS;
};

class NodeSettings {
public:
    std::size_t ring_buffer_capacity = kDefaultRingBufferCapacity;
    long consumer_poll_ms = kDefaultConsumerPollMs;
    long monitor_interval_ms = kDefaultMonitorIntervalMs;
    FlowTuning flow_tuning;
    ProducerTuning producer_tuning;
    Mp3Tuning mp3_tuning;
};

inline std::size_t sanitize_ring_buffer_capacity(std::size_t configured) {
    return configured > 0 ? configured : kDefaultRingBufferCapacity;
}

inline long sanitize_interval_ms(long configured, long fallback) {
    return configured > 0 ? configured : fallback;
}

inline std::size_t resolve_ring_buffer_capacity(const std::shared_ptr<NodeSettings>& settings) {
    return sanitize_ring_buffer_capacity(settings ? settings->ring_buffer_capacity : kDefaultRingBufferCapacity);
}

inline long resolve_flow_tick_ms(const std::shared_ptr<NodeSettings>& settings) {
    return sanitize_interval_ms(settings ? settings->flow_tuning.tick_ms : kDefaultFlowTickMs, kDefaultFlowTickMs);
}

inline long resolve_flow_idle_sleep_ms(const std::shared_ptr<NodeSettings>& settings) {
    return sanitize_interval_ms(settings ? settings->flow_tuning.idle_sleep_ms : kDefaultFlowIdleSleepMs,
                                kDefaultFlowIdleSleepMs);
}

inline long resolve_consumer_poll_ms(const std::shared_ptr<NodeSettings>& settings) {
    return sanitize_interval_ms(settings ? settings->consumer_poll_ms : kDefaultConsumerPollMs, kDefaultConsumerPollMs);
}

inline long resolve_monitor_interval_ms(const std::shared_ptr<NodeSettings>& settings) {
    return sanitize_interval_ms(settings ? settings->monitor_interval_ms : kDefaultMonitorIntervalMs,
                                kDefaultMonitorIntervalMs);
}

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_NODE_SETTINGS_H
