/**
 * @file buffer_monitor_service.h
 * @brief Node services and the periodic ring buffer monitor.
 */
#ifndef AIRLIFT_BUFFER_MONITOR_SERVICE_H
#define AIRLIFT_BUFFER_MONITOR_SERVICE_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "../audio_types.h"
#include "../utils/audio_component.h"
#include "../utils/audio_ring_buffer.h"

namespace airlift {
namespace audio {

/**
 * @class NodeService
 * @brief Base for auxiliary threaded components owned by the node.
 * @details Services observe the pipeline; they never pop from the buffers they watch.
 */
class NodeService : public AudioComponent {
public:
    ~NodeService() override = default;

    virtual ServiceStatus status() const = 0;
    virtual std::string type() const = 0;

protected:
    explicit NodeService(std::string name) : AudioComponent(std::move(name)) {}
};

/**
 * @class BufferMonitorService
 * @brief Logs the stats of one ring buffer every `interval_ms`.
 */
class BufferMonitorService : public NodeService {
public:
    BufferMonitorService(std::string name,
                         std::string buffer_name,
                         std::shared_ptr<utils::AudioRingBuffer> buffer,
                         long interval_ms);
    ~BufferMonitorService() noexcept override;

    bool start() override;
    void stop() override;

    ServiceStatus status() const override;
    std::string type() const override { return "buffer_monitor"; }

    /** @brief Stats of the watched buffer as of the latest report. */
    RingBufferStats last_report() const;

protected:
    void run() override;

private:
    void report();

    std::string buffer_name_;
    std::shared_ptr<utils::AudioRingBuffer> buffer_;
    const long interval_ms_;

    std::atomic<uint64_t> reports_emitted_{0};
    uint64_t last_dropped_ = 0;
    mutable std::mutex report_mutex_;
    RingBufferStats last_report_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_BUFFER_MONITOR_SERVICE_H
