#include "buffer_monitor_service.h"

#include "../configuration/node_settings.h"
#include "../utils/cpp_logger.h"

namespace airlift {
namespace audio {

BufferMonitorService::BufferMonitorService(std::string name,
                                           std::string buffer_name,
                                           std::shared_ptr<utils::AudioRingBuffer> buffer,
                                           long interval_ms)
    : NodeService(std::move(name)),
      buffer_name_(std::move(buffer_name)),
      buffer_(std::move(buffer)),
      interval_ms_(sanitize_interval_ms(interval_ms, kDefaultMonitorIntervalMs)) {}

BufferMonitorService::~BufferMonitorService() noexcept {
    stop();
}

bool BufferMonitorService::start() {
    if (is_running()) {
        return true;
    }
    if (!buffer_) {
        LOG_CPP_ERROR("[BufferMonitor:%s] No buffer to monitor.", name_.c_str());
        return false;
    }
    if (!launch_thread()) {
        LOG_CPP_ERROR("[BufferMonitor:%s] Failed to launch monitor thread.", name_.c_str());
        return false;
    }
    LOG_CPP_INFO("[BufferMonitor:%s] Watching '%s' every %ld ms.", name_.c_str(), buffer_name_.c_str(), interval_ms_);
    return true;
}

void BufferMonitorService::stop() {
    if (!thread_launched()) {
        return;
    }
    join_thread();
    LOG_CPP_INFO("[BufferMonitor:%s] Stopped after %llu reports.", name_.c_str(),
                 static_cast<unsigned long long>(reports_emitted_.load()));
}

ServiceStatus BufferMonitorService::status() const {
    ServiceStatus status;
    status.name = name_;
    status.running = is_running();
    status.reports_emitted = reports_emitted_.load();
    return status;
}

RingBufferStats BufferMonitorService::last_report() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

void BufferMonitorService::report() {
    RingBufferStats stats = buffer_->stats();
    const uint64_t new_drops = stats.dropped_frames - last_dropped_;
    last_dropped_ = stats.dropped_frames;

    if (new_drops > 0) {
        LOG_CPP_WARNING("[BufferMonitor:%s] '%s' depth=%zu/%zu dropped=%llu (+%llu)",
                        name_.c_str(), buffer_name_.c_str(), stats.current_depth, stats.capacity,
                        static_cast<unsigned long long>(stats.dropped_frames),
                        static_cast<unsigned long long>(new_drops));
    } else {
        LOG_CPP_INFO("[BufferMonitor:%s] '%s' depth=%zu/%zu dropped=%llu",
                     name_.c_str(), buffer_name_.c_str(), stats.current_depth, stats.capacity,
                     static_cast<unsigned long long>(stats.dropped_frames));
    }
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = std::move(stats);
    }
    reports_emitted_++;
}

void BufferMonitorService::run() {
    last_dropped_ = buffer_->dropped_frames();
    while (!wait_for_stop(std::chrono::milliseconds(interval_ms_))) {
        report();
    }
}

} // namespace audio
} // namespace airlift
