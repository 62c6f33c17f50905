#pragma once
/**
 * Mock components for pipeline tests.
 * These let flows and nodes run end-to-end without devices, files or sockets.
 */

#include "consumers/audio_consumer.h"
#include "configuration/component_factory.h"
#include "processors/audio_processor.h"
#include "producers/audio_producer.h"
#include "services/buffer_monitor_service.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace airlift {
namespace audio {
namespace testing {

/** Polls `condition` until it holds or `timeout` expires. */
inline bool WaitForCondition(const std::function<bool()>& condition,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

inline Frame MakeFrame(std::vector<int16_t> samples, int sample_rate = 20, int channels = 1, uint64_t ts = 1) {
    Frame frame;
    frame.captured_at_ns = ts;
    frame.samples = std::move(samples);
    frame.sample_rate = sample_rate;
    frame.channels = channels;
    return frame;
}

/**
 * Thread-safe ordered record of lifecycle events, shared by the mocks below.
 */
class EventLog {
public:
    void record(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

/**
 * Producer that publishes a fixed list of frames, then idles.
 * With `exhaust_at_end` it reports the source as ended instead.
 */
class ScriptedProducer : public AudioProducer {
public:
    ScriptedProducer(std::string name, std::vector<Frame> script,
                     std::shared_ptr<EventLog> log = nullptr,
                     std::shared_ptr<NodeSettings> settings = std::make_shared<NodeSettings>())
        : AudioProducer(std::move(name), std::move(settings)),
          script_(script.begin(), script.end()),
          log_(std::move(log)) {}

    ~ScriptedProducer() noexcept override { stop(); }

    void stop() override {
        if (component_thread_.joinable() && log_) {
            log_->record("stop:producer:" + name_);
        }
        AudioProducer::stop();
    }

    std::string type() const override { return "scripted"; }

    void set_fail_open(bool fail) { fail_open_ = fail; }
    void set_exhaust_at_end(bool exhaust) { exhaust_at_end_ = exhaust; }
    int open_calls() const { return open_calls_.load(); }

protected:
    bool open_source() override {
        ++open_calls_;
        if (log_) {
            log_->record("start:producer:" + name_);
        }
        return !fail_open_;
    }

    CaptureResult capture_frame(Frame& out) override {
        std::unique_lock<std::mutex> lock(script_mutex_);
        if (!script_.empty()) {
            out = std::move(script_.front());
            script_.pop_front();
            return CaptureResult::FrameReady;
        }
        lock.unlock();
        if (exhaust_at_end_) {
            return CaptureResult::Exhausted;
        }
        sleep_until(std::chrono::steady_clock::now() + std::chrono::milliseconds(5));
        return CaptureResult::NoData;
    }

    void close_source() override {}

private:
    std::mutex script_mutex_;
    std::deque<Frame> script_;
    std::shared_ptr<EventLog> log_;
    std::atomic<bool> fail_open_{false};
    std::atomic<bool> exhaust_at_end_{false};
    std::atomic<int> open_calls_{0};
};

/**
 * Consumer that keeps every frame it is handed.
 */
class RecordingConsumer : public AudioConsumer {
public:
    RecordingConsumer(std::string name, std::shared_ptr<EventLog> log = nullptr,
                      std::shared_ptr<NodeSettings> settings = std::make_shared<NodeSettings>())
        : AudioConsumer(std::move(name), std::move(settings)), log_(std::move(log)) {}

    ~RecordingConsumer() noexcept override { stop(); }

    std::string type() const override { return "recording"; }

    std::vector<Frame> frames() const {
        std::lock_guard<std::mutex> lock(frames_mutex_);
        return frames_;
    }

    std::size_t frame_count() const {
        std::lock_guard<std::mutex> lock(frames_mutex_);
        return frames_.size();
    }

    void set_fail_open(bool fail) { fail_open_ = fail; }
    void set_fail_writes(bool fail) { fail_writes_ = fail; }

protected:
    bool open_sink() override {
        if (log_) {
            log_->record("start:consumer:" + name_);
        }
        return !fail_open_;
    }

    bool write_frame(const Frame& frame, std::size_t& bytes_written) override {
        if (fail_writes_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(frames_mutex_);
        frames_.push_back(frame);
        bytes_written = frame.samples.size() * sizeof(int16_t);
        return true;
    }

    void close_sink() override {
        if (log_) {
            log_->record("stop:consumer:" + name_);
        }
    }

private:
    std::shared_ptr<EventLog> log_;
    mutable std::mutex frames_mutex_;
    std::vector<Frame> frames_;
    std::atomic<bool> fail_open_{false};
    std::atomic<bool> fail_writes_{false};
};

/**
 * Service that only records when it starts and stops.
 */
class RecordingService : public NodeService {
public:
    RecordingService(std::string name, std::shared_ptr<EventLog> log)
        : NodeService(std::move(name)), log_(std::move(log)) {}

    ~RecordingService() noexcept override { stop(); }

    bool start() override {
        if (is_running()) {
            return true;
        }
        log_->record("start:service:" + name_);
        return launch_thread();
    }

    void stop() override {
        if (!component_thread_.joinable()) {
            return;
        }
        log_->record("stop:service:" + name_);
        join_thread();
    }

    ServiceStatus status() const override {
        ServiceStatus status;
        status.name = name_;
        status.running = is_running();
        return status;
    }

    std::string type() const override { return "recording"; }

protected:
    void run() override {
        while (!wait_for_stop(std::chrono::milliseconds(10))) {
        }
    }

private:
    std::shared_ptr<EventLog> log_;
};

/**
 * Processor whose every call throws.
 */
class ThrowingProcessor : public AudioProcessor {
public:
    explicit ThrowingProcessor(std::string name) : AudioProcessor(std::move(name)) {}

    bool update_config(const SettingsMap&) override { return true; }
    std::string type() const override { return "throwing"; }

protected:
    bool process_frames(utils::AudioRingBuffer& input, utils::AudioRingBuffer&, std::size_t&) override {
        (void)input.pop();
        throw std::runtime_error("injected processing failure");
    }
};

/**
 * Factory that counts construction calls and delegates to the default factory.
 */
class CountingComponentFactory : public config::DefaultComponentFactory {
public:
    std::unique_ptr<AudioProducer> create_producer(const std::string& name,
                                                   const config::InputConfig& cfg,
                                                   std::shared_ptr<NodeSettings> settings) override {
        ++creations;
        return DefaultComponentFactory::create_producer(name, cfg, std::move(settings));
    }

    std::unique_ptr<AudioProcessor> create_processor(const std::string& name,
                                                     const config::ProcessorConfig& cfg,
                                                     const utils::BufferRegistry& registry) override {
        ++creations;
        return DefaultComponentFactory::create_processor(name, cfg, registry);
    }

    std::unique_ptr<AudioConsumer> create_consumer(const std::string& name,
                                                   const config::OutputConfig& cfg,
                                                   std::shared_ptr<NodeSettings> settings) override {
        ++creations;
        return DefaultComponentFactory::create_consumer(name, cfg, std::move(settings));
    }

    std::unique_ptr<NodeService> create_service(const std::string& name,
                                                const config::ServiceConfig& cfg,
                                                const std::string& buffer_name,
                                                std::shared_ptr<utils::AudioRingBuffer> buffer,
                                                std::shared_ptr<NodeSettings> settings) override {
        ++creations;
        return DefaultComponentFactory::create_service(name, cfg, buffer_name, std::move(buffer), std::move(settings));
    }

    std::atomic<int> creations{0};
};

} // namespace testing
} // namespace audio
} // namespace airlift
