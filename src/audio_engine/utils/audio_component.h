/**
 * @file audio_component.h
 * @brief Defines the AudioComponent abstract base class for threaded components.
 * @details Producers, consumers, flows and services each run one dedicated
 *          thread. This base standardizes their lifecycle (start, stop) and the
 *          cooperative stop flag their loops poll.
 */
#ifndef AIRLIFT_AUDIO_COMPONENT_H
#define AIRLIFT_AUDIO_COMPONENT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

namespace airlift {
namespace audio {

/**
 * @class AudioComponent
 * @brief Abstract base class for components that own a processing thread.
 * @details `start()` must be idempotent. `stop()` must block until the thread
 *          has exited so that no further buffer writes happen after it returns.
 */
class AudioComponent {
public:
    virtual ~AudioComponent() = default;

    AudioComponent(const AudioComponent&) = delete;
    AudioComponent& operator=(const AudioComponent&) = delete;
    AudioComponent(AudioComponent&&) = delete;
    AudioComponent& operator=(AudioComponent&&) = delete;

    /**
     * @brief Starts the component's processing thread.
     * @return true if the component is running afterwards.
     */
    virtual bool start() = 0;

    /**
     * @brief Signals the processing thread to stop and joins it.
     */
    virtual void stop() = 0;

    /**
     * @brief Checks if the component's thread is currently running.
     * @details Safe to call from any thread, including while `stop()` is joining.
     */
    bool is_running() const {
        return thread_active_ && !stop_flag_;
    }

    /** @brief The unique name of this component within its container. */
    const std::string& name() const { return name_; }

protected:
    explicit AudioComponent(std::string name)
        : name_(std::move(name)), stop_flag_(false), thread_active_(false) {}

    /**
     * @brief The main processing loop executed by the component's thread.
     * @details Implementations must check `stop_flag_` every iteration.
     */
    virtual void run() = 0;

    /**
     * @brief Launches `run()` on `component_thread_` unless it is already running.
     * @return false if the thread could not be created.
     */
    bool launch_thread();

    /**
     * @brief Sets the stop flag, wakes `wait_for_stop` sleepers and joins the thread.
     */
    void join_thread();

    /**
     * @brief Sleeps for at most `duration`, returning early when a stop is requested.
     * @return true if a stop was requested.
     */
    bool wait_for_stop(std::chrono::milliseconds duration);

    /** @brief true from a successful `launch_thread()` until `join_thread()` returns. */
    bool thread_launched() const { return thread_active_; }

    std::string name_;
    /** @brief The thread object for the component's processing loop. */
    std::thread component_thread_;
    /** @brief Signals the processing thread to stop. */
    std::atomic<bool> stop_flag_;

private:
    std::atomic<bool> thread_active_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

inline bool AudioComponent::launch_thread() {
    if (thread_active_) {
        return !stop_flag_;
    }
    stop_flag_ = false;
    try {
        component_thread_ = std::thread(&AudioComponent::run, this);
    } catch (const std::system_error&) {
        stop_flag_ = true;
        return false;
    }
    thread_active_ = true;
    return true;
}

inline void AudioComponent::join_thread() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_flag_ = true;
    }
    wake_cv_.notify_all();
    if (component_thread_.joinable()) {
        component_thread_.join();
    }
    thread_active_ = false;
}

inline bool AudioComponent::wait_for_stop(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return wake_cv_.wait_for(lock, duration, [this] { return stop_flag_.load(); });
}

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_COMPONENT_H
