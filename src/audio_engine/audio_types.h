/**
 * @file audio_types.h
 * @brief Core data structures shared across the airlift pipeline engine.
 * @details Defines the Frame value type moved between components and the plain
 *          status snapshots polled by the monitoring layer. Also contains the
 *          pybind11 bindings for these types.
 */
#ifndef AIRLIFT_AUDIO_TYPES_H
#define AIRLIFT_AUDIO_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "audio_constants.h"

namespace airlift {
namespace audio {

/** @brief Current wall-clock time in UTC nanoseconds. */
inline uint64_t utc_ns_now() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

/**
 * @brief Number of interleaved samples in one 100 ms quantum for a format.
 */
inline std::size_t quantum_samples(int sample_rate, int channels) {
    if (sample_rate <= 0 || channels <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(sample_rate / FRAME_QUANTUM_DIVISOR) * static_cast<std::size_t>(channels);
}

/**
 * @struct Frame
 * @brief A timestamped chunk of interleaved signed 16-bit PCM.
 * @details Frames are moved, not shared. A component that alters samples owns
 *          the Frame it popped and pushes its own copy downstream.
 */
struct Frame {
    /** @brief Capture time in UTC nanoseconds. */
    uint64_t captured_at_ns = 0;
    /** @brief Interleaved samples; size is a multiple of `channels`. */
    std::vector<int16_t> samples;
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;

    bool is_well_formed() const {
        return channels > 0 && channels <= MAX_CHANNELS &&
               (samples.size() % static_cast<std::size_t>(channels)) == 0;
    }

    /** @brief Frames per channel carried by this chunk. */
    std::size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<std::size_t>(channels) : 0;
    }
};

/** @brief Builds a zeroed 100 ms Frame stamped with the current time. */
inline Frame make_silence_frame(int sample_rate, int channels) {
    Frame frame;
    frame.captured_at_ns = utc_ns_now();
    frame.sample_rate = sample_rate;
    frame.channels = channels;
    frame.samples.assign(quantum_samples(sample_rate, channels), 0);
    return frame;
}

/** @brief Saturates a wide intermediate value into the int16 range. */
inline int16_t clamp_sample(int32_t value) {
    if (value > SAMPLE_MAX) return SAMPLE_MAX;
    if (value < SAMPLE_MIN) return SAMPLE_MIN;
    return static_cast<int16_t>(value);
}

/** @brief Saturates a floating point sample value into the int16 range. */
inline int16_t clamp_sample(float value) {
    if (value >= static_cast<float>(SAMPLE_MAX)) return SAMPLE_MAX;
    if (value <= static_cast<float>(SAMPLE_MIN)) return SAMPLE_MIN;
    return static_cast<int16_t>(value);
}

// --- Status snapshots ---

/**
 * @struct RingBufferStats
 * @brief Occupancy and overflow information for one ring buffer.
 */
struct RingBufferStats {
    std::size_t capacity = 0;
    std::size_t current_depth = 0;
    /** @brief Frames evicted by drop-oldest since creation. */
    uint64_t dropped_frames = 0;
    std::optional<uint64_t> oldest_timestamp_ns;
    std::optional<uint64_t> newest_timestamp_ns;
};

struct ProducerStatus {
    std::string name;
    bool running = false;
    /** @brief False while the producer is emitting fallback silence. */
    bool connected = false;
    uint64_t samples_processed = 0;
    uint64_t errors = 0;
    std::optional<RingBufferStats> buffer_stats;
};

struct ProcessorStatus {
    std::string name;
    bool running = false;
    /** @brief Frames per second processed since the owning flow started. */
    double processing_rate = 0.0;
    /** @brief Smoothed duration of one `process` call in milliseconds. */
    double latency_estimate_ms = 0.0;
    uint64_t frames_processed = 0;
    uint64_t errors = 0;
};

struct ConsumerStatus {
    std::string name;
    bool running = false;
    bool connected = false;
    uint64_t frames_processed = 0;
    uint64_t bytes_written = 0;
    uint64_t errors = 0;
};

struct FlowStatus {
    std::string name;
    bool running = false;
    std::vector<ProcessorStatus> processor_statuses;
    std::vector<ConsumerStatus> consumer_statuses;
    std::vector<std::size_t> input_buffer_levels;
    std::vector<std::size_t> processor_buffer_levels;
    std::size_t output_buffer_level = 0;
};

struct ServiceStatus {
    std::string name;
    bool running = false;
    uint64_t reports_emitted = 0;
};

struct NodeStatus {
    bool running = false;
    uint64_t uptime_seconds = 0;
    std::size_t producer_count = 0;
    std::size_t flow_count = 0;
    std::size_t service_count = 0;
    std::vector<ProducerStatus> producer_statuses;
    std::vector<FlowStatus> flow_statuses;
    std::vector<ServiceStatus> service_statuses;
};

/**
 * @brief Binds the Frame and status types to a Python module.
 * @param m The pybind11 module.
 */
inline void bind_audio_types(pybind11::module_ &m) {
    namespace py = pybind11;

    py::class_<Frame>(m, "Frame", "Timestamped chunk of interleaved 16-bit PCM")
        .def(py::init<>())
        .def_readwrite("captured_at_ns", &Frame::captured_at_ns)
        .def_readwrite("samples", &Frame::samples)
        .def_readwrite("sample_rate", &Frame::sample_rate)
        .def_readwrite("channels", &Frame::channels)
        .def("is_well_formed", &Frame::is_well_formed);

    py::class_<RingBufferStats>(m, "RingBufferStats", "Occupancy and overflow counters of a ring buffer")
        .def(py::init<>())
        .def_readonly("capacity", &RingBufferStats::capacity)
        .def_readonly("current_depth", &RingBufferStats::current_depth)
        .def_readonly("dropped_frames", &RingBufferStats::dropped_frames)
        .def_readonly("oldest_timestamp_ns", &RingBufferStats::oldest_timestamp_ns)
        .def_readonly("newest_timestamp_ns", &RingBufferStats::newest_timestamp_ns);

    py::class_<ProducerStatus>(m, "ProducerStatus")
        .def(py::init<>())
        .def_readonly("name", &ProducerStatus::name)
        .def_readonly("running", &ProducerStatus::running)
        .def_readonly("connected", &ProducerStatus::connected)
        .def_readonly("samples_processed", &ProducerStatus::samples_processed)
        .def_readonly("errors", &ProducerStatus::errors)
        .def_readonly("buffer_stats", &ProducerStatus::buffer_stats);

    py::class_<ProcessorStatus>(m, "ProcessorStatus")
        .def(py::init<>())
        .def_readonly("name", &ProcessorStatus::name)
        .def_readonly("running", &ProcessorStatus::running)
        .def_readonly("processing_rate", &ProcessorStatus::processing_rate)
        .def_readonly("latency_estimate_ms", &ProcessorStatus::latency_estimate_ms)
        .def_readonly("frames_processed", &ProcessorStatus::frames_processed)
        .def_readonly("errors", &ProcessorStatus::errors);

    py::class_<ConsumerStatus>(m, "ConsumerStatus")
        .def(py::init<>())
        .def_readonly("name", &ConsumerStatus::name)
        .def_readonly("running", &ConsumerStatus::running)
        .def_readonly("connected", &ConsumerStatus::connected)
        .def_readonly("frames_processed", &ConsumerStatus::frames_processed)
        .def_readonly("bytes_written", &ConsumerStatus::bytes_written)
        .def_readonly("errors", &ConsumerStatus::errors);

    py::class_<FlowStatus>(m, "FlowStatus")
        .def(py::init<>())
        .def_readonly("name", &FlowStatus::name)
        .def_readonly("running", &FlowStatus::running)
        .def_readonly("processor_statuses", &FlowStatus::processor_statuses)
        .def_readonly("consumer_statuses", &FlowStatus::consumer_statuses)
        .def_readonly("input_buffer_levels", &FlowStatus::input_buffer_levels)
        .def_readonly("processor_buffer_levels", &FlowStatus::processor_buffer_levels)
        .def_readonly("output_buffer_level", &FlowStatus::output_buffer_level);

    py::class_<ServiceStatus>(m, "ServiceStatus")
        .def(py::init<>())
        .def_readonly("name", &ServiceStatus::name)
        .def_readonly("running", &ServiceStatus::running)
        .def_readonly("reports_emitted", &ServiceStatus::reports_emitted);

    py::class_<NodeStatus>(m, "NodeStatus", "Aggregated status of the node and everything it owns")
        .def(py::init<>())
        .def_readonly("running", &NodeStatus::running)
        .def_readonly("uptime_seconds", &NodeStatus::uptime_seconds)
        .def_readonly("producer_count", &NodeStatus::producer_count)
        .def_readonly("flow_count", &NodeStatus::flow_count)
        .def_readonly("service_count", &NodeStatus::service_count)
        .def_readonly("producer_statuses", &NodeStatus::producer_statuses)
        .def_readonly("flow_statuses", &NodeStatus::flow_statuses)
        .def_readonly("service_statuses", &NodeStatus::service_statuses);
}

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_AUDIO_TYPES_H
