/**
 * @file flow.h
 * @brief Defines the Flow, an ordered processor chain with its own thread.
 * @details A Flow merges its input buffers into a primary buffer, runs each
 *          processor stage into that stage's own ring buffer, and fans the last
 *          buffer out to its consumers. Topology changes are only accepted while
 *          the Flow is stopped.
 */
#ifndef AIRLIFT_FLOW_H
#define AIRLIFT_FLOW_H

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "../audio_types.h"
#include "../configuration/node_settings.h"
#include "../consumers/audio_consumer.h"
#include "../processors/audio_processor.h"
#include "../utils/audio_component.h"
#include "../utils/audio_ring_buffer.h"
#include "../utils/buffer_registry.h"

namespace airlift {
namespace audio {

/**
 * @class Flow
 * @brief Owns a processor chain, its intermediate buffers and its consumers.
 * @details With n processors the Flow owns n stage buffers. Stage i reads from
 *          stage i-1's buffer (the primary input buffer for i == 0) and writes to
 *          its own. The last stage buffer is the public output buffer; with no
 *          processors the primary input buffer is the output buffer.
 */
class Flow : public AudioComponent {
public:
    Flow(std::string name, std::shared_ptr<NodeSettings> settings);
    ~Flow() noexcept override;

    /**
     * @brief Appends a processor stage and creates its output buffer.
     * @return false while running or if `processor` is null or its name is taken.
     */
    bool add_processor(std::unique_ptr<AudioProcessor> processor);

    /**
     * @brief Connects an input buffer. Inputs are drained in connection order.
     * @details The Flow registers itself as a reader of `buffer`, so the same
     *          buffer can feed other Flows and mixers as well.
     * @return false while running, on a null buffer or a duplicate name.
     */
    bool add_input_buffer(const std::string& input_name, std::shared_ptr<utils::AudioRingBuffer> buffer);

    /** @return false while running or if `input_name` is not connected. */
    bool remove_input_buffer(const std::string& input_name);

    /**
     * @brief Connects the registry buffer named `buffer_name` as an input of the same name.
     * @return false if the buffer is not registered or `add_input_buffer` fails.
     */
    bool connect_input_from_registry(const utils::BufferRegistry& registry, const std::string& buffer_name);

    /**
     * @brief Attaches a consumer to a private tap of the output buffer.
     * @return false while running or if `consumer` is null or its name is taken.
     */
    bool add_consumer(std::unique_ptr<AudioConsumer> consumer);

    /** @return The processor named `processor_name`, or nullptr. */
    AudioProcessor* find_processor(const std::string& processor_name);

    /**
     * @brief Forwards a configuration patch to one processor. Allowed while running.
     * @return false if the processor is unknown or rejects the patch.
     */
    bool update_processor_config(const std::string& processor_name, const SettingsMap& patch);

    /**
     * @brief Starts consumers, then the processing thread. A no-op success when running.
     * @details A consumer that fails to start is logged and left stopped.
     */
    bool start() override;

    /** @brief Joins the processing thread, then stops consumers. */
    void stop() override;

    /**
     * @brief Performs exactly one tick on the calling thread.
     * @details Merges inputs, runs every stage once and feeds consumer taps.
     */
    void run_once();

    FlowStatus status() const;

    std::shared_ptr<utils::AudioRingBuffer> primary_input_buffer() const { return primary_input_; }
    std::shared_ptr<utils::AudioRingBuffer> output_buffer() const;

    std::size_t processor_count() const;
    std::size_t consumer_count() const;
    std::size_t input_count() const;

protected:
    void run() override;

private:
    struct InputSlot {
        std::string name;
        std::shared_ptr<utils::AudioRingBuffer> buffer;
        utils::AudioRingBuffer::ReaderId reader;
    };

    struct ConsumerSlot {
        std::unique_ptr<AudioConsumer> consumer;
        std::shared_ptr<utils::AudioRingBuffer> tap;
    };

    bool has_work_source() const;
    std::shared_ptr<utils::AudioRingBuffer> output_buffer_locked() const;

    std::shared_ptr<NodeSettings> settings_;
    const std::size_t buffer_capacity_;

    mutable std::mutex topology_mutex_;
    std::shared_ptr<utils::AudioRingBuffer> primary_input_;
    std::vector<InputSlot> inputs_;
    std::vector<std::unique_ptr<AudioProcessor>> processors_;
    std::vector<std::shared_ptr<utils::AudioRingBuffer>> stage_buffers_;
    std::vector<ConsumerSlot> consumers_;
};

} // namespace audio
} // namespace airlift

#endif // AIRLIFT_FLOW_H
