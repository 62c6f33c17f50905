/**
 * @file component_factory.h
 * @brief Construction seam between the GraphResolver and the concrete components.
 */
#ifndef AIRLIFT_COMPONENT_FACTORY_H
#define AIRLIFT_COMPONENT_FACTORY_H

#include <memory>
#include <string>

#include "node_settings.h"
#include "topology_types.h"
#include "../consumers/audio_consumer.h"
#include "../processors/audio_processor.h"
#include "../producers/audio_producer.h"
#include "../services/buffer_monitor_service.h"
#include "../utils/buffer_registry.h"

namespace airlift {
namespace config {

/**
 * @class ComponentFactory
 * @brief Knows which component types exist and how to build them from settings.
 * @details The `supports_*` queries are used during validation, before anything
 *          is built. `create_*` returns nullptr when construction fails.
 */
class ComponentFactory {
public:
    virtual ~ComponentFactory() = default;

    virtual bool supports_input_type(const std::string& type) const = 0;
    virtual bool supports_processor_type(const std::string& type) const = 0;
    virtual bool supports_output_type(const std::string& type) const = 0;
    virtual bool supports_service_type(const std::string& type) const = 0;

    /** @return true if outputs of `output_type` can carry `codec_id`. */
    virtual bool supports_codec(const std::string& output_type, const std::string& codec_id) const = 0;

    virtual std::unique_ptr<audio::AudioProducer> create_producer(
        const std::string& name,
        const InputConfig& config,
        std::shared_ptr<audio::NodeSettings> settings) = 0;

    /**
     * @param registry Buffers available to processors with private inputs.
     */
    virtual std::unique_ptr<audio::AudioProcessor> create_processor(
        const std::string& name,
        const ProcessorConfig& config,
        const audio::utils::BufferRegistry& registry) = 0;

    virtual std::unique_ptr<audio::AudioConsumer> create_consumer(
        const std::string& name,
        const OutputConfig& config,
        std::shared_ptr<audio::NodeSettings> settings) = 0;

    /**
     * @param buffer_name Name of the buffer the service observes.
     * @param buffer The resolved buffer.
     */
    virtual std::unique_ptr<audio::NodeService> create_service(
        const std::string& name,
        const ServiceConfig& config,
        const std::string& buffer_name,
        std::shared_ptr<audio::utils::AudioRingBuffer> buffer,
        std::shared_ptr<audio::NodeSettings> settings) = 0;
};

/**
 * @class DefaultComponentFactory
 * @brief Builds the built-in component types.
 * @details Inputs: `sine`, `wav_file`, `alsa`. Processors: `passthrough`, `gain`,
 *          `mixer`. Outputs: `wav_file` and `udp` (codec `pcm_s16le`), `mp3_file`
 *          (codec `mp3`). Services: `buffer_monitor`.
 */
class DefaultComponentFactory : public ComponentFactory {
public:
    bool supports_input_type(const std::string& type) const override;
    bool supports_processor_type(const std::string& type) const override;
    bool supports_output_type(const std::string& type) const override;
    bool supports_service_type(const std::string& type) const override;
    bool supports_codec(const std::string& output_type, const std::string& codec_id) const override;

    std::unique_ptr<audio::AudioProducer> create_producer(
        const std::string& name,
        const InputConfig& config,
        std::shared_ptr<audio::NodeSettings> settings) override;

    std::unique_ptr<audio::AudioProcessor> create_processor(
        const std::string& name,
        const ProcessorConfig& config,
        const audio::utils::BufferRegistry& registry) override;

    std::unique_ptr<audio::AudioConsumer> create_consumer(
        const std::string& name,
        const OutputConfig& config,
        std::shared_ptr<audio::NodeSettings> settings) override;

    std::unique_ptr<audio::NodeService> create_service(
        const std::string& name,
        const ServiceConfig& config,
        const std::string& buffer_name,
        std::shared_ptr<audio::utils::AudioRingBuffer> buffer,
        std::shared_ptr<audio::NodeSettings> settings) override;
};

} // namespace config
} // namespace airlift

#endif // AIRLIFT_COMPONENT_FACTORY_H
