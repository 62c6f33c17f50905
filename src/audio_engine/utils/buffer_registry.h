/**
 * @file buffer_registry.h
 * @brief Name-to-buffer directory shared by the node, flows and mixers.
 */
#ifndef AIRLIFT_BUFFER_REGISTRY_H
#define AIRLIFT_BUFFER_REGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "audio_ring_buffer.h"

namespace airlift {
namespace audio {
namespace utils {

/**
 * @class BufferRegistry
 * @brief Thread-safe map from names to shared ring buffers.
 * @details Holding a buffer in the registry keeps it alive; removing it only drops
 *          the registry's reference.
 */
class BufferRegistry {
public:
    BufferRegistry() = default;

    BufferRegistry(const BufferRegistry&) = delete;
    BufferRegistry& operator=(const BufferRegistry&) = delete;

    /**
     * @brief Registers a buffer under a new name.
     * @return false if the name is empty, the buffer is null or the name is taken.
     */
    bool register_buffer(const std::string& name, std::shared_ptr<AudioRingBuffer> buffer);

    /** @brief Registers or replaces the buffer under `name`. */
    bool update(const std::string& name, std::shared_ptr<AudioRingBuffer> buffer);

    /** @return The buffer, or nullptr when `name` is unknown. */
    std::shared_ptr<AudioRingBuffer> get(const std::string& name) const;

    /** @return false if `name` was not registered. */
    bool remove(const std::string& name);

    /** @brief All registered names in sorted order. */
    std::vector<std::string> list() const;

    bool exists(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<AudioRingBuffer>> buffers_;
};

} // namespace utils
} // namespace audio
} // namespace airlift

#endif // AIRLIFT_BUFFER_REGISTRY_H
