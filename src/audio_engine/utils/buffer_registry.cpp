#include "buffer_registry.h"
#include "cpp_logger.h"

namespace airlift {
namespace audio {
namespace utils {

bool BufferRegistry::register_buffer(const std::string& name, std::shared_ptr<AudioRingBuffer> buffer) {
    if (name.empty() || !buffer) {
        LOG_CPP_ERROR("[BufferRegistry] Refusing to register an unnamed or null buffer.");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = buffers_.emplace(name, std::move(buffer));
    if (!result.second) {
        LOG_CPP_ERROR("[BufferRegistry] Buffer '%s' already registered.", name.c_str());
        return false;
    }
    LOG_CPP_DEBUG("[BufferRegistry] Registered buffer '%s'.", name.c_str());
    return true;
}

bool BufferRegistry::update(const std::string& name, std::shared_ptr<AudioRingBuffer> buffer) {
    if (name.empty() || !buffer) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    buffers_[name] = std::move(buffer);
    LOG_CPP_DEBUG("[BufferRegistry] Updated buffer '%s'.", name.c_str());
    return true;
}

std::shared_ptr<AudioRingBuffer> BufferRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(name);
    return it != buffers_.end() ? it->second : nullptr;
}

bool BufferRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffers_.erase(name) == 0) {
        LOG_CPP_WARNING("[BufferRegistry] Cannot remove unknown buffer '%s'.", name.c_str());
        return false;
    }
    LOG_CPP_DEBUG("[BufferRegistry] Removed buffer '%s'.", name.c_str());
    return true;
}

std::vector<std::string> BufferRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(buffers_.size());
    for (const auto& entry : buffers_) {
        names.push_back(entry.first);
    }
    return names;
}

bool BufferRegistry::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_.count(name) > 0;
}

} // namespace utils
} // namespace audio
} // namespace airlift
