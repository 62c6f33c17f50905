#include "audio_node.h"

#include "../utils/cpp_logger.h"

#include <algorithm>

namespace airlift {
namespace audio {

std::string producer_buffer_name(const std::string& producer_name) {
    return "producer:" + producer_name;
}

AudioNode::AudioNode(std::string name, std::shared_ptr<NodeSettings> settings)
    : name_(std::move(name)),
      settings_(settings ? std::move(settings) : std::make_shared<NodeSettings>()) {}

AudioNode::~AudioNode() {
    stop();
}

bool AudioNode::add_ring_buffer(const std::string& buffer_name, std::size_t slots) {
    if (running_) {
        LOG_CPP_ERROR("[AudioNode:%s] Cannot add ring buffer '%s' while running.", name_.c_str(), buffer_name.c_str());
        return false;
    }
    const std::size_t capacity = slots > 0 ? slots : resolve_ring_buffer_capacity(settings_);
    return registry_.register_buffer(buffer_name, std::make_shared<utils::AudioRingBuffer>(capacity));
}

bool AudioNode::add_producer(std::unique_ptr<AudioProducer> producer, const std::string& buffer_name) {
    if (!producer) {
        LOG_CPP_ERROR("[AudioNode:%s] Cannot add a null producer.", name_.c_str());
        return false;
    }
    if (running_) {
        LOG_CPP_ERROR("[AudioNode:%s] Cannot add producer '%s' while running.", name_.c_str(), producer->name().c_str());
        return false;
    }
    if (find_producer(producer->name())) {
        LOG_CPP_ERROR("[AudioNode:%s] Producer '%s' already exists.", name_.c_str(), producer->name().c_str());
        return false;
    }

    std::shared_ptr<utils::AudioRingBuffer> buffer;
    if (buffer_name.empty()) {
        buffer = std::make_shared<utils::AudioRingBuffer>(resolve_ring_buffer_capacity(settings_));
    } else {
        buffer = registry_.get(buffer_name);
        if (!buffer) {
            LOG_CPP_ERROR("[AudioNode:%s] Producer '%s' references unknown buffer '%s'.",
                          name_.c_str(), producer->name().c_str(), buffer_name.c_str());
            return false;
        }
    }

    const std::string alias = producer_buffer_name(producer->name());
    if (!registry_.register_buffer(alias, buffer)) {
        return false;
    }
    if (!producer->attach_output_buffer(buffer)) {
        if (!registry_.remove(alias)) {
            LOG_CPP_WARNING("[AudioNode:%s] Failed to roll back registration of '%s'.", name_.c_str(), alias.c_str());
        }
        return false;
    }

    LOG_CPP_INFO("[AudioNode:%s] Added %s producer '%s' writing to '%s'.", name_.c_str(),
                 producer->type().c_str(), producer->name().c_str(),
                 buffer_name.empty() ? alias.c_str() : buffer_name.c_str());
    std::lock_guard<std::mutex> lock(components_mutex_);
    producers_.push_back(std::move(producer));
    return true;
}

bool AudioNode::add_flow(std::unique_ptr<Flow> flow) {
    if (!flow) {
        LOG_CPP_ERROR("[AudioNode:%s] Cannot add a null flow.", name_.c_str());
        return false;
    }
    if (running_) {
        LOG_CPP_ERROR("[AudioNode:%s] Cannot add flow '%s' while running.", name_.c_str(), flow->name().c_str());
        return false;
    }
    if (find_flow(flow->name())) {
        LOG_CPP_ERROR("[AudioNode:%s] Flow '%s' already exists.", name_.c_str(), flow->name().c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(components_mutex_);
    flows_.push_back(std::move(flow));
    return true;
}

bool AudioNode::add_service(std::unique_ptr<NodeService> service) {
    if (!service) {
        LOG_CPP_ERROR("[AudioNode:%s] Cannot add a null service.", name_.c_str());
        return false;
    }
    if (running_) {
        LOG_CPP_ERROR("[AudioNode:%s] Cannot add service '%s' while running.", name_.c_str(), service->name().c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(components_mutex_);
    for (const auto& existing : services_) {
        if (existing->name() == service->name()) {
            LOG_CPP_ERROR("[AudioNode:%s] Service '%s' already exists.", name_.c_str(), service->name().c_str());
            return false;
        }
    }
    services_.push_back(std::move(service));
    return true;
}

bool AudioNode::start() {
    if (running_) {
        return true;
    }
    LOG_CPP_INFO("[AudioNode:%s] Starting...", name_.c_str());
    bool all_started = true;

    std::lock_guard<std::mutex> lock(components_mutex_);
    for (auto& producer : producers_) {
        if (!producer->start()) {
            LOG_CPP_ERROR("[AudioNode:%s] Producer '%s' failed to start.", name_.c_str(), producer->name().c_str());
            all_started = false;
        }
    }
    for (auto& flow : flows_) {
        if (!flow->start()) {
            LOG_CPP_ERROR("[AudioNode:%s] Flow '%s' failed to start.", name_.c_str(), flow->name().c_str());
            all_started = false;
        }
    }
    for (auto& service : services_) {
        if (!service->start()) {
            LOG_CPP_ERROR("[AudioNode:%s] Service '%s' failed to start.", name_.c_str(), service->name().c_str());
            all_started = false;
        }
    }

    started_at_ = std::chrono::steady_clock::now();
    running_ = true;
    LOG_CPP_INFO("[AudioNode:%s] Running (%zu producers, %zu flows, %zu services).",
                 name_.c_str(), producers_.size(), flows_.size(), services_.size());
    return all_started;
}

void AudioNode::stop() {
    if (!running_) {
        return;
    }
    LOG_CPP_INFO("[AudioNode:%s] Stopping...", name_.c_str());
    std::lock_guard<std::mutex> lock(components_mutex_);
    for (auto& service : services_) {
        service->stop();
    }
    for (auto& flow : flows_) {
        flow->stop();
    }
    for (auto& producer : producers_) {
        producer->stop();
    }
    running_ = false;
    LOG_CPP_INFO("[AudioNode:%s] Stopped.", name_.c_str());
}

NodeStatus AudioNode::status() const {
    NodeStatus status;
    status.running = running_.load();
    if (status.running) {
        status.uptime_seconds = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count());
    }

    std::lock_guard<std::mutex> lock(components_mutex_);
    status.producer_count = producers_.size();
    status.flow_count = flows_.size();
    status.service_count = services_.size();
    for (const auto& producer : producers_) {
        status.producer_statuses.push_back(producer->status());
    }
    for (const auto& flow : flows_) {
        status.flow_statuses.push_back(flow->status());
    }
    for (const auto& service : services_) {
        status.service_statuses.push_back(service->status());
    }
    return status;
}

bool AudioNode::update_processor_config(const std::string& flow_name,
                                        const std::string& processor_name,
                                        const SettingsMap& patch) {
    Flow* flow = find_flow(flow_name);
    if (!flow) {
        LOG_CPP_WARNING("[AudioNode:%s] Config update for unknown flow '%s'.", name_.c_str(), flow_name.c_str());
        return false;
    }
    return flow->update_processor_config(processor_name, patch);
}

Flow* AudioNode::find_flow(const std::string& flow_name) const {
    std::lock_guard<std::mutex> lock(components_mutex_);
    auto it = std::find_if(flows_.begin(), flows_.end(),
                           [&](const auto& flow) { return flow->name() == flow_name; });
    return it != flows_.end() ? it->get() : nullptr;
}

AudioProducer* AudioNode::find_producer(const std::string& producer_name) const {
    std::lock_guard<std::mutex> lock(components_mutex_);
    auto it = std::find_if(producers_.begin(), producers_.end(),
                           [&](const auto& producer) { return producer->name() == producer_name; });
    return it != producers_.end() ? it->get() : nullptr;
}

std::vector<std::string> AudioNode::flow_names() const {
    std::lock_guard<std::mutex> lock(components_mutex_);
    std::vector<std::string> names;
    for (const auto& flow : flows_) {
        names.push_back(flow->name());
    }
    return names;
}

std::vector<std::string> AudioNode::producer_names() const {
    std::lock_guard<std::mutex> lock(components_mutex_);
    std::vector<std::string> names;
    for (const auto& producer : producers_) {
        names.push_back(producer->name());
    }
    return names;
}

} // namespace audio
} // namespace airlift
