#include "flow.h"

#include "../utils/cpp_logger.h"

#include <algorithm>

namespace airlift {
namespace audio {

Flow::Flow(std::string name, std::shared_ptr<NodeSettings> settings)
    : AudioComponent(std::move(name)),
      settings_(std::move(settings)),
      buffer_capacity_(resolve_ring_buffer_capacity(settings_)),
      primary_input_(std::make_shared<utils::AudioRingBuffer>(buffer_capacity_)) {}

Flow::~Flow() noexcept {
    stop();
    for (auto& input : inputs_) {
        input.buffer->remove_reader(input.reader);
    }
}

bool Flow::add_processor(std::unique_ptr<AudioProcessor> processor) {
    if (!processor) {
        LOG_CPP_ERROR("[Flow:%s] Cannot add a null processor.", name_.c_str());
        return false;
    }
    if (is_running()) {
        LOG_CPP_ERROR("[Flow:%s] Cannot add processor '%s' while running.", name_.c_str(), processor->name().c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(topology_mutex_);
    for (const auto& existing : processors_) {
        if (existing->name() == processor->name()) {
            LOG_CPP_ERROR("[Flow:%s] Processor '%s' already present.", name_.c_str(), processor->name().c_str());
            return false;
        }
    }
    LOG_CPP_INFO("[Flow:%s] Added %s processor '%s' as stage %zu.", name_.c_str(),
                 processor->type().c_str(), processor->name().c_str(), processors_.size());
    processors_.push_back(std::move(processor));
    stage_buffers_.push_back(std::make_shared<utils::AudioRingBuffer>(buffer_capacity_));
    return true;
}

bool Flow::add_input_buffer(const std::string& input_name, std::shared_ptr<utils::AudioRingBuffer> buffer) {
    if (!buffer || input_name.empty()) {
        LOG_CPP_ERROR("[Flow:%s] Cannot connect an unnamed or null input buffer.", name_.c_str());
        return false;
    }
    if (is_running()) {
        LOG_CPP_ERROR("[Flow:%s] Cannot connect input '%s' while running.", name_.c_str(), input_name.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(topology_mutex_);
    for (const auto& input : inputs_) {
        if (input.name == input_name) {
            LOG_CPP_ERROR("[Flow:%s] Input '%s' already connected.", name_.c_str(), input_name.c_str());
            return false;
        }
    }
    const auto reader = buffer->add_reader("flow:" + name_ + ":" + input_name);
    inputs_.push_back(InputSlot{input_name, std::move(buffer), reader});
    LOG_CPP_INFO("[Flow:%s] Connected input '%s'.", name_.c_str(), input_name.c_str());
    return true;
}

bool Flow::remove_input_buffer(const std::string& input_name) {
    if (is_running()) {
        LOG_CPP_ERROR("[Flow:%s] Cannot disconnect input '%s' while running.", name_.c_str(), input_name.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(topology_mutex_);
    auto it = std::find_if(inputs_.begin(), inputs_.end(),
                           [&](const InputSlot& input) { return input.name == input_name; });
    if (it == inputs_.end()) {
        LOG_CPP_WARNING("[Flow:%s] Cannot disconnect unknown input '%s'.", name_.c_str(), input_name.c_str());
        return false;
    }
    it->buffer->remove_reader(it->reader);
    inputs_.erase(it);
    LOG_CPP_INFO("[Flow:%s] Disconnected input '%s'.", name_.c_str(), input_name.c_str());
    return true;
}

bool Flow::connect_input_from_registry(const utils::BufferRegistry& registry, const std::string& buffer_name) {
    auto buffer = registry.get(buffer_name);
    if (!buffer) {
        LOG_CPP_ERROR("[Flow:%s] Buffer '%s' not found in registry.", name_.c_str(), buffer_name.c_str());
        return false;
    }
    return add_input_buffer(buffer_name, std::move(buffer));
}

bool Flow::add_consumer(std::unique_ptr<AudioConsumer> consumer) {
    if (!consumer) {
        LOG_CPP_ERROR("[Flow:%s] Cannot add a null consumer.", name_.c_str());
        return false;
    }
    if (is_running()) {
        LOG_CPP_ERROR("[Flow:%s] Cannot add consumer '%s' while running.", name_.c_str(), consumer->name().c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(topology_mutex_);
    for (const auto& slot : consumers_) {
        if (slot.consumer->name() == consumer->name()) {
            LOG_CPP_ERROR("[Flow:%s] Consumer '%s' already present.", name_.c_str(), consumer->name().c_str());
            return false;
        }
    }
    auto tap = std::make_shared<utils::AudioRingBuffer>(buffer_capacity_);
    if (!consumer->attach_input_buffer(tap)) {
        return false;
    }
    LOG_CPP_INFO("[Flow:%s] Added %s consumer '%s'.", name_.c_str(), consumer->type().c_str(), consumer->name().c_str());
    consumers_.push_back(ConsumerSlot{std::move(consumer), std::move(tap)});
    return true;
}

AudioProcessor* Flow::find_processor(const std::string& processor_name) {
    std::lock_guard<std::mutex> lock(topology_mutex_);
    for (auto& processor : processors_) {
        if (processor->name() == processor_name) {
            return processor.get();
        }
    }
    return nullptr;
}

bool Flow::update_processor_config(const std::string& processor_name, const SettingsMap& patch) {
    AudioProcessor* processor = find_processor(processor_name);
    if (!processor) {
        LOG_CPP_WARNING("[Flow:%s] Config update for unknown processor '%s'.", name_.c_str(), processor_name.c_str());
        return false;
    }
    return processor->update_config(patch);
}

bool Flow::start() {
    if (is_running()) {
        return true;
    }
    LOG_CPP_INFO("[Flow:%s] Starting...", name_.c_str());
    {
        std::lock_guard<std::mutex> lock(topology_mutex_);
        for (auto& processor : processors_) {
            processor->set_running(true);
        }
        for (auto& slot : consumers_) {
            if (!slot.consumer->start()) {
                LOG_CPP_WARNING("[Flow:%s] Consumer '%s' failed to start; continuing without it.",
                                name_.c_str(), slot.consumer->name().c_str());
            }
        }
    }
    if (!launch_thread()) {
        LOG_CPP_ERROR("[Flow:%s] Failed to launch processing thread.", name_.c_str());
        std::lock_guard<std::mutex> lock(topology_mutex_);
        for (auto& slot : consumers_) {
            slot.consumer->stop();
        }
        for (auto& processor : processors_) {
            processor->set_running(false);
        }
        return false;
    }
    LOG_CPP_INFO("[Flow:%s] Started with %zu inputs, %zu processors, %zu consumers.",
                 name_.c_str(), input_count(), processor_count(), consumer_count());
    return true;
}

void Flow::stop() {
    if (!thread_launched()) {
        return;
    }
    LOG_CPP_INFO("[Flow:%s] Stopping...", name_.c_str());
    join_thread();

    std::lock_guard<std::mutex> lock(topology_mutex_);
    for (auto& slot : consumers_) {
        slot.consumer->stop();
    }
    for (auto& processor : processors_) {
        processor->set_running(false);
    }
    LOG_CPP_INFO("[Flow:%s] Stopped.", name_.c_str());
}

std::shared_ptr<utils::AudioRingBuffer> Flow::output_buffer_locked() const {
    return stage_buffers_.empty() ? primary_input_ : stage_buffers_.back();
}

std::shared_ptr<utils::AudioRingBuffer> Flow::output_buffer() const {
    std::lock_guard<std::mutex> lock(topology_mutex_);
    return output_buffer_locked();
}

bool Flow::has_work_source() const {
    std::lock_guard<std::mutex> lock(topology_mutex_);
    if (!inputs_.empty()) {
        return true;
    }
    return std::any_of(processors_.begin(), processors_.end(),
                       [](const std::unique_ptr<AudioProcessor>& processor) { return processor->has_private_inputs(); });
}

void Flow::run_once() {
    std::lock_guard<std::mutex> lock(topology_mutex_);

    for (auto& input : inputs_) {
        while (auto frame = input.buffer->pop(input.reader)) {
            primary_input_->push(std::move(*frame));
        }
    }

    for (std::size_t i = 0; i < processors_.size(); ++i) {
        utils::AudioRingBuffer& stage_input = (i == 0) ? *primary_input_ : *stage_buffers_[i - 1];
        if (!processors_[i]->process(stage_input, *stage_buffers_[i])) {
            LOG_CPP_WARNING("[Flow:%s] Processor '%s' failed this tick.", name_.c_str(), processors_[i]->name().c_str());
        }
    }

    if (consumers_.empty()) {
        return;
    }
    auto output = output_buffer_locked();
    while (auto frame = output->pop()) {
        for (std::size_t c = 0; c + 1 < consumers_.size(); ++c) {
            consumers_[c].tap->push(*frame);
        }
        consumers_.back().tap->push(std::move(*frame));
    }
}

void Flow::run() {
    const auto tick = std::chrono::milliseconds(resolve_flow_tick_ms(settings_));
    const auto idle_sleep = std::chrono::milliseconds(resolve_flow_idle_sleep_ms(settings_));
    LOG_CPP_DEBUG("[Flow:%s] Processing thread starting (tick=%lld ms).", name_.c_str(),
                  static_cast<long long>(tick.count()));

    while (!stop_flag_) {
        if (!has_work_source()) {
            wait_for_stop(idle_sleep);
            continue;
        }
        run_once();
        wait_for_stop(tick);
    }
    LOG_CPP_DEBUG("[Flow:%s] Processing thread exiting.", name_.c_str());
}

FlowStatus Flow::status() const {
    FlowStatus status;
    status.name = name_;
    status.running = is_running();

    std::lock_guard<std::mutex> lock(topology_mutex_);
    for (const auto& processor : processors_) {
        status.processor_statuses.push_back(processor->status());
    }
    for (const auto& slot : consumers_) {
        status.consumer_statuses.push_back(slot.consumer->status());
    }
    for (const auto& input : inputs_) {
        status.input_buffer_levels.push_back(input.buffer->available(input.reader));
    }
    for (const auto& buffer : stage_buffers_) {
        status.processor_buffer_levels.push_back(buffer->size());
    }
    status.output_buffer_level = output_buffer_locked()->size();
    return status;
}

std::size_t Flow::processor_count() const {
    std::lock_guard<std::mutex> lock(topology_mutex_);
    return processors_.size();
}

std::size_t Flow::consumer_count() const {
    std::lock_guard<std::mutex> lock(topology_mutex_);
    return consumers_.size();
}

std::size_t Flow::input_count() const {
    std::lock_guard<std::mutex> lock(topology_mutex_);
    return inputs_.size();
}

} // namespace audio
} // namespace airlift
