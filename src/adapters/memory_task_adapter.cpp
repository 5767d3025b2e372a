#include "taskproc/memory_task_adapter.hpp"
#include "taskproc/errors.hpp"
#include "taskproc/memory_broker.hpp"

namespace taskproc {

namespace {

const TaskProcessorConfig& require_memory(const TaskProcessorConfig& config) {
    if (!std::holds_alternative<MemoryAdapterConfig>(config.backend)) {
        throw ConfigMismatchError("MemoryTaskAdapter", backend_type_name(config.backend));
    }
    return config;
}

} // namespace

MemoryTaskAdapter::MemoryTaskAdapter(const TaskProcessorConfig& config)
    : BrokerTaskAdapter("MemoryTaskAdapter", require_memory(config)) {
}

std::shared_ptr<Broker> MemoryTaskAdapter::create_broker(const TaskProcessorConfig& config) {
    const auto& memory = std::get<MemoryAdapterConfig>(config.backend);
    return std::make_shared<MemoryBroker>(
        memory.broker_url,
        BrokerSettings::from_transport_options(memory.transport_options, MemoryBroker::default_settings()));
}

} // namespace taskproc
