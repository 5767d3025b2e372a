#pragma once

#include "taskproc/broker_task_adapter.hpp"

namespace taskproc {

/**
 * MemoryTaskAdapter - in-process broker for local development and tests
 *
 * Nothing blocks on I/O, so the async forms return already completed futures.
 */
class MemoryTaskAdapter : public BrokerTaskAdapter {
public:
    // Throws ConfigMismatchError unless config.backend holds a MemoryAdapterConfig
    explicit MemoryTaskAdapter(const TaskProcessorConfig& config);

protected:
    std::shared_ptr<Broker> create_broker(const TaskProcessorConfig& config) override;
    bool supports_async() const override { return true; }
};

} // namespace taskproc
