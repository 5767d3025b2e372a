#pragma once

#include "taskproc/broker_task_adapter.hpp"

namespace taskproc {

/**
 * PostgresTaskAdapter - PostgreSQL as broker and result store
 *
 * Blocking-only: every call is a libpq round-trip, so the async forms
 * throw UnsupportedOperationError.
 */
class PostgresTaskAdapter : public BrokerTaskAdapter {
public:
    // Throws ConfigMismatchError unless config.backend holds a PostgresAdapterConfig
    explicit PostgresTaskAdapter(const TaskProcessorConfig& config);

protected:
    std::shared_ptr<Broker> create_broker(const TaskProcessorConfig& config) override;
    bool supports_async() const override { return false; }
};

} // namespace taskproc
