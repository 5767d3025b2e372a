#include "taskproc/postgres_task_adapter.hpp"
#include "taskproc/errors.hpp"
#include "taskproc/postgres_broker.hpp"

namespace taskproc {

namespace {

const TaskProcessorConfig& require_postgres(const TaskProcessorConfig& config) {
    if (!std::holds_alternative<PostgresAdapterConfig>(config.backend)) {
        throw ConfigMismatchError("PostgresTaskAdapter", backend_type_name(config.backend));
    }
    return config;
}

} // namespace

PostgresTaskAdapter::PostgresTaskAdapter(const TaskProcessorConfig& config)
    : BrokerTaskAdapter("PostgresTaskAdapter", require_postgres(config)) {
}

std::shared_ptr<Broker> PostgresTaskAdapter::create_broker(const TaskProcessorConfig& config) {
    return std::make_shared<PostgresBroker>(std::get<PostgresAdapterConfig>(config.backend));
}

} // namespace taskproc
