#include "taskproc/adapter_factory.hpp"
#include "taskproc/errors.hpp"
#include "taskproc/memory_task_adapter.hpp"
#include "taskproc/postgres_task_adapter.hpp"
#include <spdlog/spdlog.h>

namespace taskproc {

std::unique_ptr<TaskProcessorAdapter> make_task_adapter(const TaskProcessorConfig& config) {
    std::unique_ptr<TaskProcessorAdapter> adapter;

    if (std::holds_alternative<PostgresAdapterConfig>(config.backend)) {
        adapter = std::make_unique<PostgresTaskAdapter>(config);
    } else if (std::holds_alternative<MemoryAdapterConfig>(config.backend)) {
        adapter = std::make_unique<MemoryTaskAdapter>(config);
    } else {
        throw UnknownBackendError(backend_type_name(config.backend));
    }

    spdlog::debug("[Factory] Selected adapter for {}", backend_type_name(config.backend));
    adapter->initialize(config);
    return adapter;
}

} // namespace taskproc
