#pragma once

#include "taskproc/task_processor_adapter.hpp"
#include <memory>

namespace taskproc {

/**
 * Build and initialize the adapter matching config.backend.
 *
 * @throws UnknownBackendError when no backend is configured
 * @throws ConfigurationError on invalid values
 * @throws BrokerError when the broker cannot be reached
 */
std::unique_ptr<TaskProcessorAdapter> make_task_adapter(const TaskProcessorConfig& config);

} // namespace taskproc
