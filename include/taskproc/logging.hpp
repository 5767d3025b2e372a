#pragma once

#include "taskproc/config.hpp"

namespace taskproc {

// Applies level and pattern to the default spdlog logger
void setup_logging(const LoggingConfig& config = LoggingConfig::from_env());

} // namespace taskproc
