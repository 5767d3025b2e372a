#include "taskproc/logging.hpp"
#include <spdlog/spdlog.h>

namespace taskproc {

void setup_logging(const LoggingConfig& config) {
    spdlog::set_pattern(config.log_pattern);

    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown LOG_LEVEL '{}', falling back to info", config.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

} // namespace taskproc
