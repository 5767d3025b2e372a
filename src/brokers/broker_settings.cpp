#include "taskproc/broker.hpp"
#include "taskproc/errors.hpp"

namespace taskproc {

namespace {

std::chrono::milliseconds read_seconds(const nlohmann::json& options,
                                       const char* key,
                                       std::chrono::milliseconds fallback) {
    if (!options.is_object() || !options.contains(key)) {
        return fallback;
    }
    const auto& value = options.at(key);
    if (!value.is_number() || value.get<double>() <= 0.0) {
        throw ConfigurationError(std::string("transport option '") + key + "' must be a positive number of seconds");
    }
    return std::chrono::milliseconds(static_cast<int64_t>(value.get<double>() * 1000.0));
}

} // namespace

BrokerSettings BrokerSettings::from_transport_options(const nlohmann::json& options, BrokerSettings defaults) {
    BrokerSettings settings = defaults;
    settings.visibility_timeout = read_seconds(options, "visibility_timeout", defaults.visibility_timeout);
    settings.polling_interval = read_seconds(options, "polling_interval", defaults.polling_interval);
    settings.heartbeat_interval = read_seconds(options, "heartbeat_interval", defaults.heartbeat_interval);

    if (settings.heartbeat_interval >= settings.visibility_timeout) {
        throw ConfigurationError("heartbeat_interval must be shorter than visibility_timeout");
    }
    return settings;
}

} // namespace taskproc
