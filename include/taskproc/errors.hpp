#pragma once

#include <stdexcept>
#include <string>

namespace taskproc {

// Base class for everything the task processor throws
class TaskProcessorError : public std::runtime_error {
public:
    explicit TaskProcessorError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid configuration values (empty queue name, negative retries, ...)
class ConfigurationError : public TaskProcessorError {
public:
    explicit ConfigurationError(const std::string& message)
        : TaskProcessorError(message) {}
};

// The backend variant of a configuration does not match the adapter being built
class ConfigMismatchError : public ConfigurationError {
public:
    ConfigMismatchError(const std::string& adapter, const std::string& backend_type)
        : ConfigurationError(adapter + " requires a matching backend config, got: " + backend_type),
          adapter_(adapter),
          backend_type_(backend_type) {}

    const std::string& adapter() const { return adapter_; }
    const std::string& backend_type() const { return backend_type_; }

private:
    std::string adapter_;
    std::string backend_type_;
};

// No adapter recognizes the backend variant
class UnknownBackendError : public ConfigurationError {
public:
    explicit UnknownBackendError(const std::string& backend_type)
        : ConfigurationError("Unknown backend config type: " + backend_type),
          backend_type_(backend_type) {}

    const std::string& backend_type() const { return backend_type_; }

private:
    std::string backend_type_;
};

// Non-blocking form of an operation invoked on a blocking-only backend
class UnsupportedOperationError : public TaskProcessorError {
public:
    UnsupportedOperationError(const std::string& backend, const std::string& operation)
        : TaskProcessorError(backend + " does not support " + operation),
          operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

// Broker or result store unreachable / query failed
class BrokerError : public TaskProcessorError {
public:
    explicit BrokerError(const std::string& message)
        : TaskProcessorError(message) {}
};

/**
 * Handler failure that should be retried.
 *
 * Handlers may throw this explicitly; any other std::exception escaping a
 * handler is treated the same way. Never surfaces to the submitting side:
 * once retries are exhausted the task ends in FAILURE.
 */
class TransientTaskError : public TaskProcessorError {
public:
    explicit TransientTaskError(const std::string& message)
        : TaskProcessorError(message) {}
};

} // namespace taskproc
