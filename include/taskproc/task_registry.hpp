#pragma once

#include "taskproc/retry_policy.hpp"
#include "taskproc/task_types.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace taskproc {

/**
 * A handler as the worker sees it: the callable plus the retry policy it
 * was registered with.
 */
struct RegisteredTask {
    std::string name;
    TaskHandler handler;
    RetryPolicy retry_policy;
};

/**
 * TaskRegistry - task name to handler mapping
 *
 * Written by register_handler() on the caller side, read by the worker
 * through an immutable snapshot taken when the consumer starts.
 *
 * Properties:
 * - Reads: Shared lock
 * - Writes: Exclusive lock
 * - Re-registering a name replaces the previous handler
 */
class TaskRegistry {
public:
    using HandlerMap = std::unordered_map<std::string, RegisteredTask>;

    explicit TaskRegistry(RetryPolicy retry_policy);

    /**
     * Register a handler
     * @param handler The callable
     * @param name Task name; derived from the handler's type when empty
     * @return The name the handler was registered under
     */
    std::string register_handler(TaskHandler handler, const std::string& name = "");

    std::optional<RegisteredTask> find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const;

    // Immutable copy handed to the consumer thread
    std::shared_ptr<const HandlerMap> snapshot() const;

    const RetryPolicy& retry_policy() const { return retry_policy_; }

    // Demangled type name of the callable stored in handler
    static std::string derive_name(const TaskHandler& handler);

private:
    RetryPolicy retry_policy_;
    HandlerMap handlers_;
    mutable std::shared_mutex mutex_;
};

} // namespace taskproc
