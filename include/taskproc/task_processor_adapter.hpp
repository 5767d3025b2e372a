#pragma once

#include "taskproc/config.hpp"
#include "taskproc/task_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace taskproc {

// Overrides for start_consumer(); empty / zero fields fall back to the configuration
struct ConsumerOptions {
    std::vector<std::string> queues;
    int concurrency = 0;
};

/**
 * TaskProcessorAdapter - broker-agnostic task processing contract
 *
 * Lifecycle: construct -> initialize -> register_task_handle* ->
 * start_consumer -> (enqueue / status / cancel / metrics)* ->
 * stop_consumer | shutdown.
 *
 * Async forms return a std::future. Backends that cannot serve them
 * without blocking throw UnsupportedOperationError from the call itself.
 */
class TaskProcessorAdapter {
public:
    virtual ~TaskProcessorAdapter() = default;

    // Binds to the broker; a second call throws TaskProcessorError, connection failure BrokerError
    virtual void initialize(const TaskProcessorConfig& config) = 0;

    /**
     * Register a task handler
     * @param handler Callable receiving (args, kwargs)
     * @param name Task name; derived from the handler type when empty
     * @return The registered name
     * @throws TaskProcessorError when the consumer is running
     */
    virtual std::string register_task_handle(TaskHandler handler, const std::string& name = "") = 0;

    /**
     * Submit a task without waiting for it
     * @param options countdown (seconds), queue, task_id; stored verbatim with the message
     * @return id, PENDING status and creation time
     */
    virtual TaskResult enqueue_task_sync(const std::string& task_name,
                                         const nlohmann::json& args = nlohmann::json::array(),
                                         const nlohmann::json& kwargs = nlohmann::json::object(),
                                         const nlohmann::json& options = nlohmann::json::object()) = 0;

    virtual std::future<TaskResult> enqueue_task_async(const std::string& task_name,
                                                       const nlohmann::json& args = nlohmann::json::array(),
                                                       const nlohmann::json& kwargs = nlohmann::json::object(),
                                                       const nlohmann::json& options = nlohmann::json::object()) = 0;

    // Unknown ids report PENDING
    virtual TaskResult get_task_status_sync(const std::string& task_id) = 0;
    virtual std::future<TaskResult> get_task_status_async(const std::string& task_id) = 0;

    // Advisory; false when the task is unknown or already finished
    virtual bool cancel_task(const std::string& task_id) = 0;

    // Worker identity -> counters reported by that worker
    virtual nlohmann::json get_metrics() = 0;

    virtual void start_consumer(const ConsumerOptions& options = ConsumerOptions{}) = 0;

    // Targeted stop of this adapter's consumer; true when it exited within timeout
    virtual bool stop_consumer(std::chrono::milliseconds timeout = std::chrono::seconds(10)) = 0;

    // Broadcast stop to every worker of the broker; does not wait
    virtual void shutdown() = 0;

    // One {identity: {"ok": "pong"}} per live worker
    virtual std::vector<nlohmann::json> health_check() = 0;
};

} // namespace taskproc
