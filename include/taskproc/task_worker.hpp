#pragma once

#include "taskproc/broker.hpp"
#include "taskproc/task_registry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace taskproc {

struct WorkerOptions {
    std::string worker_id;
    std::vector<std::string> queues;
    int concurrency = 1;
    // Control sequence read before the worker was started; only later
    // commands apply to it
    int64_t control_baseline = 0;
};

/**
 * TaskWorker - executes tasks delivered by a broker
 *
 * run() blocks the calling thread and owns:
 * - concurrency execution slots, each reserving and running one task at a time
 * - the control loop: shutdown commands, heartbeat + lease renewal,
 *   requeue of expired leases
 *
 * Shutdown is warm: on a shutdown command (or request_stop()) slots stop
 * reserving, finish the task in hand, then the worker unregisters.
 *
 * Handlers are read from an immutable snapshot; registrations made after
 * the worker was built are not seen.
 */
class TaskWorker {
public:
    TaskWorker(std::shared_ptr<Broker> broker,
               std::shared_ptr<const TaskRegistry::HandlerMap> handlers,
               WorkerOptions options);

    TaskWorker(const TaskWorker&) = delete;
    TaskWorker& operator=(const TaskWorker&) = delete;

    void run();

    // Local stop; safe to call before run() starts
    void request_stop();
    bool stop_requested() const { return stop_.load(); }

    // Counters reported with every heartbeat
    nlohmann::json stats() const;

    const std::string& worker_id() const { return options_.worker_id; }

private:
    void slot_loop(int slot);
    void execute(const TaskMessage& message);
    void handle_failure(const TaskMessage& message,
                        const RetryPolicy& policy,
                        const std::string& exc_type,
                        const std::string& exc_message);

    void control_tick(int64_t& control_sequence);
    void maintenance_tick();

    // Sleeps up to duration, wakes early on stop
    void wait_for(std::chrono::milliseconds duration);

    std::shared_ptr<Broker> broker_;
    std::shared_ptr<const TaskRegistry::HandlerMap> handlers_;
    WorkerOptions options_;
    std::string log_prefix_;

    std::atomic<bool> stop_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::chrono::steady_clock::time_point started_at_;
    std::atomic<int> active_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> retried_{0};

    static constexpr int MAX_ERROR_BACKOFF_MS = 5000;
};

} // namespace taskproc
