#pragma once

#include "taskproc/task_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taskproc {

/**
 * Timing knobs read from transport_options. Values in transport_options are
 * seconds (fractions allowed); anything not listed here is ignored by the
 * generic layer and left for the concrete broker.
 */
struct BrokerSettings {
    std::chrono::milliseconds visibility_timeout{60000};  // lease duration of a delivered task
    std::chrono::milliseconds polling_interval{200};      // idle wait between reserve / control polls
    std::chrono::milliseconds heartbeat_interval{2000};   // heartbeat + lease renewal period

    // A worker is alive while its last heartbeat is younger than this
    std::chrono::milliseconds liveness_threshold() const { return heartbeat_interval * 3; }

    static BrokerSettings from_transport_options(const nlohmann::json& options, BrokerSettings defaults);
};

/**
 * Broker - transport and result store operations behind a concrete adapter
 *
 * Delivery semantics:
 * - reserve() hands out a lease on a message; the message stays in the
 *   broker until complete() acknowledges it (late acknowledgment)
 * - a lease not renewed before visibility_timeout expires is returned to
 *   the queue by reclaim_expired_leases() (requeue on worker loss)
 * - every state transition is written to the result store
 *
 * Implementations throw BrokerError when the backing system fails.
 */
class Broker {
public:
    virtual ~Broker() = default;

    virtual std::string name() const = 0;
    virtual const BrokerSettings& settings() const = 0;

    virtual void connect() = 0;
    virtual void close() = 0;

    // Records PENDING in the result store and makes the message deliverable at message.eta
    virtual void publish(const TaskMessage& message) = 0;

    // Next eligible message of any of the queues, leased to worker_id; records STARTED
    virtual std::optional<TaskMessage> reserve(const std::vector<std::string>& queues,
                                               const std::string& worker_id) = 0;

    // Stores the terminal state, then acknowledges (removes) the message
    virtual void complete(const TaskMessage& message,
                          TaskStatus status,
                          const nlohmann::json& result,
                          const std::string& worker_id) = 0;

    // Records RETRY and releases the lease; the message becomes deliverable again at eta
    virtual void retry(const TaskMessage& message,
                       std::chrono::system_clock::time_point eta,
                       const nlohmann::json& error,
                       const std::string& worker_id) = 0;

    // Keeps the leases of worker_id alive; returns the number of leases renewed
    virtual int extend_leases(const std::string& worker_id) = 0;

    // Requeues expired leases; returns the number of messages returned to their queue
    virtual int reclaim_expired_leases() = 0;

    /**
     * Advisory revocation.
     * - PENDING / RETRY: recorded as REVOKED, the message is dropped
     * - STARTED: flagged; the running attempt continues
     * @return false when the task is unknown or already terminal
     */
    virtual bool revoke(const std::string& task_id) = 0;
    virtual bool is_revoked(const std::string& task_id) = 0;

    virtual std::optional<TaskState> get_state(const std::string& task_id) = 0;

    // Control channel; an empty destination addresses every worker
    virtual void send_control(const std::string& command, const std::string& destination) = 0;
    virtual std::vector<ControlMessage> poll_control(const std::string& worker_id, int64_t after_sequence) = 0;
    virtual int64_t latest_control_sequence() = 0;

    // Worker registry backing metrics and health checks
    virtual void heartbeat(const std::string& worker_id, const nlohmann::json& stats) = 0;
    virtual void unregister_worker(const std::string& worker_id) = 0;
    virtual std::vector<WorkerInfo> live_workers() = 0;
};

} // namespace taskproc
