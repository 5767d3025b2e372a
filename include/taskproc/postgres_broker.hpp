#pragma once

#include "taskproc/broker.hpp"
#include "taskproc/config.hpp"
#include "taskproc/database.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace taskproc {

/**
 * PostgresBroker - PostgreSQL as broker and result store
 *
 * Broker side (broker_url):
 * - taskproc.messages   queued and leased tasks; lease_expires_at NULL = deliverable
 * - taskproc.control    control messages (targeted or broadcast shutdown)
 * - taskproc.workers    heartbeats and reported counters
 * Result store (backend_url, defaults to broker_url):
 * - taskproc.results    one row per task id
 *
 * Delivery uses FOR UPDATE SKIP LOCKED so concurrent workers never lease
 * the same message. Schema creation is idempotent.
 *
 * Transport options: visibility_timeout, polling_interval, heartbeat_interval
 * (seconds); pool_size; statement_timeout, lock_timeout,
 * pool_acquisition_timeout (ms).
 */
class PostgresBroker : public Broker {
public:
    static BrokerSettings default_settings();

    explicit PostgresBroker(const PostgresAdapterConfig& config);
    ~PostgresBroker() override;

    std::string name() const override { return "postgres"; }
    const BrokerSettings& settings() const override { return settings_; }

    void connect() override;
    void close() override;

    void publish(const TaskMessage& message) override;
    std::optional<TaskMessage> reserve(const std::vector<std::string>& queues,
                                       const std::string& worker_id) override;
    void complete(const TaskMessage& message,
                  TaskStatus status,
                  const nlohmann::json& result,
                  const std::string& worker_id) override;
    void retry(const TaskMessage& message,
               std::chrono::system_clock::time_point eta,
               const nlohmann::json& error,
               const std::string& worker_id) override;
    int extend_leases(const std::string& worker_id) override;
    int reclaim_expired_leases() override;

    bool revoke(const std::string& task_id) override;
    bool is_revoked(const std::string& task_id) override;
    std::optional<TaskState> get_state(const std::string& task_id) override;

    void send_control(const std::string& command, const std::string& destination) override;
    std::vector<ControlMessage> poll_control(const std::string& worker_id, int64_t after_sequence) override;
    int64_t latest_control_sequence() override;

    void heartbeat(const std::string& worker_id, const nlohmann::json& stats) override;
    void unregister_worker(const std::string& worker_id) override;
    std::vector<WorkerInfo> live_workers() override;

private:
    std::shared_ptr<DatabasePool> broker_pool() const;
    std::shared_ptr<DatabasePool> result_pool() const;
    std::shared_ptr<DatabasePool> make_pool(const std::string& url) const;

    void initialize_schema();
    void store_state(const TaskState& state);
    // Drops control messages older than an hour and workers silent for as long
    void prune();

    PostgresAdapterConfig config_;
    BrokerSettings settings_;
    size_t pool_size_;
    int statement_timeout_ms_;
    int lock_timeout_ms_;
    int acquisition_timeout_ms_;

    std::atomic<int64_t> last_prune_ms_{0};
    static constexpr int PRUNE_INTERVAL_MS = 60000;

    mutable std::mutex pools_mutex_;
    std::shared_ptr<DatabasePool> broker_pool_;
    std::shared_ptr<DatabasePool> result_pool_;
};

} // namespace taskproc
