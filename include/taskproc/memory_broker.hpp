#pragma once

#include "taskproc/broker.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace taskproc {

struct MemoryStore;

/**
 * MemoryBroker - in-process broker and result store
 *
 * Brokers created with the same memory://<name> url share one store for as
 * long as at least one of them is alive, so a producer adapter and a
 * consumer adapter in one process see the same queues. Nothing survives
 * the process.
 *
 * Every operation is a short critical section; none blocks on I/O.
 */
class MemoryBroker : public Broker {
public:
    static BrokerSettings default_settings();

    MemoryBroker(std::string url, BrokerSettings settings);
    ~MemoryBroker() override;

    std::string name() const override { return "memory"; }
    const BrokerSettings& settings() const override { return settings_; }
    const std::string& url() const { return url_; }

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

    // Messages still held by the broker (queued or leased) for a queue
    size_t message_count(const std::string& queue) const;
    size_t control_backlog() const;
    size_t registered_workers() const;

private:
    std::shared_ptr<MemoryStore> store() const;

    std::string url_;
    BrokerSettings settings_;
    std::shared_ptr<MemoryStore> store_;
    std::atomic<bool> connected_{false};

    // Heartbeat periods a control message or a silent worker is retained;
    // pruned on every reclaim_expired_leases()
    static constexpr int RETENTION_HEARTBEATS = 30;
};

} // namespace taskproc
