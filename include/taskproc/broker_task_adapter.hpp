#pragma once

#include "taskproc/broker.hpp"
#include "taskproc/consumer_supervisor.hpp"
#include "taskproc/task_processor_adapter.hpp"
#include "taskproc/task_registry.hpp"
#include "taskproc/task_worker.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace taskproc {

/**
 * BrokerTaskAdapter - TaskProcessorAdapter over a Broker
 *
 * Owns the broker client, the handler registry and the consumer handle.
 * Subclasses pick the broker and decide whether the async forms are served.
 */
class BrokerTaskAdapter : public TaskProcessorAdapter {
public:
    ~BrokerTaskAdapter() override;

    void initialize(const TaskProcessorConfig& config) override;
    std::string register_task_handle(TaskHandler handler, const std::string& name = "") override;

    TaskResult enqueue_task_sync(const std::string& task_name,
                                 const nlohmann::json& args = nlohmann::json::array(),
                                 const nlohmann::json& kwargs = nlohmann::json::object(),
                                 const nlohmann::json& options = nlohmann::json::object()) override;
    std::future<TaskResult> enqueue_task_async(const std::string& task_name,
                                               const nlohmann::json& args = nlohmann::json::array(),
                                               const nlohmann::json& kwargs = nlohmann::json::object(),
                                               const nlohmann::json& options = nlohmann::json::object()) override;

    TaskResult get_task_status_sync(const std::string& task_id) override;
    std::future<TaskResult> get_task_status_async(const std::string& task_id) override;

    bool cancel_task(const std::string& task_id) override;
    nlohmann::json get_metrics() override;

    void start_consumer(const ConsumerOptions& options = ConsumerOptions{}) override;
    bool stop_consumer(std::chrono::milliseconds timeout = std::chrono::seconds(10)) override;
    void shutdown() override;
    std::vector<nlohmann::json> health_check() override;

    bool is_initialized() const { return broker_ != nullptr; }
    bool is_consumer_running() const { return supervisor_.is_running(); }
    ConsumerState consumer_state() const { return supervisor_.state(); }
    std::string worker_identity() const { return supervisor_.worker_identity(); }

    const std::string& adapter_name() const { return adapter_name_; }
    const TaskProcessorConfig& config() const { return config_; }

protected:
    BrokerTaskAdapter(std::string adapter_name, TaskProcessorConfig config);

    virtual std::shared_ptr<Broker> create_broker(const TaskProcessorConfig& config) = 0;
    virtual bool supports_async() const = 0;

    std::shared_ptr<Broker> broker() const;

private:
    TaskRegistry& registry();
    void require_async(const std::string& operation) const;

    std::string adapter_name_;
    TaskProcessorConfig config_;
    std::unique_ptr<TaskRegistry> registry_;
    std::shared_ptr<Broker> broker_;

    ConsumerSupervisor supervisor_;
    std::shared_ptr<TaskWorker> worker_;
    std::mutex consumer_mutex_;
};

} // namespace taskproc
