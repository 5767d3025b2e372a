#include "taskproc/broker_task_adapter.hpp"
#include "taskproc/errors.hpp"
#include "taskproc/identity.hpp"
#include <spdlog/spdlog.h>

namespace taskproc {

namespace {

// Bounded wait used when an adapter is destroyed with its consumer running
constexpr auto DESTRUCTOR_STOP_TIMEOUT = std::chrono::seconds(10);

TaskResult to_task_result(const std::string& task_id, const std::optional<TaskState>& state) {
    TaskResult result;
    result.id = task_id;
    if (!state) {
        return result;
    }
    result.status = state->status;
    result.created_at = state->created_at;
    if (is_terminal(state->status)) {
        result.result = state->result.value_or(nlohmann::json());
    }
    return result;
}

std::chrono::system_clock::time_point eligible_at(std::chrono::system_clock::time_point now,
                                                  const nlohmann::json& options) {
    if (!options.contains("countdown")) {
        return now;
    }
    const auto& countdown = options.at("countdown");
    if (!countdown.is_number() || countdown.get<double>() < 0.0) {
        throw TaskProcessorError("countdown must be a non-negative number of seconds");
    }
    return now + std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(countdown.get<double>()));
}

} // namespace

BrokerTaskAdapter::BrokerTaskAdapter(std::string adapter_name, TaskProcessorConfig config)
    : adapter_name_(std::move(adapter_name)),
      config_(std::move(config)) {
}

BrokerTaskAdapter::~BrokerTaskAdapter() {
    if (supervisor_.state() != ConsumerState::STOPPED) {
        stop_consumer(DESTRUCTOR_STOP_TIMEOUT);
    }
}

void BrokerTaskAdapter::initialize(const TaskProcessorConfig& config) {
    if (broker_) {
        throw TaskProcessorError(adapter_name_ + " is already initialized");
    }
    if (config.backend.index() != config_.backend.index()) {
        throw ConfigMismatchError(adapter_name_, backend_type_name(config.backend));
    }
    config.validate();

    config_ = config;
    auto broker = create_broker(config_);
    broker->connect();

    registry_ = std::make_unique<TaskRegistry>(RetryPolicy(config_.max_retries, config_.retry_backoff_unit));
    broker_ = std::move(broker);

    spdlog::info("[{}] Initialized (queue={}, max_retries={}, backoff_unit={}ms, concurrency={})",
                 adapter_name_, config_.queue_name, config_.max_retries,
                 config_.retry_backoff_unit.count(), config_.worker_concurrency());
}

std::shared_ptr<Broker> BrokerTaskAdapter::broker() const {
    if (!broker_) {
        throw TaskProcessorError(adapter_name_ + " is not initialized");
    }
    return broker_;
}

TaskRegistry& BrokerTaskAdapter::registry() {
    if (!registry_) {
        throw TaskProcessorError(adapter_name_ + " is not initialized");
    }
    return *registry_;
}

void BrokerTaskAdapter::require_async(const std::string& operation) const {
    if (!supports_async()) {
        throw UnsupportedOperationError(adapter_name_, operation);
    }
}

std::string BrokerTaskAdapter::register_task_handle(TaskHandler handler, const std::string& name) {
    if (supervisor_.is_running()) {
        throw TaskProcessorError("Cannot register task handlers while the consumer is running");
    }
    return registry().register_handler(std::move(handler), name);
}

TaskResult BrokerTaskAdapter::enqueue_task_sync(const std::string& task_name,
                                                const nlohmann::json& args,
                                                const nlohmann::json& kwargs,
                                                const nlohmann::json& options) {
    if (task_name.empty()) {
        throw TaskProcessorError("Task name must not be empty");
    }
    if (!args.is_array() && !args.is_null()) {
        throw TaskProcessorError("Task args must be a JSON array");
    }
    if (!kwargs.is_object() && !kwargs.is_null()) {
        throw TaskProcessorError("Task kwargs must be a JSON object");
    }
    if (!options.is_object() && !options.is_null()) {
        throw TaskProcessorError("Task options must be a JSON object");
    }

    auto now = std::chrono::system_clock::now();

    TaskMessage message;
    message.name = task_name;
    message.args = args.is_null() ? nlohmann::json::array() : args;
    message.kwargs = kwargs.is_null() ? nlohmann::json::object() : kwargs;
    message.options = options.is_null() ? nlohmann::json::object() : options;
    message.id = message.options.value("task_id", std::string());
    if (message.id.empty()) {
        message.id = generate_task_id();
    }
    message.queue = message.options.value("queue", config_.queue_name);
    message.created_at = now;
    message.eta = eligible_at(now, message.options);

    broker()->publish(message);
    spdlog::debug("[{}] Enqueued task {} ({}) on queue {}", adapter_name_, message.id, task_name, message.queue);

    TaskResult result;
    result.id = message.id;
    result.status = TaskStatus::PENDING;
    result.created_at = now;
    return result;
}

std::future<TaskResult> BrokerTaskAdapter::enqueue_task_async(const std::string& task_name,
                                                              const nlohmann::json& args,
                                                              const nlohmann::json& kwargs,
                                                              const nlohmann::json& options) {
    require_async("enqueue_task_async");

    std::promise<TaskResult> promise;
    try {
        promise.set_value(enqueue_task_sync(task_name, args, kwargs, options));
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

TaskResult BrokerTaskAdapter::get_task_status_sync(const std::string& task_id) {
    return to_task_result(task_id, broker()->get_state(task_id));
}

std::future<TaskResult> BrokerTaskAdapter::get_task_status_async(const std::string& task_id) {
    require_async("get_task_status_async");

    std::promise<TaskResult> promise;
    try {
        promise.set_value(get_task_status_sync(task_id));
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

bool BrokerTaskAdapter::cancel_task(const std::string& task_id) {
    bool accepted = broker()->revoke(task_id);
    if (accepted) {
        spdlog::info("[{}] Revoked task {}", adapter_name_, task_id);
    } else {
        spdlog::info("[{}] Task {} is unknown or already finished, nothing to revoke", adapter_name_, task_id);
    }
    return accepted;
}

nlohmann::json BrokerTaskAdapter::get_metrics() {
    nlohmann::json metrics = nlohmann::json::object();
    for (const auto& worker : broker()->live_workers()) {
        metrics[worker.worker_id] = worker.stats;
    }
    return metrics;
}

void BrokerTaskAdapter::start_consumer(const ConsumerOptions& options) {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    auto broker_client = broker();

    if (supervisor_.is_running()) {
        spdlog::info("[{}] Consumer {} already running", adapter_name_, supervisor_.worker_identity());
        return;
    }

    WorkerOptions worker_options;
    worker_options.worker_id = make_worker_identity(config_.queue_name);
    worker_options.queues = options.queues.empty()
        ? std::vector<std::string>{config_.queue_name}
        : options.queues;
    worker_options.concurrency = options.concurrency > 0 ? options.concurrency : config_.worker_concurrency();
    // Read on the caller thread so a stop sent right after this call is not
    // mistaken for an older command
    worker_options.control_baseline = broker_client->latest_control_sequence();

    auto worker = std::make_shared<TaskWorker>(broker_client, registry().snapshot(), worker_options);
    if (supervisor_.start(worker_options.worker_id, [worker]() { worker->run(); })) {
        worker_ = worker;
    }
}

bool BrokerTaskAdapter::stop_consumer(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    auto worker = worker_;
    auto broker_client = broker_;

    bool stopped = supervisor_.stop(timeout, [worker, broker_client](const std::string& identity) {
        if (worker) worker->request_stop();
        try {
            broker_client->send_control("shutdown", identity);
        } catch (const std::exception& e) {
            spdlog::warn("[Consumer] Shutdown command for {} not delivered: {}", identity, e.what());
        }
    });
    worker_.reset();
    return stopped;
}

void BrokerTaskAdapter::shutdown() {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    auto broker_client = broker();
    if (worker_) {
        worker_->request_stop();
    }
    broker_client->send_control("shutdown", "");
    supervisor_.release();
    worker_.reset();
    spdlog::info("[{}] Shutdown broadcast to all workers", adapter_name_);
}

std::vector<nlohmann::json> BrokerTaskAdapter::health_check() {
    std::vector<nlohmann::json> replies;
    try {
        for (const auto& worker : broker()->live_workers()) {
            nlohmann::json reply;
            reply[worker.worker_id] = {{"ok", "pong"}};
            replies.push_back(reply);
        }
    } catch (const BrokerError& e) {
        spdlog::warn("[{}] Health check failed: {}", adapter_name_, e.what());
    }
    return replies;
}

} // namespace taskproc
