#include "taskproc/task_worker.hpp"
#include "taskproc/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <cxxabi.h>
#include <thread>
#include <typeinfo>
#include <unistd.h>

namespace taskproc {

namespace {

std::string exception_type_name(const std::exception& e) {
    const char* mangled = typeid(e).name();
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    std::string name = (status == 0 && demangled) ? std::string(demangled) : std::string(mangled);
    std::free(demangled);

    // taskproc::TransientTaskError -> TransientTaskError
    auto pos = name.rfind("::");
    return pos == std::string::npos ? name : name.substr(pos + 2);
}

} // namespace

TaskWorker::TaskWorker(std::shared_ptr<Broker> broker,
                       std::shared_ptr<const TaskRegistry::HandlerMap> handlers,
                       WorkerOptions options)
    : broker_(std::move(broker)),
      handlers_(std::move(handlers)),
      options_(std::move(options)),
      log_prefix_("[Worker " + options_.worker_id + "]"),
      started_at_(std::chrono::steady_clock::now()) {
    if (options_.concurrency <= 0) {
        throw ConfigurationError("worker concurrency must be positive");
    }
    if (options_.queues.empty()) {
        throw ConfigurationError("worker needs at least one queue");
    }
}

void TaskWorker::request_stop() {
    stop_ = true;
    wait_cv_.notify_all();
}

void TaskWorker::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, duration, [this] { return stop_.load(); });
}

nlohmann::json TaskWorker::stats() const {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();

    return {
        {"active", active_.load()},
        {"processed", processed_.load()},
        {"succeeded", succeeded_.load()},
        {"failed", failed_.load()},
        {"retried", retried_.load()},
        {"concurrency", options_.concurrency},
        {"queues", options_.queues},
        {"pid", static_cast<int>(getpid())},
        {"uptime", uptime},
        {"broker", broker_->name()}
    };
}

void TaskWorker::run() {
    started_at_ = std::chrono::steady_clock::now();
    const auto& settings = broker_->settings();

    int64_t control_sequence = options_.control_baseline;
    if (stop_) {
        spdlog::info("{} Stop requested before start", log_prefix_);
        return;
    }
    try {
        broker_->heartbeat(options_.worker_id, stats());
    } catch (const std::exception& e) {
        spdlog::error("{} Cannot register with {} broker: {}", log_prefix_, broker_->name(), e.what());
        return;
    }

    spdlog::info("{} Started (queues={}, concurrency={})",
                 log_prefix_, nlohmann::json(options_.queues).dump(), options_.concurrency);

    std::vector<std::thread> slots;
    slots.reserve(options_.concurrency);
    for (int i = 0; i < options_.concurrency; ++i) {
        slots.emplace_back(&TaskWorker::slot_loop, this, i);
    }

    auto next_maintenance = std::chrono::steady_clock::now() + settings.heartbeat_interval;
    while (!stop_) {
        control_tick(control_sequence);
        if (stop_) break;

        if (std::chrono::steady_clock::now() >= next_maintenance) {
            maintenance_tick();
            next_maintenance = std::chrono::steady_clock::now() + settings.heartbeat_interval;
        }
        wait_for(settings.polling_interval);
    }

    spdlog::info("{} Shutting down, waiting for {} active task(s)", log_prefix_, active_.load());
    wait_cv_.notify_all();
    for (auto& slot : slots) {
        if (slot.joinable()) {
            slot.join();
        }
    }

    try {
        broker_->unregister_worker(options_.worker_id);
    } catch (const std::exception& e) {
        spdlog::warn("{} Failed to unregister: {}", log_prefix_, e.what());
    }

    spdlog::info("{} Stopped (processed={}, succeeded={}, failed={}, retried={})",
                 log_prefix_, processed_.load(), succeeded_.load(), failed_.load(), retried_.load());
}

void TaskWorker::control_tick(int64_t& control_sequence) {
    try {
        for (const auto& msg : broker_->poll_control(options_.worker_id, control_sequence)) {
            control_sequence = std::max(control_sequence, msg.sequence);
            if (msg.command == "shutdown") {
                spdlog::info("{} Received {} shutdown", log_prefix_,
                             msg.destination.empty() ? "broadcast" : "targeted");
                request_stop();
            } else {
                spdlog::warn("{} Ignoring unknown control command '{}'", log_prefix_, msg.command);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("{} Control poll failed: {}", log_prefix_, e.what());
    }
}

void TaskWorker::maintenance_tick() {
    try {
        broker_->heartbeat(options_.worker_id, stats());
        int renewed = broker_->extend_leases(options_.worker_id);
        int requeued = broker_->reclaim_expired_leases();
        if (requeued > 0) {
            spdlog::warn("{} Requeued {} task(s) with expired leases", log_prefix_, requeued);
        }
        spdlog::trace("{} Heartbeat, {} lease(s) renewed", log_prefix_, renewed);
    } catch (const std::exception& e) {
        spdlog::error("{} Maintenance failed: {}", log_prefix_, e.what());
    }
}

void TaskWorker::slot_loop(int slot) {
    const auto polling = broker_->settings().polling_interval;
    int consecutive_errors = 0;

    while (!stop_) {
        std::optional<TaskMessage> message;
        try {
            message = broker_->reserve(options_.queues, options_.worker_id);
            consecutive_errors = 0;
        } catch (const std::exception& e) {
            consecutive_errors++;
            auto backoff = std::min<int64_t>(polling.count() << std::min(consecutive_errors, 10),
                                             MAX_ERROR_BACKOFF_MS);
            spdlog::error("{} Slot {} reserve failed ({} in a row), backing off {}ms: {}",
                          log_prefix_, slot, consecutive_errors, backoff, e.what());
            wait_for(std::chrono::milliseconds(backoff));
            continue;
        }

        if (!message) {
            wait_for(polling);
            continue;
        }

        active_++;
        execute(*message);
        active_--;
        processed_++;
    }
}

void TaskWorker::execute(const TaskMessage& message) {
    if (message.redeliveries > 0) {
        spdlog::info("{} Task {} ({}) redelivered {} time(s)",
                     log_prefix_, message.id, message.name, message.redeliveries);
    }

    try {
        auto it = handlers_->find(message.name);
        if (it == handlers_->end()) {
            spdlog::error("{} Received unregistered task '{}' ({})", log_prefix_, message.name, message.id);
            broker_->complete(message, TaskStatus::FAILURE,
                              make_error_result("NotRegistered", message.name), options_.worker_id);
            failed_++;
            return;
        }

        const RegisteredTask& task = it->second;
        spdlog::debug("{} Running task {} ({}), attempt {}",
                      log_prefix_, message.id, message.name, message.retries + 1);

        nlohmann::json result;
        try {
            result = task.handler(message.args, message.kwargs);
        } catch (const std::exception& e) {
            handle_failure(message, task.retry_policy, exception_type_name(e), e.what());
            return;
        } catch (...) {
            handle_failure(message, task.retry_policy, "UnknownException", "non-standard exception");
            return;
        }

        broker_->complete(message, TaskStatus::SUCCESS, result, options_.worker_id);
        succeeded_++;
        spdlog::debug("{} Task {} succeeded", log_prefix_, message.id);
    } catch (const std::exception& e) {
        // Lease stays with this worker until it expires, then the task is redelivered
        spdlog::error("{} Could not record outcome of task {}: {}", log_prefix_, message.id, e.what());
    }
}

void TaskWorker::handle_failure(const TaskMessage& message,
                                const RetryPolicy& policy,
                                const std::string& exc_type,
                                const std::string& exc_message) {
    auto error = make_error_result(exc_type, exc_message);

    if (broker_->is_revoked(message.id)) {
        spdlog::info("{} Task {} failed after revocation, not retrying", log_prefix_, message.id);
        broker_->complete(message, TaskStatus::REVOKED, error, options_.worker_id);
        failed_++;
        return;
    }

    if (policy.should_retry(message.retries)) {
        auto delay = policy.delay_for(message.retries);
        spdlog::warn("{} Task {} failed ({}: {}), retry {}/{} in {}ms",
                     log_prefix_, message.id, exc_type, exc_message,
                     message.retries + 1, policy.max_retries(), delay.count());
        broker_->retry(message, std::chrono::system_clock::now() + delay, error, options_.worker_id);
        retried_++;
        return;
    }

    spdlog::error("{} Task {} failed permanently after {} retries ({}: {})",
                  log_prefix_, message.id, message.retries, exc_type, exc_message);
    broker_->complete(message, TaskStatus::FAILURE, error, options_.worker_id);
    failed_++;
}

} // namespace taskproc
