#include "taskproc/memory_broker.hpp"
#include "taskproc/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <mutex>
#include <unordered_map>

namespace taskproc {

struct MemoryStore {
    struct Entry {
        TaskMessage message;
        std::string worker_id;
        std::optional<std::chrono::system_clock::time_point> lease_expires_at;
    };

    std::mutex mutex;
    std::map<std::string, Entry> messages;
    std::unordered_map<std::string, TaskState> results;
    std::vector<ControlMessage> control;
    int64_t control_sequence = 0;
    std::unordered_map<std::string, WorkerInfo> workers;
};

namespace {

std::mutex g_stores_mutex;
std::unordered_map<std::string, std::weak_ptr<MemoryStore>> g_stores;

std::shared_ptr<MemoryStore> acquire_store(const std::string& url) {
    std::lock_guard<std::mutex> lock(g_stores_mutex);
    auto it = g_stores.find(url);
    if (it != g_stores.end()) {
        if (auto existing = it->second.lock()) {
            return existing;
        }
    }
    auto store = std::make_shared<MemoryStore>();
    g_stores[url] = store;
    return store;
}

} // namespace

BrokerSettings MemoryBroker::default_settings() {
    BrokerSettings settings;
    settings.visibility_timeout = std::chrono::milliseconds(30000);
    settings.polling_interval = std::chrono::milliseconds(20);
    settings.heartbeat_interval = std::chrono::milliseconds(200);
    return settings;
}

MemoryBroker::MemoryBroker(std::string url, BrokerSettings settings)
    : url_(std::move(url)),
      settings_(settings),
      store_(acquire_store(url_)) {
}

MemoryBroker::~MemoryBroker() = default;

void MemoryBroker::connect() {
    connected_ = true;
    spdlog::info("[MemoryBroker] Connected to {}", url_);
}

void MemoryBroker::close() {
    if (connected_.exchange(false)) {
        spdlog::info("[MemoryBroker] Closed {}", url_);
    }
}

std::shared_ptr<MemoryStore> MemoryBroker::store() const {
    if (!connected_) {
        throw BrokerError("Memory broker " + url_ + " is not connected");
    }
    return store_;
}

void MemoryBroker::publish(const TaskMessage& message) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);

    if (s->messages.count(message.id) > 0) {
        throw BrokerError("Task id already queued: " + message.id);
    }

    TaskState state;
    state.task_id = message.id;
    state.name = message.name;
    state.status = TaskStatus::PENDING;
    state.created_at = message.created_at;
    s->results[message.id] = state;

    s->messages[message.id] = MemoryStore::Entry{message, "", std::nullopt};
}

std::optional<TaskMessage> MemoryBroker::reserve(const std::vector<std::string>& queues,
                                                 const std::string& worker_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    auto now = std::chrono::system_clock::now();

    MemoryStore::Entry* best = nullptr;
    for (auto& [id, entry] : s->messages) {
        const auto& msg = entry.message;
        if (entry.lease_expires_at || msg.revoked || msg.eta > now) continue;
        if (std::find(queues.begin(), queues.end(), msg.queue) == queues.end()) continue;

        if (!best ||
            msg.eta < best->message.eta ||
            (msg.eta == best->message.eta && msg.created_at < best->message.created_at)) {
            best = &entry;
        }
    }

    if (!best) {
        return std::nullopt;
    }

    best->worker_id = worker_id;
    best->lease_expires_at = now + settings_.visibility_timeout;

    auto& state = s->results[best->message.id];
    state.task_id = best->message.id;
    state.name = best->message.name;
    if (!is_terminal(state.status)) {
        state.status = TaskStatus::STARTED;
        state.worker_id = worker_id;
    }
    return best->message;
}

void MemoryBroker::complete(const TaskMessage& message,
                            TaskStatus status,
                            const nlohmann::json& result,
                            const std::string& worker_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);

    auto& state = s->results[message.id];
    state.task_id = message.id;
    state.name = message.name;
    state.status = status;
    state.result = result;
    state.retries = message.retries;
    state.worker_id = worker_id;
    state.date_done = std::chrono::system_clock::now();
    if (!state.created_at) state.created_at = message.created_at;

    auto it = s->messages.find(message.id);
    if (it != s->messages.end() && it->second.worker_id == worker_id) {
        s->messages.erase(it);
    } else {
        spdlog::warn("[MemoryBroker] Task {} completed by {} after its lease was lost", message.id, worker_id);
    }
}

void MemoryBroker::retry(const TaskMessage& message,
                         std::chrono::system_clock::time_point eta,
                         const nlohmann::json& error,
                         const std::string& worker_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);

    auto it = s->messages.find(message.id);
    if (it == s->messages.end() || it->second.worker_id != worker_id) {
        spdlog::warn("[MemoryBroker] Task {} retry skipped, lease no longer held by {}", message.id, worker_id);
        return;
    }

    auto& entry = it->second;
    entry.message.retries = message.retries + 1;
    entry.message.eta = eta;
    entry.worker_id.clear();
    entry.lease_expires_at.reset();

    auto& state = s->results[message.id];
    state.status = TaskStatus::RETRY;
    state.retries = entry.message.retries;
    state.worker_id = worker_id;
    state.result.reset();
    spdlog::debug("[MemoryBroker] Task {} scheduled for retry {}: {}", message.id, entry.message.retries, error.dump());
}

int MemoryBroker::extend_leases(const std::string& worker_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    auto expires = std::chrono::system_clock::now() + settings_.visibility_timeout;

    int renewed = 0;
    for (auto& [id, entry] : s->messages) {
        if (entry.lease_expires_at && entry.worker_id == worker_id) {
            entry.lease_expires_at = expires;
            ++renewed;
        }
    }
    return renewed;
}

int MemoryBroker::reclaim_expired_leases() {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    auto now = std::chrono::system_clock::now();

    int requeued = 0;
    for (auto it = s->messages.begin(); it != s->messages.end();) {
        auto& entry = it->second;
        if (!entry.lease_expires_at || *entry.lease_expires_at > now) {
            ++it;
            continue;
        }

        auto& state = s->results[it->first];
        if (entry.message.revoked) {
            state.status = TaskStatus::REVOKED;
            state.result = make_error_result("TaskRevokedError", "revoked before redelivery");
            state.date_done = now;
            it = s->messages.erase(it);
            continue;
        }

        spdlog::warn("[MemoryBroker] Lease of task {} held by {} expired, requeueing", it->first, entry.worker_id);
        entry.worker_id.clear();
        entry.lease_expires_at.reset();
        entry.message.redeliveries++;
        if (state.status == TaskStatus::STARTED) {
            state.status = TaskStatus::PENDING;
        }
        ++requeued;
        ++it;
    }

    // Control messages and silent workers are kept for a bounded window
    auto cutoff = now - settings_.heartbeat_interval * RETENTION_HEARTBEATS;
    s->control.erase(std::remove_if(s->control.begin(), s->control.end(),
                                    [cutoff](const ControlMessage& msg) { return msg.created_at < cutoff; }),
                     s->control.end());
    for (auto worker = s->workers.begin(); worker != s->workers.end();) {
        if (worker->second.last_heartbeat < cutoff) {
            spdlog::debug("[MemoryBroker] Dropping worker {} (no heartbeat)", worker->first);
            worker = s->workers.erase(worker);
        } else {
            ++worker;
        }
    }
    return requeued;
}

bool MemoryBroker::revoke(const std::string& task_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);

    auto it = s->messages.find(task_id);
    if (it == s->messages.end()) {
        return false;
    }

    if (it->second.lease_expires_at) {
        it->second.message.revoked = true;
        return true;
    }

    auto& state = s->results[task_id];
    state.status = TaskStatus::REVOKED;
    state.result = make_error_result("TaskRevokedError", "revoked");
    state.date_done = std::chrono::system_clock::now();
    s->messages.erase(it);
    return true;
}

bool MemoryBroker::is_revoked(const std::string& task_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    auto it = s->messages.find(task_id);
    return it != s->messages.end() && it->second.message.revoked;
}

std::optional<TaskState> MemoryBroker::get_state(const std::string& task_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    auto it = s->results.find(task_id);
    if (it == s->results.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryBroker::send_control(const std::string& command, const std::string& destination) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);

    ControlMessage msg;
    msg.sequence = ++s->control_sequence;
    msg.command = command;
    msg.destination = destination;
    msg.created_at = std::chrono::system_clock::now();
    s->control.push_back(msg);
}

std::vector<ControlMessage> MemoryBroker::poll_control(const std::string& worker_id, int64_t after_sequence) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);

    std::vector<ControlMessage> result;
    for (const auto& msg : s->control) {
        if (msg.sequence <= after_sequence) continue;
        if (msg.destination.empty() || msg.destination == worker_id) {
            result.push_back(msg);
        }
    }
    return result;
}

int64_t MemoryBroker::latest_control_sequence() {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    return s->control_sequence;
}

void MemoryBroker::heartbeat(const std::string& worker_id, const nlohmann::json& stats) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);

    auto& info = s->workers[worker_id];
    info.worker_id = worker_id;
    info.last_heartbeat = std::chrono::system_clock::now();
    info.stats = stats;
}

void MemoryBroker::unregister_worker(const std::string& worker_id) {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    s->workers.erase(worker_id);
}

std::vector<WorkerInfo> MemoryBroker::live_workers() {
    auto s = store();
    std::lock_guard<std::mutex> lock(s->mutex);
    auto cutoff = std::chrono::system_clock::now() - settings_.liveness_threshold();

    std::vector<WorkerInfo> result;
    for (const auto& [id, info] : s->workers) {
        if (info.last_heartbeat >= cutoff) {
            result.push_back(info);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const WorkerInfo& a, const WorkerInfo& b) { return a.worker_id < b.worker_id; });
    return result;
}

size_t MemoryBroker::message_count(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(store_->mutex);
    return std::count_if(store_->messages.begin(), store_->messages.end(),
                         [&queue](const auto& item) { return item.second.message.queue == queue; });
}

size_t MemoryBroker::control_backlog() const {
    std::lock_guard<std::mutex> lock(store_->mutex);
    return store_->control.size();
}

size_t MemoryBroker::registered_workers() const {
    std::lock_guard<std::mutex> lock(store_->mutex);
    return store_->workers.size();
}

} // namespace taskproc
