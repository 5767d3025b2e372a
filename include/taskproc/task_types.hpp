#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace taskproc {

enum class TaskStatus {
    PENDING,
    STARTED,
    RETRY,
    SUCCESS,
    FAILURE,
    REVOKED
};

std::string to_string(TaskStatus status);
TaskStatus status_from_string(const std::string& value);

// SUCCESS, FAILURE and REVOKED never change again
inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::SUCCESS ||
           status == TaskStatus::FAILURE ||
           status == TaskStatus::REVOKED;
}

/**
 * Observable state of one submitted task.
 *
 * Fetched from the result store on every status call, never cached.
 * result is only set once status is terminal.
 */
struct TaskResult {
    std::string id;
    TaskStatus status = TaskStatus::PENDING;
    std::optional<std::chrono::system_clock::time_point> created_at;
    std::optional<nlohmann::json> result;

    nlohmann::json to_json() const;
};

// args is a JSON array, kwargs a JSON object; the return value is stored as the task result
using TaskHandler = std::function<nlohmann::json(const nlohmann::json& args, const nlohmann::json& kwargs)>;

/**
 * A task as carried by the broker.
 */
struct TaskMessage {
    std::string id;
    std::string name;
    std::string queue;
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json kwargs = nlohmann::json::object();
    nlohmann::json options = nlohmann::json::object();
    int retries = 0;                 // retries already performed
    int redeliveries = 0;            // times the lease expired and the message was requeued
    bool revoked = false;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point eta;
};

// Result-store record, one per task id
struct TaskState {
    std::string task_id;
    std::string name;
    TaskStatus status = TaskStatus::PENDING;
    std::optional<nlohmann::json> result;
    int retries = 0;
    std::string worker_id;
    std::optional<std::chrono::system_clock::time_point> created_at;
    std::optional<std::chrono::system_clock::time_point> date_done;
};

// Control message addressed to one worker, or to all workers when destination is empty
struct ControlMessage {
    int64_t sequence = 0;
    std::string command;           // "shutdown"
    std::string destination;
    std::chrono::system_clock::time_point created_at;
};

struct WorkerInfo {
    std::string worker_id;
    std::chrono::system_clock::time_point last_heartbeat;
    nlohmann::json stats = nlohmann::json::object();
};

// Result payload stored for FAILURE and REVOKED tasks
inline nlohmann::json make_error_result(const std::string& exc_type, const std::string& exc_message) {
    return {{"exc_type", exc_type}, {"exc_message", exc_message}};
}

// Epoch helpers shared by the brokers
inline double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point from_epoch_seconds(double seconds) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(seconds)));
}

} // namespace taskproc
