#include "taskproc/task_types.hpp"
#include "taskproc/errors.hpp"

namespace taskproc {

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::STARTED: return "STARTED";
        case TaskStatus::RETRY:   return "RETRY";
        case TaskStatus::SUCCESS: return "SUCCESS";
        case TaskStatus::FAILURE: return "FAILURE";
        case TaskStatus::REVOKED: return "REVOKED";
    }
    return "PENDING";
}

TaskStatus status_from_string(const std::string& value) {
    if (value == "PENDING") return TaskStatus::PENDING;
    if (value == "STARTED") return TaskStatus::STARTED;
    if (value == "RETRY")   return TaskStatus::RETRY;
    if (value == "SUCCESS") return TaskStatus::SUCCESS;
    if (value == "FAILURE") return TaskStatus::FAILURE;
    if (value == "REVOKED") return TaskStatus::REVOKED;
    throw TaskProcessorError("Unknown task status: " + value);
}

nlohmann::json TaskResult::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"status", to_string(status)},
        {"created_at", nullptr},
        {"result", nullptr}
    };
    if (created_at) {
        j["created_at"] = to_epoch_seconds(*created_at);
    }
    if (result) {
        j["result"] = *result;
    }
    return j;
}

} // namespace taskproc
