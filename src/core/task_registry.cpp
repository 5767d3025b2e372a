#include "taskproc/task_registry.hpp"
#include "taskproc/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <cxxabi.h>
#include <mutex>

namespace taskproc {

TaskRegistry::TaskRegistry(RetryPolicy retry_policy)
    : retry_policy_(retry_policy) {
}

std::string TaskRegistry::register_handler(TaskHandler handler, const std::string& name) {
    if (!handler) {
        throw TaskProcessorError("Cannot register an empty task handler");
    }

    std::string task_name = name.empty() ? derive_name(handler) : name;

    std::unique_lock lock(mutex_);
    auto it = handlers_.find(task_name);
    if (it != handlers_.end()) {
        spdlog::warn("[Registry] Replacing handler for task '{}'", task_name);
    }
    handlers_.insert_or_assign(task_name, RegisteredTask{task_name, std::move(handler), retry_policy_});

    spdlog::info("[Registry] Registered task '{}' (max_retries={}, backoff_max={}ms)",
                 task_name, retry_policy_.max_retries(), retry_policy_.max_delay().count());
    return task_name;
}

std::optional<RegisteredTask> TaskRegistry::find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TaskRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return handlers_.count(name) > 0;
}

std::vector<std::string> TaskRegistry::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& [name, _] : handlers_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t TaskRegistry::size() const {
    std::shared_lock lock(mutex_);
    return handlers_.size();
}

std::shared_ptr<const TaskRegistry::HandlerMap> TaskRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return std::make_shared<const HandlerMap>(handlers_);
}

std::string TaskRegistry::derive_name(const TaskHandler& handler) {
    const char* mangled = handler.target_type().name();

    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    std::string name = (status == 0 && demangled) ? std::string(demangled) : std::string(mangled);
    std::free(demangled);
    return name;
}

} // namespace taskproc
