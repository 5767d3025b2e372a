#include "taskproc/consumer_supervisor.hpp"
#include "taskproc/errors.hpp"
#include <spdlog/spdlog.h>

namespace taskproc {

std::string to_string(ConsumerState state) {
    switch (state) {
        case ConsumerState::STOPPED: return "STOPPED";
        case ConsumerState::RUNNING: return "RUNNING";
        case ConsumerState::STOPPING: return "STOPPING";
    }
    return "UNKNOWN";
}

ConsumerSupervisor::~ConsumerSupervisor() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        spdlog::warn("[Consumer] Supervisor destroyed with consumer {} still attached, detaching",
                     worker_identity_);
        thread_.detach();
    }
}

bool ConsumerSupervisor::exited() const {
    return done_.valid() &&
           done_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool ConsumerSupervisor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConsumerState::RUNNING && !exited();
}

std::string ConsumerSupervisor::worker_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_identity_;
}

void ConsumerSupervisor::reset_handle(bool wait) {
    if (thread_.joinable()) {
        if (wait || exited()) {
            thread_.join();
        } else {
            thread_.detach();
        }
    }
    thread_ = std::thread();
    done_ = std::shared_future<void>();
    worker_identity_.clear();
    state_ = ConsumerState::STOPPED;
}

bool ConsumerSupervisor::start(const std::string& worker_identity, std::function<void()> body) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == ConsumerState::RUNNING) {
        if (!exited()) {
            spdlog::info("[Consumer] Consumer {} already running", worker_identity_);
            return false;
        }
        spdlog::info("[Consumer] Consumer {} exited on its own, reaping it", worker_identity_);
        reset_handle(true);
    }

    if (worker_identity.empty()) {
        throw TaskProcessorError("Consumer needs a worker identity");
    }

    auto exited_promise = std::make_shared<std::promise<void>>();
    done_ = exited_promise->get_future().share();
    worker_identity_ = worker_identity;

    thread_ = std::thread([body = std::move(body), exited_promise, worker_identity]() {
        try {
            body();
        } catch (const std::exception& e) {
            spdlog::error("[Consumer] Consumer {} terminated: {}", worker_identity, e.what());
        }
        exited_promise->set_value();
    });

    state_ = ConsumerState::RUNNING;
    spdlog::info("[Consumer] Started consumer {}", worker_identity_);
    return true;
}

bool ConsumerSupervisor::stop(std::chrono::milliseconds timeout, const SignalFn& signal) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == ConsumerState::STOPPED) {
        spdlog::debug("[Consumer] No consumer to stop");
        return true;
    }

    if (exited()) {
        spdlog::info("[Consumer] Consumer {} had already exited", worker_identity_);
        reset_handle(true);
        return true;
    }

    state_ = ConsumerState::STOPPING;
    spdlog::info("[Consumer] Stopping consumer {} (timeout {}ms)", worker_identity_, timeout.count());

    // The signal may block on the broker; it must not eat into the wait
    std::thread([signal, identity = worker_identity_]() {
        try {
            signal(identity);
        } catch (const std::exception& e) {
            spdlog::error("[Consumer] Failed to signal consumer {}: {}", identity, e.what());
        }
    }).detach();

    bool in_time = done_.wait_until(deadline) == std::future_status::ready;
    if (in_time) {
        spdlog::info("[Consumer] Consumer {} stopped", worker_identity_);
    } else {
        spdlog::warn("[Consumer] ShutdownTimeoutWarning: consumer {} did not stop within {}ms, detaching",
                     worker_identity_, timeout.count());
    }

    reset_handle(in_time);
    return in_time;
}

void ConsumerSupervisor::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConsumerState::STOPPED) {
        return;
    }
    spdlog::info("[Consumer] Releasing consumer {}", worker_identity_);
    reset_handle(false);
}

} // namespace taskproc
