#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace taskproc {

enum class ConsumerState {
    STOPPED,
    RUNNING,
    STOPPING
};

std::string to_string(ConsumerState state);

/**
 * ConsumerSupervisor - owns the one background consumer thread of an adapter
 *
 * States:
 *   STOPPED  --start-->   RUNNING
 *   RUNNING  --stop-->    STOPPING --(exit | timeout)--> STOPPED
 *   RUNNING  --release--> STOPPED
 *
 * The thread body must keep everything it touches alive by itself (capture
 * shared_ptrs): on a stop timeout the thread is detached and outlives the
 * supervisor. A body that returned on its own no longer counts as running;
 * the next start() reaps it.
 *
 * Calls from several caller threads at once are not arbitrated.
 */
class ConsumerSupervisor {
public:
    using SignalFn = std::function<void(const std::string& worker_identity)>;

    ConsumerSupervisor() = default;
    ~ConsumerSupervisor();

    ConsumerSupervisor(const ConsumerSupervisor&) = delete;
    ConsumerSupervisor& operator=(const ConsumerSupervisor&) = delete;

    /**
     * Spawn the consumer thread
     * @return false when a consumer is already running (nothing spawned)
     */
    bool start(const std::string& worker_identity, std::function<void()> body);

    /**
     * Signal the consumer and wait for it, never longer than timeout
     * @param signal Delivers the stop request to worker_identity; runs on a
     *        detached thread, so it must own what it captures
     * @return true when the thread exited within timeout; the handle is
     *         released either way
     */
    bool stop(std::chrono::milliseconds timeout, const SignalFn& signal);

    // Drop the handle without waiting
    void release();

    ConsumerState state() const { return state_.load(); }
    bool is_running() const;
    std::string worker_identity() const;

private:
    bool exited() const;
    void reset_handle(bool wait);

    mutable std::mutex mutex_;
    std::atomic<ConsumerState> state_{ConsumerState::STOPPED};
    std::string worker_identity_;
    std::thread thread_;
    std::shared_future<void> done_;
};

} // namespace taskproc
